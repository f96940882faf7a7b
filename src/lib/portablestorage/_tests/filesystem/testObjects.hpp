#ifndef LIBPS_TESTOBJECTS_H_
#define LIBPS_TESTOBJECTS_H_

#include <cerrno>
#include <exception>
#include <future>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "catch2/catch_test_macros.hpp"
#include "catch2/trompeloeil.hpp"

#include "portablestorage/platform/PlatformException.hpp"
#include "portablestorage/platform/StorageFile.hpp"
#include "portablestorage/platform/StorageFolder.hpp"
#include "portablestorage/platform/StorageProvider.hpp"

namespace PortableStorage {
namespace Platform {

class MockStorageFile : public StorageFile { public:
    MAKE_CONST_MOCK0(GetName, std::string(), override);
    MAKE_CONST_MOCK0(GetPath, std::string(), override);
    MAKE_MOCK1(OpenAsync, std::future<std::unique_ptr<std::iostream>>(FileAccessMode), override);
    MAKE_MOCK0(DeleteAsync, std::future<void>(), override);
    MAKE_MOCK2(RenameAsync, std::future<void>(const std::string&, NameCollisionOption), override);
    MAKE_MOCK3(MoveAsync, std::future<void>(const StorageFolder&, const std::string&, NameCollisionOption), override);
};

class MockStorageFolder : public StorageFolder { public:
    MAKE_CONST_MOCK0(GetName, std::string(), override);
    MAKE_CONST_MOCK0(GetPath, std::string(), override);
    MAKE_MOCK2(CreateFileAsync, std::future<std::unique_ptr<StorageFile>>(const std::string&, CreationCollisionOption), override);
    MAKE_MOCK1(GetFileAsync, std::future<std::unique_ptr<StorageFile>>(const std::string&), override);
    MAKE_MOCK0(GetFilesAsync, std::future<FileList>(), override);
    MAKE_MOCK2(CreateFolderAsync, std::future<std::unique_ptr<StorageFolder>>(const std::string&, CreationCollisionOption), override);
    MAKE_MOCK1(GetFolderAsync, std::future<std::unique_ptr<StorageFolder>>(const std::string&), override);
    MAKE_MOCK0(GetFoldersAsync, std::future<FolderList>(), override);
    MAKE_MOCK1(TryGetItemTypeAsync, std::future<ItemType>(const std::string&), override);
    MAKE_MOCK0(DeleteAsync, std::future<void>(), override);
};

class MockStorageProvider : public StorageProvider { public:
    MAKE_MOCK1(GetFolderFromPathAsync, std::future<std::unique_ptr<StorageFolder>>(const std::string&), override);
    MAKE_MOCK1(GetFileFromPathAsync, std::future<std::unique_ptr<StorageFile>>(const std::string&), override);
    MAKE_MOCK1(CreateFolderPathAsync, std::future<std::unique_ptr<StorageFolder>>(const std::string&), override);
};

/** 
 * Owned stand-in that forwards to a mock living in the test scope,
 * so expectations on the mock can outlive the adapter that owns this
 */
class ProxyStorageFile : public StorageFile { public:
    explicit ProxyStorageFile(StorageFile& target) : mTarget(target) { }
    std::string GetName() const override { return mTarget.GetName(); }
    std::string GetPath() const override { return mTarget.GetPath(); }
    std::future<std::unique_ptr<std::iostream>> OpenAsync(FileAccessMode mode) override { return mTarget.OpenAsync(mode); }
    std::future<void> DeleteAsync() override { return mTarget.DeleteAsync(); }
    std::future<void> RenameAsync(const std::string& desiredName, NameCollisionOption option) override { 
        return mTarget.RenameAsync(desiredName, option); }
    std::future<void> MoveAsync(const StorageFolder& destination, const std::string& desiredName, NameCollisionOption option) override { 
        return mTarget.MoveAsync(destination, desiredName, option); }
private:
    StorageFile& mTarget;
};

/** Forwards to a mock folder living in the test scope */
class ProxyStorageFolder : public StorageFolder { public:
    explicit ProxyStorageFolder(StorageFolder& target) : mTarget(target) { }
    std::string GetName() const override { return mTarget.GetName(); }
    std::string GetPath() const override { return mTarget.GetPath(); }
    std::future<std::unique_ptr<StorageFile>> CreateFileAsync(const std::string& desiredName, CreationCollisionOption option) override { 
        return mTarget.CreateFileAsync(desiredName, option); }
    std::future<std::unique_ptr<StorageFile>> GetFileAsync(const std::string& name) override { return mTarget.GetFileAsync(name); }
    std::future<FileList> GetFilesAsync() override { return mTarget.GetFilesAsync(); }
    std::future<std::unique_ptr<StorageFolder>> CreateFolderAsync(const std::string& desiredName, CreationCollisionOption option) override { 
        return mTarget.CreateFolderAsync(desiredName, option); }
    std::future<std::unique_ptr<StorageFolder>> GetFolderAsync(const std::string& name) override { return mTarget.GetFolderAsync(name); }
    std::future<FolderList> GetFoldersAsync() override { return mTarget.GetFoldersAsync(); }
    std::future<ItemType> TryGetItemTypeAsync(const std::string& name) override { return mTarget.TryGetItemTypeAsync(name); }
    std::future<void> DeleteAsync() override { return mTarget.DeleteAsync(); }
private:
    StorageFolder& mTarget;
};

/** A file handle result that only knows its name and path */
class FakeStorageFile : public StorageFile { public:
    explicit FakeStorageFile(const std::string& path) : mPath(path) { }
    std::string GetName() const override { return mPath.substr(mPath.rfind('/')+1); }
    std::string GetPath() const override { return mPath; }
    std::future<std::unique_ptr<std::iostream>> OpenAsync(FileAccessMode) override { throw PlatformException(ENOTSUP, "fake"); }
    std::future<void> DeleteAsync() override { throw PlatformException(ENOTSUP, "fake"); }
    std::future<void> RenameAsync(const std::string&, NameCollisionOption) override { 
        throw PlatformException(ENOTSUP, "fake"); }
    std::future<void> MoveAsync(const StorageFolder& destination, const std::string&, NameCollisionOption) override { 
        throw PlatformException(ENOTSUP, "fake"); }
private:
    std::string mPath;
};

/** A folder handle result that only knows its name and path */
class FakeStorageFolder : public StorageFolder { public:
    explicit FakeStorageFolder(const std::string& path) : mPath(path) { }
    std::string GetName() const override { return mPath.substr(mPath.rfind('/')+1); }
    std::string GetPath() const override { return mPath; }
    std::future<std::unique_ptr<StorageFile>> CreateFileAsync(const std::string&, CreationCollisionOption) override { 
        throw PlatformException(ENOTSUP, "fake"); }
    std::future<std::unique_ptr<StorageFile>> GetFileAsync(const std::string&) override { throw PlatformException(ENOTSUP, "fake"); }
    std::future<FileList> GetFilesAsync() override { throw PlatformException(ENOTSUP, "fake"); }
    std::future<std::unique_ptr<StorageFolder>> CreateFolderAsync(const std::string&, CreationCollisionOption) override { 
        throw PlatformException(ENOTSUP, "fake"); }
    std::future<std::unique_ptr<StorageFolder>> GetFolderAsync(const std::string&) override { throw PlatformException(ENOTSUP, "fake"); }
    std::future<FolderList> GetFoldersAsync() override { throw PlatformException(ENOTSUP, "fake"); }
    std::future<ItemType> TryGetItemTypeAsync(const std::string&) override { throw PlatformException(ENOTSUP, "fake"); }
    std::future<void> DeleteAsync() override { throw PlatformException(ENOTSUP, "fake"); }
private:
    std::string mPath;
};

/** Returns a future that is already resolved with value */
template<typename T>
std::future<T> ReadyFuture(T value)
{
    std::promise<T> promise; promise.set_value(std::move(value));
    return promise.get_future();
}

/** Returns a void future that is already resolved */
inline std::future<void> ReadyFuture()
{
    std::promise<void> promise; promise.set_value();
    return promise.get_future();
}

/** Returns a future that is already failed with ex */
template<typename T, typename E>
std::future<T> FailedFuture(const E& ex)
{
    std::promise<T> promise; promise.set_exception(std::make_exception_ptr(ex));
    return promise.get_future();
}

/** Returns a resolved lookup of a folder at path */
inline std::future<std::unique_ptr<StorageFolder>> FolderAt(const std::string& path)
{
    return ReadyFuture<std::unique_ptr<StorageFolder>>(std::make_unique<FakeStorageFolder>(path));
}

/** Returns a resolved lookup of a file at path */
inline std::future<std::unique_ptr<StorageFile>> FileAt(const std::string& path)
{
    return ReadyFuture<std::unique_ptr<StorageFile>>(std::make_unique<FakeStorageFile>(path));
}

/** Returns a resolved listing of fake files with the given paths */
inline std::future<StorageFolder::FileList> FilesAt(const std::vector<std::string>& paths)
{
    StorageFolder::FileList files;
    for (const std::string& path : paths)
        files.emplace_back(std::make_unique<FakeStorageFile>(path));
    return ReadyFuture(std::move(files));
}

/** Returns a resolved listing of fake folders with the given paths */
inline std::future<StorageFolder::FolderList> FoldersAt(const std::vector<std::string>& paths)
{
    StorageFolder::FolderList folders;
    for (const std::string& path : paths)
        folders.emplace_back(std::make_unique<FakeStorageFolder>(path));
    return ReadyFuture(std::move(folders));
}

} // namespace Platform
} // namespace PortableStorage

#endif // LIBPS_TESTOBJECTS_H_
