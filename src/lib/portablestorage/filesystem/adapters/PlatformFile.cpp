
#include "PlatformFile.hpp"
#include "PlatformFolder.hpp"
#include "portablestorage/StringUtil.hpp"
#include "portablestorage/platform/PlatformException.hpp"
#include "portablestorage/platform/StorageFile.hpp"
#include "portablestorage/platform/StorageFolder.hpp"
#include "portablestorage/platform/StorageProvider.hpp"

namespace PortableStorage {
namespace Filesystem {
namespace Adapters {

/*****************************************************/
PlatformFile::PlatformFile(Platform::StorageProvider& provider, std::unique_ptr<Platform::StorageFile> file) :
    mProvider(provider), mFile(std::move(file)), mDebug(__func__,this)
{
    MDBG_INFO("(path:" << mFile->GetPath() << ")");
}

/*****************************************************/
PlatformFile::~PlatformFile() = default;

/*****************************************************/
std::string PlatformFile::GetName() const
{
    return mFile->GetName();
}

/*****************************************************/
std::string PlatformFile::GetPath() const
{
    return mFile->GetPath();
}

/*****************************************************/
std::future<std::unique_ptr<std::iostream>> PlatformFile::OpenAsync(FileAccess access)
{
    return std::async(std::launch::deferred, [this, access]()->std::unique_ptr<std::iostream>
    {
        MDBG_INFO("(path:" << mFile->GetPath() << ")");

        const Platform::FileAccessMode mode { GetPlatformAccessMode(access) };
        EnsureExists();

        try { return mFile->OpenAsync(mode).get(); }
        catch (const Platform::NotFoundException& ex) {
            throw FileNotFoundException(ex.what()); }
    });
}

/*****************************************************/
std::future<void> PlatformFile::DeleteAsync()
{
    return std::async(std::launch::deferred, [this]()
    {
        MDBG_INFO("(path:" << mFile->GetPath() << ")");

        EnsureExists();

        try { mFile->DeleteAsync().get(); }
        catch (const Platform::NotFoundException& ex) {
            throw FileNotFoundException(ex.what()); }
    });
}

/*****************************************************/
std::future<void> PlatformFile::RenameAsync(const std::string& newName, NameCollisionOption option)
{
    return std::async(std::launch::deferred, [this, newName, option]()
    {
        MDBG_INFO("(path:" << mFile->GetPath() << " newName:" << newName << ")");

        const Platform::NameCollisionOption platOption { GetPlatformCollisionOption(option) };
        EnsureExists();

        try { mFile->RenameAsync(newName, platOption).get(); }
        catch (const Platform::NotFoundException& ex) {
            throw FileNotFoundException(ex.what()); }
        catch (const Platform::PlatformException& ex)
        {
            if (PlatformFolder::IsAlreadyExists(ex))
                throw AlreadyExistsException(ex.what());
            throw;
        }
    });
}

/*****************************************************/
std::future<void> PlatformFile::MoveAsync(const std::string& newPath, NameCollisionOption option)
{
    return std::async(std::launch::deferred, [this, newPath, option]()
    {
        MDBG_INFO("(path:" << mFile->GetPath() << " newPath:" << newPath << ")");

        const Platform::NameCollisionOption platOption { GetPlatformCollisionOption(option) };

        const StringUtil::StringPair dirName { StringUtil::splitPath(newPath) };
        if (newPath.empty() || newPath.front() != '/' || newPath.back() == '/' || dirName.second.empty())
            throw InvalidArgumentException("Move destination must be an absolute file path: "+newPath);
        const std::string folderPath { dirName.first.empty() ? "/" : dirName.first };

        EnsureExists();

        std::unique_ptr<Platform::StorageFolder> folder; try
        {
            folder = mProvider.GetFolderFromPathAsync(folderPath).get();
        }
        catch (const Platform::NotFoundException& ex) {
            throw DirectoryNotFoundException(ex.what()); }

        try { mFile->MoveAsync(*folder, dirName.second, platOption).get(); }
        catch (const Platform::NotFoundException& ex) {
            throw FileNotFoundException(ex.what()); }
        catch (const Platform::PlatformException& ex)
        {
            if (PlatformFolder::IsAlreadyExists(ex))
                throw AlreadyExistsException(ex.what());
            throw;
        }
    });
}

/*****************************************************/
Platform::FileAccessMode PlatformFile::GetPlatformAccessMode(FileAccess access)
{
    switch (access)
    {
        case FileAccess::Read: return Platform::FileAccessMode::Read;
        case FileAccess::ReadAndWrite: return Platform::FileAccessMode::ReadWrite;
        case FileAccess::Overwrite: return Platform::FileAccessMode::Truncate;
        default: throw InvalidArgumentException(
            "Unrecognized FileAccess value: "+std::to_string(static_cast<int>(access)));
    }
}

/*****************************************************/
Platform::NameCollisionOption PlatformFile::GetPlatformCollisionOption(NameCollisionOption option)
{
    switch (option)
    {
        case NameCollisionOption::GenerateUniqueName:
            return Platform::NameCollisionOption::GenerateUniqueName;
        case NameCollisionOption::ReplaceExisting:
            return Platform::NameCollisionOption::ReplaceExisting;
        case NameCollisionOption::FailIfExists:
            return Platform::NameCollisionOption::FailIfExists;
        default: throw InvalidArgumentException(
            "Unrecognized NameCollisionOption value: "+std::to_string(static_cast<int>(option)));
    }
}

/*****************************************************/
void PlatformFile::EnsureExists() const
{
    try
    {
        mProvider.GetFileFromPathAsync(mFile->GetPath()).get();
    }
    catch (const Platform::NotFoundException& ex)
    {
        MDBG_INFO("... file gone: " << ex.what());
        throw FileNotFoundException(ex.what());
    }
}

} // namespace Adapters
} // namespace Filesystem
} // namespace PortableStorage
