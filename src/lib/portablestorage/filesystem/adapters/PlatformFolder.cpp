
#include <cerrno>
#include <string>

#include "PlatformFile.hpp"
#include "PlatformFolder.hpp"
#include "portablestorage/StringUtil.hpp"
#include "portablestorage/platform/PlatformException.hpp"
#include "portablestorage/platform/StorageFolder.hpp"
#include "portablestorage/platform/StorageProvider.hpp"

namespace PortableStorage {
namespace Filesystem {
namespace Adapters {

/** Macro to print the folder name at the beginning of debug */
#define FLDBG_INFO(strfunc) MDBG_INFO("(" << mFolder->GetName() << ")" << strfunc)

/*****************************************************/
PlatformFolder::PlatformFolder(Platform::StorageProvider& provider, 
        std::unique_ptr<Platform::StorageFolder> folder, const RootPaths& rootPaths) :
    mProvider(provider), 
    mFolder(std::move(folder)),
    mRootPaths(rootPaths),
    mIsRoot(mRootPaths.count(mFolder->GetPath()) != 0),
    mDebug(__func__,this)
{
    MDBG_INFO("(path:" << mFolder->GetPath() << " isRoot:" << BOOLSTR(mIsRoot) << ")");
}

/*****************************************************/
PlatformFolder::~PlatformFolder() = default;

/*****************************************************/
std::string PlatformFolder::GetName() const
{
    return mFolder->GetName();
}

/*****************************************************/
std::string PlatformFolder::GetPath() const
{
    return mFolder->GetPath();
}

/*****************************************************/
std::future<std::unique_ptr<IFile>> PlatformFolder::CreateFileAsync(
    const std::string& desiredName, CreationCollisionOption option)
{
    return std::async(std::launch::deferred, [this, desiredName, option]()->std::unique_ptr<IFile>
    {
        FLDBG_INFO("(name:" << desiredName << ")");

        const Platform::CreationCollisionOption platOption { GetPlatformCollisionOption(option) };
        EnsureExists();

        std::unique_ptr<Platform::StorageFile> file; try
        {
            file = mFolder->CreateFileAsync(desiredName, platOption).get();
        }
        catch (const Platform::PlatformException& ex)
        {
            if (IsAlreadyExists(ex)) {
                FLDBG_INFO("... already exists: " << desiredName);
                throw AlreadyExistsException(ex.what()); }
            throw;
        }

        return std::make_unique<PlatformFile>(mProvider, std::move(file));
    });
}

/*****************************************************/
std::future<std::unique_ptr<IFile>> PlatformFolder::GetFileAsync(const std::string& name)
{
    return std::async(std::launch::deferred, [this, name]()->std::unique_ptr<IFile>
    {
        FLDBG_INFO("(name:" << name << ")");

        EnsureExists();

        // a missing file surfaces as the platform's own NotFoundException
        std::unique_ptr<Platform::StorageFile> file { mFolder->GetFileAsync(name).get() };
        return std::make_unique<PlatformFile>(mProvider, std::move(file));
    });
}

/*****************************************************/
std::future<IFolder::FileList> PlatformFolder::GetFilesAsync()
{
    return std::async(std::launch::deferred, [this]()->FileList
    {
        FLDBG_INFO("()");

        EnsureExists();

        Platform::StorageFolder::FileList platFiles { mFolder->GetFilesAsync().get() };

        FileList files; files.reserve(platFiles.size());
        for (std::unique_ptr<Platform::StorageFile>& platFile : platFiles)
            files.emplace_back(std::make_unique<PlatformFile>(mProvider, std::move(platFile)));
        return files;
    });
}

/*****************************************************/
std::future<std::unique_ptr<IFolder>> PlatformFolder::CreateFolderAsync(
    const std::string& desiredName, CreationCollisionOption option)
{
    return std::async(std::launch::deferred, [this, desiredName, option]()->std::unique_ptr<IFolder>
    {
        FLDBG_INFO("(name:" << desiredName << ")");

        const Platform::CreationCollisionOption platOption { GetPlatformCollisionOption(option) };
        EnsureExists();

        std::unique_ptr<Platform::StorageFolder> folder; try
        {
            folder = mFolder->CreateFolderAsync(desiredName, platOption).get();
        }
        catch (const Platform::PlatformException& ex)
        {
            if (IsAlreadyExists(ex)) {
                FLDBG_INFO("... already exists: " << desiredName);
                throw AlreadyExistsException(ex.what()); }
            throw;
        }

        return WrapFolder(std::move(folder));
    });
}

/*****************************************************/
std::future<std::unique_ptr<IFolder>> PlatformFolder::GetFolderAsync(const std::string& name)
{
    return std::async(std::launch::deferred, [this, name]()->std::unique_ptr<IFolder>
    {
        FLDBG_INFO("(name:" << name << ")");

        EnsureExists();

        std::unique_ptr<Platform::StorageFolder> folder; try
        {
            folder = mFolder->GetFolderAsync(name).get();
        }
        catch (const Platform::NotFoundException& ex) {
            throw DirectoryNotFoundException(ex.what()); }

        return WrapFolder(std::move(folder));
    });
}

/*****************************************************/
std::future<IFolder::FolderList> PlatformFolder::GetFoldersAsync()
{
    return std::async(std::launch::deferred, [this]()->FolderList
    {
        FLDBG_INFO("()");

        EnsureExists();

        Platform::StorageFolder::FolderList platFolders { mFolder->GetFoldersAsync().get() };

        FolderList folders; folders.reserve(platFolders.size());
        for (std::unique_ptr<Platform::StorageFolder>& platFolder : platFolders)
            folders.emplace_back(WrapFolder(std::move(platFolder)));
        return folders;
    });
}

/*****************************************************/
std::future<ExistenceCheckResult> PlatformFolder::CheckExistsAsync(const std::string& name)
{
    return std::async(std::launch::deferred, [this, name]()->ExistenceCheckResult
    {
        FLDBG_INFO("(name:" << name << ")");

        EnsureExists();

        switch (mFolder->TryGetItemTypeAsync(name).get())
        {
            case Platform::ItemType::FILE: return ExistenceCheckResult::FileExists;
            case Platform::ItemType::FOLDER: return ExistenceCheckResult::FolderExists;
            default: return ExistenceCheckResult::NotFound;
        }
    });
}

/*****************************************************/
std::future<void> PlatformFolder::DeleteAsync()
{
    return std::async(std::launch::deferred, [this]()
    {
        FLDBG_INFO("()");

        if (mIsRoot) {
            MDBG_ERROR("... refusing to delete root: " << mFolder->GetPath());
            throw RootDeletionException(); }

        EnsureExists();

        mFolder->DeleteAsync().get();
    });
}

/*****************************************************/
Platform::CreationCollisionOption PlatformFolder::GetPlatformCollisionOption(CreationCollisionOption option)
{
    switch (option)
    {
        case CreationCollisionOption::GenerateUniqueName:
            return Platform::CreationCollisionOption::GenerateUniqueName;
        case CreationCollisionOption::ReplaceExisting:
            return Platform::CreationCollisionOption::ReplaceExisting;
        case CreationCollisionOption::FailIfExists:
            return Platform::CreationCollisionOption::FailIfExists;
        case CreationCollisionOption::OpenIfExists:
            return Platform::CreationCollisionOption::OpenIfExists;
        default: throw InvalidArgumentException(
            "Unrecognized CreationCollisionOption value: "+std::to_string(static_cast<int>(option)));
    }
}

/*****************************************************/
void PlatformFolder::EnsureExists() const
{
    try
    {
        mProvider.GetFolderFromPathAsync(mFolder->GetPath()).get();
    }
    catch (const Platform::NotFoundException& ex)
    {
        MDBG_INFO("... folder gone: " << ex.what());
        throw DirectoryNotFoundException(ex.what());
    }
}

/*****************************************************/
bool PlatformFolder::IsAlreadyExists(const Platform::PlatformException& ex)
{
    // the local platform reports collisions as EEXIST; a platform with a
    // different status vocabulary needs its own match here
    return ex.GetStatus() == EEXIST;
}

/*****************************************************/
std::unique_ptr<IFolder> PlatformFolder::WrapFolder(std::unique_ptr<Platform::StorageFolder> folder) const
{
    return std::make_unique<PlatformFolder>(mProvider, std::move(folder), mRootPaths);
}

} // namespace Adapters
} // namespace Filesystem
} // namespace PortableStorage
