
#include "PlatformFile.hpp"
#include "PlatformFileSystem.hpp"
#include "PlatformFolder.hpp"
#include "portablestorage/filesystem/StorageOptions.hpp"
#include "portablestorage/platform/PlatformException.hpp"
#include "portablestorage/platform/StorageProvider.hpp"

namespace PortableStorage {
namespace Filesystem {
namespace Adapters {

/*****************************************************/
PlatformFileSystem::PlatformFileSystem(Platform::StorageProvider& provider, const StorageOptions& options) :
    mProvider(provider), mDebug(__func__,this)
{
    options.Validate();

    // store the platform's form of each path so folders can match it
    mLocalRoot = mProvider.CreateFolderPathAsync(options.GetLocalRoot()).get()->GetPath();
    mRoamingRoot = mProvider.CreateFolderPathAsync(options.GetRoamingRoot()).get()->GetPath();

    mRootPaths.insert(mLocalRoot);
    mRootPaths.insert(mRoamingRoot);

    MDBG_INFO("(local:" << mLocalRoot << " roaming:" << mRoamingRoot << ")");
}

/*****************************************************/
PlatformFileSystem::~PlatformFileSystem() = default;

/*****************************************************/
std::unique_ptr<IFolder> PlatformFileSystem::LocalStorage()
{
    MDBG_INFO("()");
    return GetRoot(mLocalRoot);
}

/*****************************************************/
std::unique_ptr<IFolder> PlatformFileSystem::RoamingStorage()
{
    MDBG_INFO("()");
    return GetRoot(mRoamingRoot);
}

/*****************************************************/
std::unique_ptr<IFolder> PlatformFileSystem::GetRoot(const std::string& path)
{
    return std::make_unique<PlatformFolder>(mProvider,
        mProvider.CreateFolderPathAsync(path).get(), mRootPaths);
}

/*****************************************************/
std::future<std::unique_ptr<IFile>> PlatformFileSystem::GetFileFromPathAsync(const std::string& path)
{
    return std::async(std::launch::deferred, [this, path]()->std::unique_ptr<IFile>
    {
        MDBG_INFO("(path:" << path << ")");

        try
        {
            return std::make_unique<PlatformFile>(mProvider, 
                mProvider.GetFileFromPathAsync(path).get());
        }
        catch (const Platform::NotFoundException& ex)
        {
            MDBG_INFO("... not found");
            return nullptr;
        }
    });
}

/*****************************************************/
std::future<std::unique_ptr<IFolder>> PlatformFileSystem::GetFolderFromPathAsync(const std::string& path)
{
    return std::async(std::launch::deferred, [this, path]()->std::unique_ptr<IFolder>
    {
        MDBG_INFO("(path:" << path << ")");

        try
        {
            return std::make_unique<PlatformFolder>(mProvider, 
                mProvider.GetFolderFromPathAsync(path).get(), mRootPaths);
        }
        catch (const Platform::NotFoundException& ex)
        {
            MDBG_INFO("... not found");
            return nullptr;
        }
    });
}

} // namespace Adapters
} // namespace Filesystem
} // namespace PortableStorage
