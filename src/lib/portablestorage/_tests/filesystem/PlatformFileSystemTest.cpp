#include "catch2/catch_test_macros.hpp"
#include "catch2/trompeloeil.hpp"

#include "testObjects.hpp"
#include "portablestorage/BaseOptions.hpp"
#include "portablestorage/filesystem/StorageOptions.hpp"
#include "portablestorage/filesystem/adapters/PlatformFileSystem.hpp"
#include "portablestorage/filesystem/adapters/PlatformFolder.hpp"

namespace PortableStorage {
namespace Filesystem {
namespace Adapters {

using trompeloeil::_;
using Platform::FailedFuture;
using Platform::FileAt;
using Platform::FolderAt;

namespace {
StorageOptions GetOptions()
{
    StorageOptions options;
    options.localRoot = "/data/app/";
    options.roamingRoot = "/config/app";
    return options;
}
} // namespace

/*****************************************************/
TEST_CASE("CreateRoots", "[PlatformFileSystem]")
{
    Platform::MockStorageProvider provider;

    // the platform's normalized form of each path is what gets protected
    REQUIRE_CALL(provider, CreateFolderPathAsync("/data/app/")).RETURN(FolderAt("/data/app"));
    REQUIRE_CALL(provider, CreateFolderPathAsync("/config/app")).RETURN(FolderAt("/config/app"));

    const PlatformFileSystem filesystem(provider, GetOptions());
    REQUIRE(filesystem.GetRootPaths() == PlatformFolder::RootPaths{"/data/app","/config/app"});
}

/*****************************************************/
TEST_CASE("CreateRootsFailed", "[PlatformFileSystem]")
{
    Platform::MockStorageProvider provider;

    REQUIRE_CALL(provider, CreateFolderPathAsync("/data/app/"))
        .RETURN(FailedFuture<std::unique_ptr<Platform::StorageFolder>>(Platform::PlatformException(EACCES, "denied")));

    REQUIRE_THROWS_AS(PlatformFileSystem(provider, GetOptions()), Platform::PlatformException);
}

/*****************************************************/
TEST_CASE("StorageRoots", "[PlatformFileSystem]")
{
    Platform::MockStorageProvider provider;

    ALLOW_CALL(provider, CreateFolderPathAsync("/data/app/")).RETURN(FolderAt("/data/app"));
    ALLOW_CALL(provider, CreateFolderPathAsync("/data/app")).RETURN(FolderAt("/data/app"));
    ALLOW_CALL(provider, CreateFolderPathAsync("/config/app")).RETURN(FolderAt("/config/app"));

    PlatformFileSystem filesystem(provider, GetOptions());

    const std::unique_ptr<IFolder> local { filesystem.LocalStorage() };
    REQUIRE(local->GetPath() == "/data/app");
    REQUIRE(dynamic_cast<PlatformFolder&>(*local).isRoot());
    REQUIRE_THROWS_AS(local->DeleteAsync().get(), RootDeletionException);

    const std::unique_ptr<IFolder> roaming { filesystem.RoamingStorage() };
    REQUIRE(roaming->GetPath() == "/config/app");
    REQUIRE(dynamic_cast<PlatformFolder&>(*roaming).isRoot());
}

/*****************************************************/
TEST_CASE("GetFromPath", "[PlatformFileSystem]")
{
    Platform::MockStorageProvider provider;

    ALLOW_CALL(provider, CreateFolderPathAsync(_)).RETURN(FolderAt(_1));

    PlatformFileSystem filesystem(provider, GetOptions());

    {
        REQUIRE_CALL(provider, GetFolderFromPathAsync("/config/app")).RETURN(FolderAt(_1));
        const std::unique_ptr<IFolder> folder { filesystem.GetFolderFromPathAsync("/config/app").get() };
        REQUIRE(folder != nullptr);
        REQUIRE(dynamic_cast<PlatformFolder&>(*folder).isRoot());
    }

    {
        REQUIRE_CALL(provider, GetFileFromPathAsync("/config/app/a.txt")).RETURN(FileAt(_1));
        const std::unique_ptr<IFile> file { filesystem.GetFileFromPathAsync("/config/app/a.txt").get() };
        REQUIRE(file != nullptr);
        REQUIRE(file->GetName() == "a.txt");
    }

    {
        REQUIRE_CALL(provider, GetFolderFromPathAsync("/missing"))
            .RETURN(FailedFuture<std::unique_ptr<Platform::StorageFolder>>(Platform::NotFoundException(_1)));
        REQUIRE(filesystem.GetFolderFromPathAsync("/missing").get() == nullptr);
    }

    {
        REQUIRE_CALL(provider, GetFileFromPathAsync("/missing"))
            .RETURN(FailedFuture<std::unique_ptr<Platform::StorageFile>>(Platform::NotFoundException(_1)));
        REQUIRE(filesystem.GetFileFromPathAsync("/missing").get() == nullptr);
    }

    {
        // other failures are not hidden
        REQUIRE_CALL(provider, GetFileFromPathAsync("/denied"))
            .RETURN(FailedFuture<std::unique_ptr<Platform::StorageFile>>(Platform::PlatformException(EACCES, "denied")));
        REQUIRE_THROWS_AS(filesystem.GetFileFromPathAsync("/denied").get(), Platform::PlatformException);
    }
}

} // namespace Adapters
} // namespace Filesystem
} // namespace PortableStorage
