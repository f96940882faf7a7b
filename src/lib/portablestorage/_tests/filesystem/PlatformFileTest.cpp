
#include <cerrno>
#include <sstream>

#include "catch2/catch_test_macros.hpp"
#include "catch2/trompeloeil.hpp"

#include "testObjects.hpp"
#include "portablestorage/filesystem/adapters/PlatformFile.hpp"

namespace PortableStorage {
namespace Filesystem {
namespace Adapters {

using trompeloeil::_;
using Platform::FailedFuture;
using Platform::FileAt;
using Platform::FolderAt;
using Platform::ReadyFuture;

/*****************************************************/
TEST_CASE("AccessMode", "[PlatformFile]")
{
    REQUIRE(PlatformFile::GetPlatformAccessMode(FileAccess::Read) == Platform::FileAccessMode::Read);
    REQUIRE(PlatformFile::GetPlatformAccessMode(FileAccess::ReadAndWrite) == Platform::FileAccessMode::ReadWrite);
    REQUIRE(PlatformFile::GetPlatformAccessMode(FileAccess::Overwrite) == Platform::FileAccessMode::Truncate);

    REQUIRE_THROWS_AS(PlatformFile::GetPlatformAccessMode(static_cast<FileAccess>(9)), InvalidArgumentException);
}

/*****************************************************/
TEST_CASE("NameCollisionOption", "[PlatformFile]")
{
    REQUIRE(PlatformFile::GetPlatformCollisionOption(NameCollisionOption::GenerateUniqueName) 
        == Platform::NameCollisionOption::GenerateUniqueName);
    REQUIRE(PlatformFile::GetPlatformCollisionOption(NameCollisionOption::ReplaceExisting) 
        == Platform::NameCollisionOption::ReplaceExisting);
    REQUIRE(PlatformFile::GetPlatformCollisionOption(NameCollisionOption::FailIfExists) 
        == Platform::NameCollisionOption::FailIfExists);

    REQUIRE_THROWS_AS(PlatformFile::GetPlatformCollisionOption(static_cast<NameCollisionOption>(9)), InvalidArgumentException);
}

/*****************************************************/
TEST_CASE("StaleFile", "[PlatformFile]")
{
    Platform::MockStorageProvider provider;
    Platform::MockStorageFile mfile;

    ALLOW_CALL(mfile, GetPath()).RETURN("/data/app/gone.txt");
    ALLOW_CALL(mfile, GetName()).RETURN("gone.txt");
    ALLOW_CALL(provider, GetFileFromPathAsync("/data/app/gone.txt"))
        .RETURN(FailedFuture<std::unique_ptr<Platform::StorageFile>>(Platform::NotFoundException(_1)));

    PlatformFile file(provider, std::make_unique<Platform::ProxyStorageFile>(mfile));

    REQUIRE_THROWS_AS(file.OpenAsync(FileAccess::Read).get(), FileNotFoundException);
    REQUIRE_THROWS_AS(file.DeleteAsync().get(), FileNotFoundException);
    REQUIRE_THROWS_AS(file.RenameAsync("new.txt", NameCollisionOption::FailIfExists).get(), FileNotFoundException);
    REQUIRE_THROWS_AS(file.MoveAsync("/data/new.txt", NameCollisionOption::FailIfExists).get(), FileNotFoundException);
}

/*****************************************************/
TEST_CASE("Open", "[PlatformFile]")
{
    Platform::MockStorageProvider provider;
    Platform::MockStorageFile mfile;

    ALLOW_CALL(mfile, GetPath()).RETURN("/data/app/a.txt");
    ALLOW_CALL(mfile, GetName()).RETURN("a.txt");
    ALLOW_CALL(provider, GetFileFromPathAsync("/data/app/a.txt")).RETURN(FileAt(_1));

    PlatformFile file(provider, std::make_unique<Platform::ProxyStorageFile>(mfile));

    REQUIRE_CALL(mfile, OpenAsync(Platform::FileAccessMode::Truncate))
        .RETURN(ReadyFuture<std::unique_ptr<std::iostream>>(std::make_unique<std::stringstream>("data")));

    const std::unique_ptr<std::iostream> stream { file.OpenAsync(FileAccess::Overwrite).get() };
    std::string str; *stream >> str; REQUIRE(str == "data");
}

/*****************************************************/
TEST_CASE("Delete", "[PlatformFile]")
{
    Platform::MockStorageProvider provider;
    Platform::MockStorageFile mfile;

    ALLOW_CALL(mfile, GetPath()).RETURN("/data/app/a.txt");
    ALLOW_CALL(mfile, GetName()).RETURN("a.txt");

    PlatformFile file(provider, std::make_unique<Platform::ProxyStorageFile>(mfile));

    trompeloeil::sequence seq;
    REQUIRE_CALL(provider, GetFileFromPathAsync("/data/app/a.txt"))
        .IN_SEQUENCE(seq).RETURN(FileAt(_1));
    REQUIRE_CALL(mfile, DeleteAsync())
        .IN_SEQUENCE(seq).RETURN(ReadyFuture());

    file.DeleteAsync().get();
}

/*****************************************************/
TEST_CASE("Rename", "[PlatformFile]")
{
    Platform::MockStorageProvider provider;
    Platform::MockStorageFile mfile;

    ALLOW_CALL(mfile, GetPath()).RETURN("/data/app/a.txt");
    ALLOW_CALL(mfile, GetName()).RETURN("a.txt");
    ALLOW_CALL(provider, GetFileFromPathAsync("/data/app/a.txt")).RETURN(FileAt(_1));

    PlatformFile file(provider, std::make_unique<Platform::ProxyStorageFile>(mfile));

    {
        REQUIRE_CALL(mfile, RenameAsync("b.txt", Platform::NameCollisionOption::ReplaceExisting)).RETURN(ReadyFuture());
        file.RenameAsync("b.txt", NameCollisionOption::ReplaceExisting).get();
    }

    {
        REQUIRE_CALL(mfile, RenameAsync("b.txt", Platform::NameCollisionOption::FailIfExists))
            .RETURN(FailedFuture<void>(Platform::PlatformException(EEXIST, "exists")));
        REQUIRE_THROWS_AS(file.RenameAsync("b.txt", NameCollisionOption::FailIfExists).get(), AlreadyExistsException);
    }

    {
        REQUIRE_CALL(mfile, RenameAsync("b/c", Platform::NameCollisionOption::FailIfExists))
            .RETURN(FailedFuture<void>(Platform::PlatformException(EINVAL, "invalid")));
        REQUIRE_THROWS_AS(file.RenameAsync("b/c", NameCollisionOption::FailIfExists).get(), Platform::PlatformException);
    }

    // fails before any platform call
    REQUIRE_THROWS_AS(file.RenameAsync("b.txt", static_cast<NameCollisionOption>(9)).get(), InvalidArgumentException);
}

/*****************************************************/
TEST_CASE("Move", "[PlatformFile]")
{
    Platform::MockStorageProvider provider;
    Platform::MockStorageFile mfile;

    ALLOW_CALL(mfile, GetPath()).RETURN("/data/app/a.txt");
    ALLOW_CALL(mfile, GetName()).RETURN("a.txt");
    ALLOW_CALL(provider, GetFileFromPathAsync("/data/app/a.txt")).RETURN(FileAt(_1));

    PlatformFile file(provider, std::make_unique<Platform::ProxyStorageFile>(mfile));

    {
        REQUIRE_CALL(provider, GetFolderFromPathAsync("/data/other")).RETURN(FolderAt(_1));
        REQUIRE_CALL(mfile, MoveAsync(_, "b.txt", Platform::NameCollisionOption::GenerateUniqueName))
            .WITH(_1.GetPath() == "/data/other").RETURN(ReadyFuture());
        file.MoveAsync("/data/other/b.txt", NameCollisionOption::GenerateUniqueName).get();
    }

    {
        REQUIRE_CALL(provider, GetFolderFromPathAsync("/data/missing"))
            .RETURN(FailedFuture<std::unique_ptr<Platform::StorageFolder>>(Platform::NotFoundException(_1)));
        REQUIRE_THROWS_AS(file.MoveAsync("/data/missing/b.txt", NameCollisionOption::FailIfExists).get(), DirectoryNotFoundException);
    }

    {
        REQUIRE_CALL(provider, GetFolderFromPathAsync("/data/other")).RETURN(FolderAt(_1));
        REQUIRE_CALL(mfile, MoveAsync(_, "b.txt", Platform::NameCollisionOption::FailIfExists))
            .RETURN(FailedFuture<void>(Platform::PlatformException(EEXIST, "exists")));
        REQUIRE_THROWS_AS(file.MoveAsync("/data/other/b.txt", NameCollisionOption::FailIfExists).get(), AlreadyExistsException);
    }

    REQUIRE_THROWS_AS(file.MoveAsync("/data/other/b.txt", static_cast<NameCollisionOption>(9)).get(), InvalidArgumentException);

    // no folder lookup or move for a destination that is not absolute
    REQUIRE_THROWS_AS(file.MoveAsync("b.txt", NameCollisionOption::FailIfExists).get(), InvalidArgumentException);
    REQUIRE_THROWS_AS(file.MoveAsync("other/b.txt", NameCollisionOption::FailIfExists).get(), InvalidArgumentException);
    REQUIRE_THROWS_AS(file.MoveAsync("", NameCollisionOption::FailIfExists).get(), InvalidArgumentException);
}

} // namespace Adapters
} // namespace Filesystem
} // namespace PortableStorage
