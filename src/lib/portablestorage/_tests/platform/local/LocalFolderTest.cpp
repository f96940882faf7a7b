
#include <cerrno>
#include <filesystem>
#include <fstream>

#include "catch2/catch_test_macros.hpp"

#include "portablestorage/TempPath.hpp"
#include "portablestorage/platform/PlatformException.hpp"
#include "portablestorage/platform/local/LocalFolder.hpp"
#include "portablestorage/platform/local/LocalProvider.hpp"

namespace fs = std::filesystem;

namespace PortableStorage {
namespace Platform {
namespace Local {

namespace {
/** Returns the platform status of the exception thrown by func */
template<typename Func>
int GetStatus(const Func& func)
{
    try { func(); } catch (const PlatformException& ex) { return ex.GetStatus(); }
    return 0;
}
} // namespace

/*****************************************************/
TEST_CASE("CreateFileOptions", "[LocalFolder]")
{
    const TempPath tmpdir("test_CreateFileOptions", true);
    LocalFolder folder(tmpdir.Get());

    REQUIRE(folder.CreateFileAsync("a.txt", CreationCollisionOption::FailIfExists).get()->GetName() == "a.txt");
    std::ofstream(tmpdir.Get()+"/a.txt") << "data";

    REQUIRE(GetStatus([&]{ folder.CreateFileAsync("a.txt", CreationCollisionOption::FailIfExists).get(); }) == EEXIST);

    REQUIRE(folder.CreateFileAsync("a.txt", CreationCollisionOption::OpenIfExists).get()->GetName() == "a.txt");
    REQUIRE(fs::file_size(tmpdir.Get()+"/a.txt") == 4);

    REQUIRE(folder.CreateFileAsync("a.txt", CreationCollisionOption::GenerateUniqueName).get()->GetName() == "a (2).txt");
    REQUIRE(folder.CreateFileAsync("a.txt", CreationCollisionOption::GenerateUniqueName).get()->GetName() == "a (3).txt");

    REQUIRE(folder.CreateFileAsync("a.txt", CreationCollisionOption::ReplaceExisting).get()->GetName() == "a.txt");
    REQUIRE(fs::file_size(tmpdir.Get()+"/a.txt") == 0);

    REQUIRE(GetStatus([&]{ folder.CreateFileAsync("", CreationCollisionOption::OpenIfExists).get(); }) == EINVAL);
    REQUIRE(GetStatus([&]{ folder.CreateFileAsync("x/y", CreationCollisionOption::OpenIfExists).get(); }) == EINVAL);
}

/*****************************************************/
TEST_CASE("CreateFolderOptions", "[LocalFolder]")
{
    const TempPath tmpdir("test_CreateFolderOptions", true);
    LocalFolder folder(tmpdir.Get());

    REQUIRE(folder.CreateFolderAsync("sub", CreationCollisionOption::FailIfExists).get()->GetName() == "sub");
    std::ofstream(tmpdir.Get()+"/sub/inner").close();

    REQUIRE(GetStatus([&]{ folder.CreateFolderAsync("sub", CreationCollisionOption::FailIfExists).get(); }) == EEXIST);
    REQUIRE(folder.CreateFolderAsync("sub", CreationCollisionOption::OpenIfExists).get()->GetName() == "sub");
    REQUIRE(fs::exists(tmpdir.Get()+"/sub/inner"));

    REQUIRE(folder.CreateFolderAsync("sub", CreationCollisionOption::GenerateUniqueName).get()->GetName() == "sub (2)");

    REQUIRE(folder.CreateFolderAsync("sub", CreationCollisionOption::ReplaceExisting).get()->GetName() == "sub");
    REQUIRE(!fs::exists(tmpdir.Get()+"/sub/inner"));

    // a file is in the way
    std::ofstream(tmpdir.Get()+"/file").close();
    REQUIRE(GetStatus([&]{ folder.CreateFolderAsync("file", CreationCollisionOption::OpenIfExists).get(); }) == EEXIST);
}

/*****************************************************/
TEST_CASE("ListAndLookup", "[LocalFolder]")
{
    const TempPath tmpdir("test_ListAndLookup", true);
    LocalFolder folder(tmpdir.Get()+"/");
    REQUIRE(folder.GetPath() == LocalFolder(tmpdir.Get()).GetPath());

    REQUIRE(folder.GetFilesAsync().get().empty());
    REQUIRE(folder.GetFoldersAsync().get().empty());

    std::ofstream(tmpdir.Get()+"/b.txt").close();
    std::ofstream(tmpdir.Get()+"/a.txt").close();
    fs::create_directory(tmpdir.Get()+"/dir");

    const StorageFolder::FileList files { folder.GetFilesAsync().get() };
    REQUIRE(files.size() == 2);
    REQUIRE(files[0]->GetName() == "a.txt");
    REQUIRE(files[1]->GetName() == "b.txt");

    const StorageFolder::FolderList folders { folder.GetFoldersAsync().get() };
    REQUIRE(folders.size() == 1);
    REQUIRE(folders[0]->GetName() == "dir");

    REQUIRE(folder.GetFileAsync("a.txt").get()->GetName() == "a.txt");
    REQUIRE_THROWS_AS(folder.GetFileAsync("dir").get(), NotFoundException);
    REQUIRE(folder.GetFolderAsync("dir").get()->GetName() == "dir");
    REQUIRE_THROWS_AS(folder.GetFolderAsync("a.txt").get(), NotFoundException);

    REQUIRE(folder.TryGetItemTypeAsync("a.txt").get() == ItemType::FILE);
    REQUIRE(folder.TryGetItemTypeAsync("dir").get() == ItemType::FOLDER);
    REQUIRE(folder.TryGetItemTypeAsync("none").get() == ItemType::NONE);
}

/*****************************************************/
TEST_CASE("DeleteFolder", "[LocalFolder]")
{
    const TempPath tmpdir("test_DeleteFolder", true);
    fs::create_directories(tmpdir.Get()+"/sub/inner");
    std::ofstream(tmpdir.Get()+"/sub/inner/file").close();

    LocalFolder folder(tmpdir.Get()+"/sub");
    folder.DeleteAsync().get();
    REQUIRE(!fs::exists(tmpdir.Get()+"/sub"));

    REQUIRE_THROWS_AS(folder.DeleteAsync().get(), NotFoundException);
    REQUIRE_THROWS_AS(folder.GetFilesAsync().get(), NotFoundException);
    REQUIRE_THROWS_AS(folder.CreateFileAsync("a", CreationCollisionOption::OpenIfExists).get(), NotFoundException);
}

/*****************************************************/
TEST_CASE("Provider", "[LocalProvider]")
{
    const TempPath tmpdir("test_Provider", true);
    std::ofstream(tmpdir.Get()+"/file").close();
    LocalProvider provider;

    REQUIRE(provider.GetFolderFromPathAsync(tmpdir.Get()).get()->GetPath() == LocalFolder(tmpdir.Get()).GetPath());
    REQUIRE(provider.GetFileFromPathAsync(tmpdir.Get()+"/file").get()->GetName() == "file");

    REQUIRE_THROWS_AS(provider.GetFolderFromPathAsync(tmpdir.Get()+"/file").get(), NotFoundException);
    REQUIRE_THROWS_AS(provider.GetFileFromPathAsync(tmpdir.Get()).get(), NotFoundException);
    REQUIRE_THROWS_AS(provider.GetFolderFromPathAsync("").get(), NotFoundException);

    REQUIRE(provider.CreateFolderPathAsync(tmpdir.Get()+"/a/b/c").get()->GetName() == "c");
    REQUIRE(fs::is_directory(tmpdir.Get()+"/a/b/c"));
    REQUIRE(provider.CreateFolderPathAsync(tmpdir.Get()+"/a/b/c").get()->GetName() == "c"); // exists

    REQUIRE_THROWS_AS(provider.CreateFolderPathAsync(tmpdir.Get()+"/file").get(), PlatformException);
}

} // namespace Local
} // namespace Platform
} // namespace PortableStorage
