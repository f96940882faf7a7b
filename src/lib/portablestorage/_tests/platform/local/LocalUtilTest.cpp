
#include <cerrno>
#include <filesystem>
#include <fstream>
#include <memory>
#include <string>

#include "catch2/catch_test_macros.hpp"

#include "portablestorage/TempPath.hpp"
#include "portablestorage/platform/PlatformException.hpp"
#include "portablestorage/platform/local/LocalUtil.hpp"

namespace fs = std::filesystem;

namespace PortableStorage {
namespace Platform {
namespace Local {

/*****************************************************/
TEST_CASE("NormalizePath", "[LocalUtil]")
{
    REQUIRE(LocalUtil::NormalizePath("/") == "/");
    REQUIRE(LocalUtil::NormalizePath("/a/b/") == "/a/b");
    REQUIRE(LocalUtil::NormalizePath("/a//b/./c/../d") == "/a/b/d");
    REQUIRE(LocalUtil::NormalizePath("a") == (fs::current_path() / "a").string());
}

/*****************************************************/
TEST_CASE("ValidateName", "[LocalUtil]")
{
    LocalUtil::ValidateName("a.txt");
    LocalUtil::ValidateName(".hidden");
    LocalUtil::ValidateName("name with spaces");

    for (const char* name : { "", ".", "..", "a/b", "/" })
    {
        int status { 0 }; try { LocalUtil::ValidateName(name); }
        catch (const PlatformException& ex) { status = ex.GetStatus(); }
        REQUIRE(status == EINVAL);
    }
}

/*****************************************************/
TEST_CASE("UniqueName", "[LocalUtil]")
{
    REQUIRE(LocalUtil::UniqueName("a.txt", 1, true) == "a.txt");
    REQUIRE(LocalUtil::UniqueName("a.txt", 2, true) == "a (2).txt");
    REQUIRE(LocalUtil::UniqueName("a.tar.gz", 3, true) == "a.tar (3).gz");
    REQUIRE(LocalUtil::UniqueName("noext", 2, true) == "noext (2)");
    REQUIRE(LocalUtil::UniqueName(".hidden", 2, true) == ".hidden (2)");
    REQUIRE(LocalUtil::UniqueName("dir.d", 2, false) == "dir.d (2)");
}

/*****************************************************/
TEST_CASE("GetItemType", "[LocalUtil]")
{
    const TempPath tmpdir("test_GetItemType", true);
    std::ofstream(tmpdir.Get()+"/file").close();

    REQUIRE(LocalUtil::GetItemType(tmpdir.Get()) == ItemType::FOLDER);
    REQUIRE(LocalUtil::GetItemType(tmpdir.Get()+"/file") == ItemType::FILE);
    REQUIRE(LocalUtil::GetItemType(tmpdir.Get()+"/none") == ItemType::NONE);
    REQUIRE(LocalUtil::GetItemType(tmpdir.Get()+"/file/sub") == ItemType::NONE);
}

/*****************************************************/
TEST_CASE("ClaimUnique", "[LocalUtil]")
{
    const TempPath tmpdir("test_ClaimUnique", true);
    const fs::path folder { tmpdir.Get() };

    unsigned calls { 0 };
    const fs::path claimed { LocalUtil::ClaimUnique(folder, "a.txt", true,
        [&](const fs::path&){ ++calls; return (calls < 3) ? EEXIST : 0; }) };
    REQUIRE(calls == 3);
    REQUIRE(claimed == folder / "a (3).txt");

    REQUIRE_THROWS_AS(LocalUtil::ClaimUnique(folder, "a.txt", true,
        [](const fs::path&){ return EACCES; }), PlatformException);

    REQUIRE_THROWS_AS(LocalUtil::ClaimUnique(folder, "a.txt", true,
        [](const fs::path&){ return ENOENT; }), NotFoundException);
}

/*****************************************************/
TEST_CASE("MoveNoReplace", "[LocalUtil]")
{
    const TempPath tmpdir("test_MoveNoReplace", true);
    const fs::path src { tmpdir.Get()+"/src" };
    const fs::path dest { tmpdir.Get()+"/dest" };

    std::ofstream(src) << "data";
    std::ofstream(dest) << "other";

    REQUIRE(LocalUtil::MoveNoReplace(src, dest) == EEXIST);
    REQUIRE(fs::exists(src));

    fs::remove(dest);
    REQUIRE(LocalUtil::MoveNoReplace(src, dest) == 0);
    REQUIRE(!fs::exists(src));
    REQUIRE(fs::file_size(dest) == 4);

    REQUIRE(LocalUtil::MoveNoReplace(src, dest) == ENOENT);
}

/*****************************************************/
TEST_CASE("MoveReplace", "[LocalUtil]")
{
    const TempPath tmpdir("test_MoveReplace", true);
    const fs::path src { tmpdir.Get()+"/src" };
    const fs::path dest { tmpdir.Get()+"/dest" };

    std::ofstream(src) << "data";
    std::ofstream(dest) << "longer data";

    REQUIRE(LocalUtil::MoveReplace(src, dest) == 0);
    REQUIRE(!fs::exists(src));
    REQUIRE(fs::file_size(dest) == 4);
}

/*****************************************************/
TEST_CASE("OpenStream", "[LocalUtil]")
{
    const TempPath tmpdir("test_OpenStream", true);
    const std::string file { tmpdir.Get()+"/a.txt" };
    { std::ofstream out(file); out << "data"; }

    const auto getStatus { [](const std::string& path, std::ios_base::openmode mode)->int {
        try { (void)LocalUtil::OpenStream(path, mode); }
        catch (const PlatformException& ex) { return ex.GetStatus(); }
        return 0; } };

    const std::unique_ptr<std::fstream> stream { LocalUtil::OpenStream(file, std::ios::in | std::ios::binary) };
    std::string data; *stream >> data; REQUIRE(data == "data");

    // the open's own errno is reported, not a fixed status
    REQUIRE(getStatus(tmpdir.Get(), std::ios::in | std::ios::out) == EISDIR);
    REQUIRE(getStatus(tmpdir.Get()+"/"+std::string(300,'x'), std::ios::in) == ENAMETOOLONG);
    REQUIRE_THROWS_AS((void)LocalUtil::OpenStream(tmpdir.Get()+"/none/b.txt", std::ios::in), NotFoundException);
}

/*****************************************************/
TEST_CASE("ThrowError", "[LocalUtil]")
{
    REQUIRE_THROWS_AS(LocalUtil::ThrowError(ENOENT, "/none"), NotFoundException);

    int status { 0 }; try { LocalUtil::ThrowError(EEXIST, "/exists"); }
    catch (const PlatformException& ex) { status = ex.GetStatus(); }
    REQUIRE(status == EEXIST);
}

} // namespace Local
} // namespace Platform
} // namespace PortableStorage
