
#include <sstream>

#include "catch2/catch_test_macros.hpp"
#include "catch2/trompeloeil.hpp"

#include "testObjects.hpp"
#include "portablestorage/filesystem/FileExtensions.hpp"
#include "portablestorage/filesystem/IFile.hpp"

namespace PortableStorage {
namespace Filesystem {

using Platform::FailedFuture;
using Platform::ReadyFuture;
using StreamPtr = std::unique_ptr<std::iostream>;

class MockFile : public IFile { public:
    MAKE_CONST_MOCK0(GetName, std::string(), override);
    MAKE_CONST_MOCK0(GetPath, std::string(), override);
    MAKE_MOCK1(OpenAsync, std::future<StreamPtr>(FileAccess), override);
    MAKE_MOCK0(DeleteAsync, std::future<void>(), override);
    MAKE_MOCK2(RenameAsync, std::future<void>(const std::string&, NameCollisionOption), override);
    MAKE_MOCK2(MoveAsync, std::future<void>(const std::string&, NameCollisionOption), override);
};

namespace {
/** Returns a stream that fails every operation */
std::future<StreamPtr> BadStream()
{
    StreamPtr stream { std::make_unique<std::stringstream>() };
    stream->setstate(std::ios::badbit);
    return ReadyFuture(std::move(stream));
}
} // namespace

/*****************************************************/
TEST_CASE("ReadAllText", "[FileExtensions]")
{
    MockFile file;
    ALLOW_CALL(file, GetPath()).RETURN("/data/a.txt");

    {
        REQUIRE_CALL(file, OpenAsync(FileAccess::Read))
            .RETURN(ReadyFuture<StreamPtr>(std::make_unique<std::stringstream>("line1\nline2 ")));
        REQUIRE(FileExtensions::ReadAllTextAsync(file).get() == "line1\nline2 ");
    }

    {
        REQUIRE_CALL(file, OpenAsync(FileAccess::Read))
            .RETURN(ReadyFuture<StreamPtr>(std::make_unique<std::stringstream>()));
        REQUIRE(FileExtensions::ReadAllTextAsync(file).get().empty());
    }

    {
        REQUIRE_CALL(file, OpenAsync(FileAccess::Read))
            .RETURN(FailedFuture<StreamPtr>(FileNotFoundException("/data/a.txt")));
        REQUIRE_THROWS_AS(FileExtensions::ReadAllTextAsync(file).get(), FileNotFoundException);
    }
}

/*****************************************************/
TEST_CASE("WriteAllText", "[FileExtensions]")
{
    MockFile file;
    ALLOW_CALL(file, GetPath()).RETURN("/data/a.txt");

    {
        // the existing contents must be discarded
        REQUIRE_CALL(file, OpenAsync(FileAccess::Overwrite))
            .RETURN(ReadyFuture<StreamPtr>(std::make_unique<std::stringstream>()));
        FileExtensions::WriteAllTextAsync(file, "text").get();
    }

    {
        REQUIRE_CALL(file, OpenAsync(FileAccess::Overwrite)).RETURN(BadStream());
        REQUIRE_THROWS_AS(FileExtensions::WriteAllTextAsync(file, "text").get(), IOException);
    }
}

} // namespace Filesystem
} // namespace PortableStorage
