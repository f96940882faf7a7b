
#include <iostream>
#include <memory>

#include <nlohmann/json.hpp>

#include "CommandLine.hpp"
using PortableStorageCli::CommandLine;
#include "Options.hpp"
using PortableStorageCli::Options;

#include "portablestorage/Debug.hpp"
using PortableStorage::Debug;
#include "portablestorage/filesystem/FSException.hpp"
namespace Filesystem = PortableStorage::Filesystem;
#include "portablestorage/filesystem/StorageOptions.hpp"
using PortableStorage::Filesystem::StorageOptions;
#include "portablestorage/filesystem/adapters/PlatformFileSystem.hpp"
using PortableStorage::Filesystem::Adapters::PlatformFileSystem;
#include "portablestorage/platform/PlatformException.hpp"
namespace Platform = PortableStorage::Platform;
#include "portablestorage/platform/local/LocalProvider.hpp"
using PortableStorage::Platform::Local::LocalProvider;

enum class ExitCode
{
    SUCCESS,
    BAD_USAGE,
    NOT_FOUND,
    ALREADY_EXISTS,
    IO_ERROR,
    PLATFORM_ERROR,
    OUTPUT_JSON
};

int main(int argc, char** argv)
{
    Debug::AddStream(std::cerr);
    Debug debug("main",nullptr);

    StorageOptions storageOptions;
    Options options(storageOptions);
    std::unique_ptr<CommandLine> commandLine;

    try
    {
        options.ParseConfig("portablestorage");
        options.ParseConfig("portablestorage-cli");

        commandLine = std::make_unique<CommandLine>(
            options, static_cast<size_t>(argc), argv);
    }
    catch (const Options::ShowHelpException& ex)
    {
        std::cout << CommandLine::HelpText() << std::endl;
        return static_cast<int>(ExitCode::SUCCESS);
    }
    catch (const Options::ShowVersionException& ex)
    {
        std::cout << "version: " << PORTABLESTORAGE_VERSION << std::endl;
        return static_cast<int>(ExitCode::SUCCESS);
    }
    catch (const Options::Exception& ex)
    {
        std::cout << ex.what() << std::endl << std::endl;
        std::cout << CommandLine::HelpText() << std::endl;
        return static_cast<int>(ExitCode::BAD_USAGE);
    }

    DDBG_INFO("()");

    try
    {
        LocalProvider provider;
        PlatformFileSystem filesystem(provider, storageOptions);

        commandLine->RunCommand(filesystem, std::cout);

        DDBG_INFO(": returning success...");
        return static_cast<int>(ExitCode::SUCCESS);
    }
    catch (const Filesystem::DirectoryNotFoundException& ex)
    {
        DDBG_ERROR(": " << ex.what());
        return static_cast<int>(ExitCode::NOT_FOUND);
    }
    catch (const Filesystem::FileNotFoundException& ex)
    {
        DDBG_ERROR(": " << ex.what());
        return static_cast<int>(ExitCode::NOT_FOUND);
    }
    catch (const Filesystem::AlreadyExistsException& ex)
    {
        DDBG_ERROR(": " << ex.what());
        return static_cast<int>(ExitCode::ALREADY_EXISTS);
    }
    catch (const Filesystem::InvalidArgumentException& ex)
    {
        DDBG_ERROR(": " << ex.what());
        return static_cast<int>(ExitCode::BAD_USAGE);
    }
    catch (const Filesystem::Exception& ex)
    {
        DDBG_ERROR(": " << ex.what());
        return static_cast<int>(ExitCode::IO_ERROR);
    }
    catch (const Platform::NotFoundException& ex)
    {
        DDBG_ERROR(": " << ex.what());
        return static_cast<int>(ExitCode::NOT_FOUND);
    }
    catch (const Platform::PlatformException& ex)
    {
        DDBG_ERROR(": " << ex.what());
        return static_cast<int>(ExitCode::PLATFORM_ERROR);
    }
    catch (const Options::Exception& ex)
    {
        DDBG_ERROR(": " << ex.what());
        return static_cast<int>(ExitCode::BAD_USAGE);
    }
    catch (const nlohmann::json::exception& ex)
    {
        DDBG_ERROR(": JSON Error: " << ex.what());
        return static_cast<int>(ExitCode::OUTPUT_JSON);
    }
}
