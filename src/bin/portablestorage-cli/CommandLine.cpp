
#include <map>
#include <sstream>

#include <nlohmann/json.hpp>

#include "CommandLine.hpp"
#include "Options.hpp"

#include "portablestorage/BaseOptions.hpp"
using PortableStorage::BaseOptions;
#include "portablestorage/StringUtil.hpp"
using PortableStorage::StringUtil;
#include "portablestorage/filesystem/FileExtensions.hpp"
using PortableStorage::Filesystem::FileExtensions;
#include "portablestorage/filesystem/IFileSystem.hpp"
using PortableStorage::Filesystem::CreationCollisionOption;
using PortableStorage::Filesystem::ExistenceCheckResult;
using PortableStorage::Filesystem::IFile;
using PortableStorage::Filesystem::IFileSystem;
using PortableStorage::Filesystem::IFolder;

namespace PortableStorageCli {

namespace {
/** Map of command name to its min and max positional arg count */
const std::map<std::string, std::pair<size_t,size_t>> sCommands {
    {"ls",     {0,1}}, {"lsdir", {0,1}},
    {"mkdir",  {1,2}}, {"touch", {1,2}},
    {"cat",    {1,1}}, {"write", {2,2}},
    {"rm",     {1,1}}, {"rmdir", {0,1}},
    {"exists", {2,2}}
};

/** Formats command output, non-UTF-8 bytes in names become U+FFFD */
std::string ToOutput(const nlohmann::json& val)
{
    return val.dump(4, ' ', false, nlohmann::json::error_handler_t::replace);
}
} // namespace

/*****************************************************/
std::string CommandLine::HelpText()
{
    std::ostringstream output;

    using std::endl;

    output 
        << "Usage Syntax: " << endl
        << "portablestorage-cli " << Options::CoreHelpText() << endl
        << "portablestorage-cli " << Options::MainHelpText() << " command [args+]" << endl << endl

        << "commands: ls [path] | lsdir [path] | mkdir path [collision] | touch path [collision]" << endl
        << "          cat path | write path text | rm path | rmdir [path] | exists path name" << endl
        << "         paths are relative to the selected storage root" << endl
        << "         collision is one of unique, replace, fail, open (mkdir default fail, touch default open)" << endl << endl

        << "NOTE options with values must be given as --option=value before the command." << endl << endl

        << Options::DetailHelpText() << endl;

    return output.str();
}

/*****************************************************/
CommandLine::CommandLine(Options& options, size_t argc, const char* const* argv) : mOptions(options)
{
    const size_t shift { mOptions.ParseArgs(argc, argv, true) };
    argc -= shift; argv += shift; mOptions.Validate();

    if (argc < 1) throw BaseOptions::BadUsageException("missing command");

    mCommand = argv[0];
    for (size_t i = 1; i < argc; i++)
        mArgs.emplace_back(argv[i]);

    const decltype(sCommands)::const_iterator it { sCommands.find(mCommand) };
    if (it == sCommands.cend())
        throw BaseOptions::BadUsageException("unknown command "+mCommand);

    if (mArgs.size() < it->second.first || mArgs.size() > it->second.second)
        throw BaseOptions::BadUsageException("wrong argument count for "+mCommand);

    if ((mCommand == "mkdir" || mCommand == "touch") && mArgs.size() > 1)
        ParseCollision(mArgs[1]); // validate early
}

/*****************************************************/
CreationCollisionOption CommandLine::ParseCollision(const std::string& name)
{
    if      (name == "unique")  return CreationCollisionOption::GenerateUniqueName;
    else if (name == "replace") return CreationCollisionOption::ReplaceExisting;
    else if (name == "fail")    return CreationCollisionOption::FailIfExists;
    else if (name == "open")    return CreationCollisionOption::OpenIfExists;
    else throw BaseOptions::BadUsageException("unknown collision option "+name);
}

/*****************************************************/
std::unique_ptr<IFolder> CommandLine::GetFolder(std::unique_ptr<IFolder> root, const std::string& path)
{
    std::unique_ptr<IFolder> folder { std::move(root) };
    for (const std::string& name : StringUtil::explode(path, "/"))
    {
        if (name.empty() || name == ".") continue;
        folder = folder->GetFolderAsync(name).get();
    }
    return folder;
}

/*****************************************************/
void CommandLine::RunCommand(IFileSystem& filesystem, std::ostream& output)
{
    std::unique_ptr<IFolder> root { mOptions.isRoaming() 
        ? filesystem.RoamingStorage() : filesystem.LocalStorage() };

    const std::string path { mArgs.empty() ? "" : mArgs[0] };
    const StringUtil::StringPair dirName { StringUtil::splitPath(path) };

    if (mCommand == "ls" || mCommand == "lsdir")
    {
        const std::unique_ptr<IFolder> folder { GetFolder(std::move(root), path) };

        nlohmann::json list(nlohmann::json::array());
        if (mCommand == "ls")
        {
            for (const std::unique_ptr<IFile>& file : folder->GetFilesAsync().get())
                list.push_back({{"name", file->GetName()}, {"path", file->GetPath()}});
        }
        else
        {
            for (const std::unique_ptr<IFolder>& sub : folder->GetFoldersAsync().get())
                list.push_back({{"name", sub->GetName()}, {"path", sub->GetPath()}});
        }
        output << ToOutput(list) << std::endl;
    }
    else if (mCommand == "mkdir" || mCommand == "touch")
    {
        const bool isFile { mCommand == "touch" };
        const CreationCollisionOption option { mArgs.size() > 1 ? ParseCollision(mArgs[1]) 
            : (isFile ? CreationCollisionOption::OpenIfExists : CreationCollisionOption::FailIfExists) };

        const std::unique_ptr<IFolder> parent { GetFolder(std::move(root), dirName.first) };

        const nlohmann::json item { isFile
            ? nlohmann::json{{"path", parent->CreateFileAsync(dirName.second, option).get()->GetPath()}}
            : nlohmann::json{{"path", parent->CreateFolderAsync(dirName.second, option).get()->GetPath()}} };
        output << ToOutput(item) << std::endl;
    }
    else if (mCommand == "cat")
    {
        const std::unique_ptr<IFolder> parent { GetFolder(std::move(root), dirName.first) };
        const std::unique_ptr<IFile> file { parent->GetFileAsync(dirName.second).get() };

        output << FileExtensions::ReadAllTextAsync(*file).get();
    }
    else if (mCommand == "write")
    {
        const std::unique_ptr<IFolder> parent { GetFolder(std::move(root), dirName.first) };
        const std::unique_ptr<IFile> file { parent->CreateFileAsync(
            dirName.second, CreationCollisionOption::OpenIfExists).get() };

        FileExtensions::WriteAllTextAsync(*file, mArgs[1]).get();
    }
    else if (mCommand == "rm")
    {
        const std::unique_ptr<IFolder> parent { GetFolder(std::move(root), dirName.first) };
        parent->GetFileAsync(dirName.second).get()->DeleteAsync().get();
    }
    else if (mCommand == "rmdir")
    {
        GetFolder(std::move(root), path)->DeleteAsync().get();
    }
    else if (mCommand == "exists")
    {
        const std::unique_ptr<IFolder> folder { GetFolder(std::move(root), path) };

        std::string result;
        switch (folder->CheckExistsAsync(mArgs[1]).get())
        {
            case ExistenceCheckResult::NotFound: result = "NotFound"; break;
            case ExistenceCheckResult::FileExists: result = "FileExists"; break;
            case ExistenceCheckResult::FolderExists: result = "FolderExists"; break;
        }
        output << ToOutput(nlohmann::json{{"result", result}}) << std::endl;
    }
}

} // namespace PortableStorageCli
