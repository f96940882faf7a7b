#ifndef PSCLI_COMMANDLINE_H_
#define PSCLI_COMMANDLINE_H_

#include <iostream>
#include <memory>
#include <string>

#include "portablestorage/StringUtil.hpp"
#include "portablestorage/filesystem/StorageTypes.hpp"

namespace PortableStorage { namespace Filesystem { class IFileSystem; class IFolder; } }

namespace PortableStorageCli {

class Options;

/** Gets options and a storage command from the command line */
class CommandLine
{
public:

    /** Retrieve the standard help text string */
    static std::string HelpText();

    /** 
     * Parses command line arguments from main (skips argv[0]!)
     * @throws BadUsageException if invalid arguments
     * @throws BadFlagException if a invalid flag is used
     * @throws BadOptionException if an invalid option is used
     */
    explicit CommandLine(Options& options, size_t argc, const char* const* argv);

    /** 
     * Runs the command against the selected storage root
     * @param filesystem the filesystem to act on
     * @param output stream to send command output to
     * @throws Filesystem::Exception for storage errors
     * @throws Platform::PlatformException for untranslated platform errors
     */
    void RunCommand(PortableStorage::Filesystem::IFileSystem& filesystem, std::ostream& output);

    /** 
     * Parses a collision option name (unique, replace, fail, open)
     * @throws BadUsageException if the name is not recognized
     */
    static PortableStorage::Filesystem::CreationCollisionOption ParseCollision(const std::string& name);

private:

    /** 
     * Walks from root down the given relative path
     * @throws DirectoryNotFoundException if any segment does not exist
     */
    static std::unique_ptr<PortableStorage::Filesystem::IFolder> GetFolder(
        std::unique_ptr<PortableStorage::Filesystem::IFolder> root, const std::string& path);

    Options& mOptions;

    std::string mCommand;
    PortableStorage::StringUtil::StringList mArgs;
};

} // namespace PortableStorageCli

#endif // PSCLI_COMMANDLINE_H_
