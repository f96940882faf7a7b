#ifndef LIBPS_BASEOPTIONS_H_
#define LIBPS_BASEOPTIONS_H_

#include <filesystem>
#include <list>
#include <map>
#include <string>

#include "BaseException.hpp"
#include "Debug.hpp"

namespace PortableStorage {

/** 
 * Flags and option=value pairs from the command line or config files
 * Subclasses claim what they understand via AddFlag/AddOption
 */
class BaseOptions
{
public:

    virtual ~BaseOptions() = default;

    /** Base class for all option/usage errors */
    class Exception : public BaseException {
        using BaseException::BaseException; };

    /** Thrown when -h|--help is given */
    class ShowHelpException : public Exception {
        public: ShowHelpException() : Exception("help requested") {} };

    /** Thrown when -V|--version is given */
    class ShowVersionException : public Exception {
        public: ShowVersionException() : Exception("version requested") {} };

    /** The arguments are not in a usable form */
    class BadUsageException : public Exception { 
        public: explicit BadUsageException(const std::string& details) : 
            Exception("Bad Usage: "+details) {} };

    /** No subclass claimed the given flag */
    class BadFlagException : public Exception { 
        public: explicit BadFlagException(const std::string& flag) : 
            Exception("Unknown Flag: "+flag) {} };

    /** No subclass claimed the given option */
    class BadOptionException : public Exception { 
        public: explicit BadOptionException(const std::string& option) : 
            Exception("Unknown Option: "+option) {} };

    /** The value given for the named option is not acceptable */
    class BadValueException : public Exception {
        public: explicit BadValueException(const std::string& option) :
            Exception("Invalid Value For: "+option) {} };

    /** The named option is required but was not given or defaulted */
    class MissingOptionException : public Exception {
        public: explicit MissingOptionException(const std::string& option) :
            Exception("Required Option: "+option) {} };

    /** flags in the order given */
    using Flags = std::list<std::string>;
    /** option name to value, an option may repeat */
    using Options = std::multimap<std::string, std::string>;

    /** 
     * Parses command line arguments from main, skipping argv[0]
     * Accepts -x, --xx, -x3, -x=3, --xx=3, and -x 3 or --xx 3 unless stopmm
     * @param stopmm if true, stop at "--" or the first non-key (the command)
     * @throws Exception if the arguments are not usable
     * @return index of the first argument not consumed (argc if !stopmm)
     */
    size_t ParseArgs(size_t argc, const char* const* argv, bool stopmm = false);

    /** 
     * Parses a config file with one flag or option=value per line
     * Blank lines and lines starting with # or a space are skipped
     * @throws Exception if the contents are not usable
     */
    void ParseFile(const std::filesystem::path& path);

    /**
     * Parses every config file found with the given name, in order
     * Searches /etc/portablestorage, /usr/local/etc/portablestorage, 
     * $XDG_CONFIG_HOME/portablestorage (or ~/.config) then the working directory
     * @param prefix the config file name without .conf
     * @throws Exception if the contents are not usable
     */
    void ParseConfig(const std::string& prefix);

    /** 
     * Handles help, version. Returns true iff the flag was claimed
     * @throws ShowHelpException if help text is requested
     * @throws ShowVersionException if version text is requested
     */
    virtual bool AddFlag(const std::string& flag);

    /** 
     * Handles config-file and the debug options. Returns true iff the option was claimed
     * @throws BadValueException if the value is not acceptable
     */
    virtual bool AddOption(const std::string& option, const std::string& value);

    /** 
     * Checks that everything required is present, run after all parsing
     * @throws MissingOptionException if a required option is missing
     */
    virtual void Validate() = 0;

protected:

    /** 
     * Hands parsed flags then options to AddFlag/AddOption
     * @throws BadFlagException if a flag is not claimed
     * @throws BadOptionException if an option is not claimed
     */
    void ApplyAll(const Flags& flags, const Options& options);

    /** 
     * Returns the debug level from a number or level name (errors, platform, info, details)
     * @throws BadValueException if not a valid level
     */
    static Debug::Level ParseDebugLevel(const std::string& option, const std::string& value);

    /** Returns the usage string for help/version */
    static std::string CoreBaseHelpText();

    /** 
     * Returns the usage lines for config and debug options
     * @param name suffix of the portablestorage-name.conf file the program reads (or blank)
     */
    static std::string DetailBaseHelpText(const std::string& name = "");
};

} // namespace PortableStorage

#endif // LIBPS_BASEOPTIONS_H_
