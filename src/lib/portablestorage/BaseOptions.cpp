
#include <array>
#include <cctype>
#include <fstream>
#include <ios>
#include <sstream>

#include "BaseOptions.hpp"
#include "PlatformUtil.hpp"
#include "StringUtil.hpp"

namespace PortableStorage {

/*****************************************************/
std::string BaseOptions::CoreBaseHelpText()
{
    return "(-h|--help | -V|--version)";
}

/*****************************************************/
std::string BaseOptions::DetailBaseHelpText(const std::string& name)
{
    std::ostringstream output;
    using std::endl;

    output << "Config File:     [-c|--config-file path]" << endl
           << "Debugging:       [-d|--debug 0-" << static_cast<size_t>(Debug::Level::LAST) << "|errors|platform|info|details]"
                                " [--debug-filter str1,str2+] [--debug-log path]" << endl << endl

           << "Any flag or option can also be listed in portablestorage.conf";
    if (!name.empty()) output << " or portablestorage-" << name << ".conf";
    output << " with one option=value per line.";

    return output.str();
}

/*****************************************************/
size_t BaseOptions::ParseArgs(size_t argc, const char* const* argv, bool stopmm)
{
    Flags flags; Options options;

    size_t argIdx { 1 }; for (; argIdx < argc; argIdx++)
    {
        const std::string arg { argv[argIdx] };
        if (arg.empty())
            throw BadUsageException(
                "empty key at arg "+std::to_string(argIdx));

        if (arg[0] != '-')
        {
            if (stopmm) break; // start of the command
            throw BadUsageException(
                "expected key at arg "+std::to_string(argIdx));
        }

        const bool ext { arg.size() > 1 && arg[1] == '-' };
        const std::string key { arg.substr(ext ? 2 : 1) };

        if (key.empty() || std::isspace(static_cast<unsigned char>(key[0])))
        {
            if (stopmm) { ++argIdx; break; } // --
            throw BadUsageException(
                "empty key at arg "+std::to_string(argIdx));
        }
        
        if (key.find('=') != std::string::npos) 
            options.emplace(StringUtil::split(key, "=")); // -x=3, --x=3
        else if (!ext && key.size() > 1)
            options.emplace(key.substr(0, 1), key.substr(1)); // -x3
        else if (!stopmm && argIdx+1 < argc && argv[argIdx+1][0] != '-')
            options.emplace(key, argv[++argIdx]); // -x 3, --x 3
        else flags.push_back(key); // -x, --x
    }

    ApplyAll(flags, options);
    return argIdx;
}

/*****************************************************/
void BaseOptions::ParseFile(const std::filesystem::path& path)
{
    Flags flags; Options options;

    std::ifstream file(path, std::ios::in | std::ios::binary);

    std::string line; while (std::getline(file, line))
    {
        if (!line.empty() && line.back() == '\r') line.pop_back(); // CRLF

        if (line.empty() || line[0] == '#' || line[0] == ' ') continue;

        if (line.find('=') == std::string::npos) flags.push_back(line);
        else options.emplace(StringUtil::split(line, "="));
    }

    ApplyAll(flags, options);
}

/*****************************************************/
void BaseOptions::ParseConfig(const std::string& prefix)
{
    std::list<std::string> dirs { 
        "/etc/portablestorage", "/usr/local/etc/portablestorage" };

    const std::string config { PlatformUtil::GetXdgDirectory("XDG_CONFIG_HOME", ".config") };
    if (!config.empty()) dirs.push_back(config+"/portablestorage");
    dirs.emplace_back(".");

    for (const std::string& dir : dirs)
    {
        const std::string path { dir+"/"+prefix+".conf" };
        if (std::filesystem::is_regular_file(path))
            ParseFile(path);
    }
}

/*****************************************************/
void BaseOptions::ApplyAll(const Flags& flags, const Options& options)
{
    for (const Flags::value_type& flag : flags) 
        if (!AddFlag(flag)) throw BadFlagException(flag);

    for (const Options::value_type& pair : options)
        if (!AddOption(pair.first, pair.second)) throw BadOptionException(pair.first);
}

/*****************************************************/
Debug::Level BaseOptions::ParseDebugLevel(const std::string& option, const std::string& value)
{
    static const std::array<const char*,4> names { "errors", "platform", "info", "details" };
    for (size_t i { 0 }; i < names.size(); ++i)
        if (value == names[i]) return static_cast<Debug::Level>(i);

    if (value.empty() || value.find_first_not_of("0123456789") != std::string::npos)
        throw BadValueException(option);

    unsigned long level { 0 };
    try { level = std::stoul(value); }
    catch (const std::out_of_range&) { 
        throw BadValueException(option); }

    if (level > static_cast<unsigned long>(Debug::Level::LAST))
        throw BadValueException(option);
    return static_cast<Debug::Level>(level);
}

/*****************************************************/
bool BaseOptions::AddFlag(const std::string& flag)
{
    if (flag == "h" || flag == "help")
        throw ShowHelpException();
    else if (flag == "V" || flag == "version")
        throw ShowVersionException();
    else return false; // not used
}

/*****************************************************/
bool BaseOptions::AddOption(const std::string& option, const std::string& value)
{
    if (option == "c" || option == "config-file")
    {
        if (!std::filesystem::is_regular_file(value))
            throw BadValueException(option);
        ParseFile(value);
    }
    else if (option == "d" || option == "debug")
        Debug::SetLevel(ParseDebugLevel(option, value));
    else if (option == "debug-filter")
        Debug::SetFilters(value);
    else if (option == "debug-log")
    {
        try { Debug::AddLogFile(value); } // path
        catch (const std::ios_base::failure&) {
            throw BadValueException(option); }
    }
    else return false; // not used

    return true;
}

} // namespace PortableStorage
