
#include <sstream>

#include "StorageOptions.hpp"
#include "portablestorage/BaseOptions.hpp"
#include "portablestorage/PlatformUtil.hpp"

namespace PortableStorage {
namespace Filesystem {

/*****************************************************/
std::string StorageOptions::HelpText()
{
    std::ostringstream output;
    const StorageOptions optDefault;

    output << "Storage:         [--local-root path] [--roaming-root path] [--app-name name(" << optDefault.appName << ")]";

    return output.str();
}

/*****************************************************/
bool StorageOptions::AddOption(const std::string& option, const std::string& value)
{
    if (option == "local-root")
    {
        if (value.empty() || value[0] != '/')
            throw BaseOptions::BadValueException(option);
        localRoot = value;
    }
    else if (option == "roaming-root")
    {
        if (value.empty() || value[0] != '/')
            throw BaseOptions::BadValueException(option);
        roamingRoot = value;
    }
    else if (option == "app-name")
    {
        if (value.empty() || value.find('/') != std::string::npos)
            throw BaseOptions::BadValueException(option);
        appName = value;
    }
    else return false; // not used

    return true;
}

/*****************************************************/
void StorageOptions::Validate() const
{
    if (GetLocalRoot().empty())
        throw BaseOptions::MissingOptionException("local-root");
    if (GetRoamingRoot().empty())
        throw BaseOptions::MissingOptionException("roaming-root");
}

/*****************************************************/
std::string StorageOptions::GetLocalRoot() const
{
    if (!localRoot.empty()) return localRoot;

    const std::string base { PlatformUtil::GetXdgDirectory("XDG_DATA_HOME", ".local/share") };
    return base.empty() ? "" : base+"/"+appName;
}

/*****************************************************/
std::string StorageOptions::GetRoamingRoot() const
{
    if (!roamingRoot.empty()) return roamingRoot;

    // kept below the config file directory, never equal to it
    const std::string base { PlatformUtil::GetXdgDirectory("XDG_CONFIG_HOME", ".config") };
    return base.empty() ? "" : base+"/"+appName+"/roaming";
}

} // namespace Filesystem
} // namespace PortableStorage
