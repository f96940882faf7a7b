
#include <sstream>

#include "Options.hpp"

#include "portablestorage/BaseOptions.hpp"
using PortableStorage::BaseOptions;
#include "portablestorage/filesystem/StorageOptions.hpp"
using PortableStorage::Filesystem::StorageOptions;

namespace PortableStorageCli {

/*****************************************************/
std::string Options::CoreHelpText()
{
    return CoreBaseHelpText();
}

/*****************************************************/
std::string Options::MainHelpText()
{
    return "[--roaming]";
}

/*****************************************************/
std::string Options::DetailHelpText()
{
    std::ostringstream output;

    using std::endl;

    output 
        << StorageOptions::HelpText() << endl << endl
        << DetailBaseHelpText("cli");

    return output.str();
}

/*****************************************************/
Options::Options(StorageOptions& storageOptions) :
    mStorageOptions(storageOptions) { }

/*****************************************************/
bool Options::AddFlag(const std::string& flag)
{
    if (BaseOptions::AddFlag(flag)) { }

    else if (flag == "roaming") mRoaming = true;
    else return false; // not used
    
    return true;
}

/*****************************************************/
bool Options::AddOption(const std::string& option, const std::string& value)
{
    if (BaseOptions::AddOption(option, value)) { }

    else if (mStorageOptions.AddOption(option, value)) { }
    else return false; // not used
    
    return true;
}

/*****************************************************/
void Options::Validate()
{
    mStorageOptions.Validate();
}

} // namespace PortableStorageCli
