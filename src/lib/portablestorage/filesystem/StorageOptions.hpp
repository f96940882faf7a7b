#ifndef LIBPS_STORAGEOPTIONS_H_
#define LIBPS_STORAGEOPTIONS_H_

#include <string>

namespace PortableStorage {
namespace Filesystem {

/** Options selecting the application storage roots */
struct StorageOptions
{
    /** Retrieve the standard help text string */
    static std::string HelpText();

    /** 
     * Adds the given option/value, returning true iff it was used
     * @throws BaseOptions::BadValueException if a root path is not absolute
     */
    bool AddOption(const std::string& option, const std::string& value);

    /** 
     * Makes sure both roots can be resolved
     * @throws BaseOptions::MissingOptionException if a root has no value or default
     */
    void Validate() const;

    /** Returns the local root, defaulting to $XDG_DATA_HOME/appName */
    std::string GetLocalRoot() const;

    /** Returns the roaming root, defaulting to $XDG_CONFIG_HOME/appName/roaming */
    std::string GetRoamingRoot() const;

    /** Application name used to build the default roots */
    std::string appName { "portablestorage" };

    /** Local (per-machine) storage root path, if not default */
    std::string localRoot;

    /** Roaming (per-user) storage root path, if not default */
    std::string roamingRoot;
};

} // namespace Filesystem
} // namespace PortableStorage

#endif // LIBPS_STORAGEOPTIONS_H_
