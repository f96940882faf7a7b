#ifndef LIBPS_PLATFORMUTIL_H_
#define LIBPS_PLATFORMUTIL_H_

#include <string>

namespace PortableStorage {

/** Host environment helpers */
class PlatformUtil
{
public:

    PlatformUtil() = delete; // static only

    /** Returns the value of the given environment variable, or empty if unset */
    [[nodiscard]] static std::string GetEnvironment(const std::string& name);

    /** Returns the user's home directory path if found */
    [[nodiscard]] static std::string GetHomeDirectory();

    /** 
     * Returns the XDG base directory for the given variable (e.g. XDG_DATA_HOME)
     * falling back to $HOME/fallback if unset, or empty if there is no home
     */
    [[nodiscard]] static std::string GetXdgDirectory(const std::string& xdgVar, const std::string& fallback);

    /** Returns strerror(err) but thread safe */
    [[nodiscard]] static std::string GetErrorString(int err);
};

} // namespace PortableStorage

#endif // LIBPS_PLATFORMUTIL_H_
