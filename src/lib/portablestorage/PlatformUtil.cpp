
#include <cstdlib>
#include <cstring>
#include <mutex>

#include "PlatformUtil.hpp"

namespace PortableStorage {

/*****************************************************/
std::string PlatformUtil::GetEnvironment(const std::string& name)
{
    const char* value { std::getenv(name.c_str()) }; // NOLINT(concurrency-mt-unsafe)
    return (value != nullptr) ? value : "";
}

/*****************************************************/
std::string PlatformUtil::GetHomeDirectory()
{
    for (const char* env : { "HOME", "HOMEDIR" })
    {
        const std::string path { GetEnvironment(env) };
        if (!path.empty()) return path;
    }

    return ""; // not found
}

/*****************************************************/
std::string PlatformUtil::GetXdgDirectory(const std::string& xdgVar, const std::string& fallback)
{
    const std::string xdgPath { GetEnvironment(xdgVar) };
    if (!xdgPath.empty() && xdgPath[0] == '/') return xdgPath; // must be absolute

    const std::string home { GetHomeDirectory() };
    if (home.empty()) return "";

    return home+"/"+fallback;
}

// mutex protecting std::strerror
std::mutex sStrerrorMutex;

/*****************************************************/
std::string PlatformUtil::GetErrorString(int err)
{
    const std::lock_guard<std::mutex> llock(sStrerrorMutex);

    return std::string(std::strerror(err)); // NOLINT(concurrency-mt-unsafe)
}

} // namespace PortableStorage
