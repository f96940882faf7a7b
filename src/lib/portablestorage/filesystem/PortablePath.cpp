
#include "PortablePath.hpp"

namespace PortableStorage {
namespace Filesystem {

/*****************************************************/
std::string PortablePath::Combine(const std::vector<std::string>& paths)
{
    std::string retval;
    for (const std::string& path : paths)
    {
        if (path.empty()) continue;

        if (!retval.empty() && retval.back() != DirectorySeparatorChar)
            retval += DirectorySeparatorChar;

        if (!retval.empty() && path.front() == DirectorySeparatorChar)
            retval += path.substr(1);
        else retval += path;
    }
    return retval;
}

} // namespace Filesystem
} // namespace PortableStorage
