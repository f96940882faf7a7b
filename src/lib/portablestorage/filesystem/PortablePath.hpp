#ifndef LIBPS_PORTABLEPATH_H_
#define LIBPS_PORTABLEPATH_H_

#include <string>
#include <vector>

namespace PortableStorage {
namespace Filesystem {

/** Path helpers for the uniform filesystem */
class PortablePath
{
public:

    PortablePath() = delete; // static only

    /** The character separating path segments */
    static constexpr char DirectorySeparatorChar { '/' };

    /** 
     * Joins path segments with DirectorySeparatorChar
     * Empty segments are skipped and separators are not doubled
     */
    [[nodiscard]] static std::string Combine(const std::vector<std::string>& paths);
};

} // namespace Filesystem
} // namespace PortableStorage

#endif // LIBPS_PORTABLEPATH_H_
