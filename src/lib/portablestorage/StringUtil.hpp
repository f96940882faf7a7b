#ifndef LIBPS_STRINGUTIL_H_
#define LIBPS_STRINGUTIL_H_

#include <string>
#include <utility>
#include <vector>

#define BOOLSTR(x) ((x) ? "true" : "false")

namespace PortableStorage {

/** String and path-string helpers */
class StringUtil
{
public:

    StringUtil() = delete; // static only

    /** Returns a random lowercase alphanumeric string of the given size */
    [[nodiscard]] static std::string Random(size_t size);

    using StringList = std::vector<std::string>;
    /**
     * Split a string into pieces
     * @param str string to split
     * @param delim string separating pieces
     * @param reverse if true, find delims from the end
     * @param max max # of elements to return
     */
    [[nodiscard]] static StringList explode(
        const std::string& str, const std::string& delim, 
        bool reverse = false, size_t max = static_cast<size_t>(-1));

    using StringPair = std::pair<std::string, std::string>;
    /** 
     * Special case of explode with max=2 that always returns a pair 
     * @param reverse if true, split at the last delim
     */
    [[nodiscard]] static StringPair split(
        const std::string& str, const std::string& delim, bool reverse = false);

    /** Splits a path into its dirname and basename (ignores trailing /) */
    [[nodiscard]] static StringPair splitPath(const std::string& path);

    /** 
     * Splits a file name into its stem and extension (with the dot)
     * A leading dot (hidden file) is not treated as an extension
     */
    [[nodiscard]] static StringPair splitExtension(const std::string& name);

    /** Returns the string with leading/trailing whitespace stripped */
    [[nodiscard]] static std::string trim(const std::string& str);
};

} // namespace PortableStorage

#endif // LIBPS_STRINGUTIL_H_
