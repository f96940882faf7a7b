#ifndef LIBPS_LOCALUTIL_H_
#define LIBPS_LOCALUTIL_H_

#include <filesystem>
#include <fstream>
#include <functional>
#include <memory>
#include <string>

#include "portablestorage/platform/PlatformTypes.hpp"

namespace PortableStorage {
namespace Platform {
namespace Local {

/** Helpers shared by the local (POSIX) storage handles */
class LocalUtil
{
public:

    LocalUtil() = delete; // static only

    /** Max number of candidates tried when generating a unique name */
    static constexpr unsigned MAX_UNIQUE_TRIES { 10000 };

    /** Returns the absolute, lexically normal form of path without a trailing / */
    [[nodiscard]] static std::string NormalizePath(const std::string& path);

    /** Returns the last segment of the given normalized path */
    [[nodiscard]] static std::string GetName(const std::string& path);

    /** 
     * Returns the type of the item at path, NONE if it does not exist
     * @throws PlatformException if the path cannot be examined
     */
    [[nodiscard]] static ItemType GetItemType(const std::filesystem::path& path);

    /** 
     * Checks an item name is usable (not empty, no /, not . or ..)
     * @throws PlatformException with EINVAL if invalid
     */
    static void ValidateName(const std::string& name);

    /** 
     * Returns the index'th candidate for a unique name, e.g. "a.txt", "a (2).txt"
     * @param index candidate number starting at 1 (the name itself)
     * @param isFile if true, the number goes before the extension
     */
    [[nodiscard]] static std::string UniqueName(const std::string& name, unsigned index, bool isFile);

    /** Function that tries to create/claim a path and returns 0 or an errno */
    using ClaimFunc = std::function<int (const std::filesystem::path&)>;

    /**
     * Tries unique candidates of name in folder until claim does not fail with EEXIST
     * @return the path that was claimed
     * @throws PlatformException if claim fails otherwise or no candidate is free
     */
    static std::filesystem::path ClaimUnique(const std::filesystem::path& folder, 
        const std::string& name, bool isFile, const ClaimFunc& claim);

    /**
     * Moves a file to a path that must not exist, atomically where possible
     * @return 0 on success or an errno (EEXIST if dest exists)
     */
    [[nodiscard]] static int MoveNoReplace(const std::filesystem::path& src, const std::filesystem::path& dest);

    /**
     * Moves a file to a path, replacing any existing file
     * @return 0 on success or an errno
     */
    [[nodiscard]] static int MoveReplace(const std::filesystem::path& src, const std::filesystem::path& dest);

    /**
     * Opens a file stream with the given mode
     * @throws PlatformException with the errno from the failed open
     */
    [[nodiscard]] static std::unique_ptr<std::fstream> OpenStream(
        const std::string& path, std::ios_base::openmode mode);

    /** 
     * Throws the exception matching the given errno
     * @throws NotFoundException if ENOENT
     * @throws PlatformException otherwise
     */
    [[noreturn]] static void ThrowError(int err, const std::string& path);
};

} // namespace Local
} // namespace Platform
} // namespace PortableStorage

#endif // LIBPS_LOCALUTIL_H_
