#ifndef LIBPS_PLATFORMTYPES_H_
#define LIBPS_PLATFORMTYPES_H_

#include <cstdint>

namespace PortableStorage {
namespace Platform {

/** Native behavior when creating an item whose name already exists */
enum class CreationCollisionOption : uint8_t
{
    GenerateUniqueName,
    ReplaceExisting,
    FailIfExists,
    OpenIfExists
};

/** Native behavior when renaming/moving onto a name that already exists */
enum class NameCollisionOption : uint8_t
{
    GenerateUniqueName,
    ReplaceExisting,
    FailIfExists
};

/** Native file stream open mode */
enum class FileAccessMode : uint8_t
{
    /** Read only */
    Read,
    /** Read and write, keeping existing contents */
    ReadWrite,
    /** Read and write, discarding existing contents */
    Truncate
};

/** The kind of item found under a name */
enum class ItemType : uint8_t { NONE, FILE, FOLDER };

} // namespace Platform
} // namespace PortableStorage

#endif // LIBPS_PLATFORMTYPES_H_
