#ifndef LIBPS_STORAGETYPES_H_
#define LIBPS_STORAGETYPES_H_

#include <cstdint>

namespace PortableStorage {
namespace Filesystem {

/** Specifies what to do when creating an item whose name already exists */
enum class CreationCollisionOption : uint8_t
{
    /** Append a number to the desired name until it is unique */
    GenerateUniqueName,
    /** Replace the existing item */
    ReplaceExisting,
    /** Fail with AlreadyExistsException */
    FailIfExists,
    /** Return the existing item */
    OpenIfExists
};

/** Specifies what to do when renaming/moving onto a name that already exists */
enum class NameCollisionOption : uint8_t
{
    GenerateUniqueName,
    ReplaceExisting,
    FailIfExists
};

/** How a file's contents are opened */
enum class FileAccess : uint8_t
{
    Read,
    ReadAndWrite,
    /** Read and write, discarding the existing contents */
    Overwrite
};

/** The result of checking a name in a folder */
enum class ExistenceCheckResult : uint8_t
{
    NotFound,
    FileExists,
    FolderExists
};

} // namespace Filesystem
} // namespace PortableStorage

#endif // LIBPS_STORAGETYPES_H_
