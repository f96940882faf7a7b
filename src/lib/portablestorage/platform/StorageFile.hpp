#ifndef LIBPS_STORAGEFILE_H_
#define LIBPS_STORAGEFILE_H_

#include <future>
#include <iostream>
#include <memory>
#include <string>

#include "PlatformTypes.hpp"

namespace PortableStorage {
namespace Platform {

class StorageFolder;

/** 
 * A native file handle provided by a platform storage subsystem
 * All async operations fail with PlatformException (NotFoundException if missing)
 */
class StorageFile
{
public:

    virtual ~StorageFile() = default;

    /** Returns the file's name (last path segment) */
    virtual std::string GetName() const = 0;

    /** Returns the file's full path */
    virtual std::string GetPath() const = 0;

    /** Opens a stream on the file's contents */
    virtual std::future<std::unique_ptr<std::iostream>> OpenAsync(FileAccessMode mode) = 0;

    /** Deletes the file */
    virtual std::future<void> DeleteAsync() = 0;

    /** Renames the file within its folder, updating this handle */
    virtual std::future<void> RenameAsync(const std::string& desiredName, NameCollisionOption option) = 0;

    /** Moves the file into the given folder, updating this handle */
    virtual std::future<void> MoveAsync(const StorageFolder& destination, 
        const std::string& desiredName, NameCollisionOption option) = 0;
};

} // namespace Platform
} // namespace PortableStorage

#endif // LIBPS_STORAGEFILE_H_
