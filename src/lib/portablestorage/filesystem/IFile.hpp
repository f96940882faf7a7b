#ifndef LIBPS_IFILE_H_
#define LIBPS_IFILE_H_

#include <future>
#include <iostream>
#include <memory>
#include <string>

#include "FSException.hpp"
#include "StorageTypes.hpp"

namespace PortableStorage {
namespace Filesystem {

/** 
 * A file handle in a uniform, platform-agnostic filesystem
 * Futures are resolved on the thread that waits on them
 */
class IFile
{
public:

    virtual ~IFile() = default;

    /** Returns the name of the file */
    virtual std::string GetName() const = 0;

    /** Returns the full path of the file, unique within its IFileSystem */
    virtual std::string GetPath() const = 0;

    /** 
     * Opens a stream on the file's contents
     * @throws FileNotFoundException if the file no longer exists
     * @throws InvalidArgumentException if access is not recognized
     */
    virtual std::future<std::unique_ptr<std::iostream>> OpenAsync(FileAccess access) = 0;

    /** 
     * Deletes the file
     * @throws FileNotFoundException if the file no longer exists
     */
    virtual std::future<void> DeleteAsync() = 0;

    /** 
     * Renames the file within its folder
     * @throws FileNotFoundException if the file no longer exists
     * @throws AlreadyExistsException if newName exists with FailIfExists
     * @throws InvalidArgumentException if option is not recognized
     */
    virtual std::future<void> RenameAsync(const std::string& newName, NameCollisionOption option) = 0;

    /** 
     * Moves the file to the given full path
     * @throws FileNotFoundException if the file no longer exists
     * @throws DirectoryNotFoundException if the destination folder does not exist
     * @throws AlreadyExistsException if newPath exists with FailIfExists
     * @throws InvalidArgumentException if option is not recognized or newPath is not absolute
     */
    virtual std::future<void> MoveAsync(const std::string& newPath, NameCollisionOption option) = 0;
};

} // namespace Filesystem
} // namespace PortableStorage

#endif // LIBPS_IFILE_H_
