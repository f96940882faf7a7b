#ifndef LIBPS_STORAGEFOLDER_H_
#define LIBPS_STORAGEFOLDER_H_

#include <future>
#include <memory>
#include <string>
#include <vector>

#include "PlatformTypes.hpp"
#include "StorageFile.hpp"

namespace PortableStorage {
namespace Platform {

/** 
 * A native folder handle provided by a platform storage subsystem
 * All async operations fail with PlatformException (NotFoundException if missing)
 */
class StorageFolder
{
public:

    virtual ~StorageFolder() = default;

    using FileList = std::vector<std::unique_ptr<StorageFile>>;
    using FolderList = std::vector<std::unique_ptr<StorageFolder>>;

    /** Returns the folder's name (last path segment) */
    virtual std::string GetName() const = 0;

    /** Returns the folder's full path */
    virtual std::string GetPath() const = 0;

    /** Creates a file in this folder */
    virtual std::future<std::unique_ptr<StorageFile>> CreateFileAsync(
        const std::string& desiredName, CreationCollisionOption option) = 0;

    /** Returns the existing file with the given name */
    virtual std::future<std::unique_ptr<StorageFile>> GetFileAsync(const std::string& name) = 0;

    /** Returns all files in this folder */
    virtual std::future<FileList> GetFilesAsync() = 0;

    /** Creates a subfolder in this folder */
    virtual std::future<std::unique_ptr<StorageFolder>> CreateFolderAsync(
        const std::string& desiredName, CreationCollisionOption option) = 0;

    /** Returns the existing subfolder with the given name */
    virtual std::future<std::unique_ptr<StorageFolder>> GetFolderAsync(const std::string& name) = 0;

    /** Returns all subfolders in this folder */
    virtual std::future<FolderList> GetFoldersAsync() = 0;

    /** Returns the type of the item with the given name, NONE if absent */
    virtual std::future<ItemType> TryGetItemTypeAsync(const std::string& name) = 0;

    /** Deletes this folder and all of its contents */
    virtual std::future<void> DeleteAsync() = 0;
};

} // namespace Platform
} // namespace PortableStorage

#endif // LIBPS_STORAGEFOLDER_H_
