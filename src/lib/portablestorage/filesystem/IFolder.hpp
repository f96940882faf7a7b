#ifndef LIBPS_IFOLDER_H_
#define LIBPS_IFOLDER_H_

#include <future>
#include <memory>
#include <string>
#include <vector>

#include "FSException.hpp"
#include "IFile.hpp"
#include "StorageTypes.hpp"

namespace PortableStorage {
namespace Filesystem {

/** 
 * A folder handle in a uniform, platform-agnostic filesystem
 * Every operation re-checks that the folder still exists before acting.
 * Futures are resolved on the thread that waits on them.
 */
class IFolder
{
public:

    virtual ~IFolder() = default;

    /** A snapshot list of files, in platform order */
    using FileList = std::vector<std::unique_ptr<IFile>>;
    /** A snapshot list of folders, in platform order */
    using FolderList = std::vector<std::unique_ptr<IFolder>>;

    /** Returns the name of the folder */
    virtual std::string GetName() const = 0;

    /** Returns the full path of the folder, unique within its IFileSystem */
    virtual std::string GetPath() const = 0;

    /** 
     * Creates a file in this folder
     * @param desiredName the name of the file to create
     * @param option how to behave if the name already exists
     * @throws DirectoryNotFoundException if this folder no longer exists
     * @throws AlreadyExistsException if the name exists with FailIfExists
     * @throws InvalidArgumentException if option is not recognized
     */
    virtual std::future<std::unique_ptr<IFile>> CreateFileAsync(
        const std::string& desiredName, CreationCollisionOption option) = 0;

    /** 
     * Gets an existing file in this folder
     * @throws DirectoryNotFoundException if this folder no longer exists
     */
    virtual std::future<std::unique_ptr<IFile>> GetFileAsync(const std::string& name) = 0;

    /** 
     * Lists the files in this folder
     * @throws DirectoryNotFoundException if this folder no longer exists
     */
    virtual std::future<FileList> GetFilesAsync() = 0;

    /** 
     * Creates a subfolder in this folder
     * @param desiredName the name of the folder to create
     * @param option how to behave if the name already exists
     * @throws DirectoryNotFoundException if this folder no longer exists
     * @throws AlreadyExistsException if the name exists with FailIfExists
     * @throws InvalidArgumentException if option is not recognized
     */
    virtual std::future<std::unique_ptr<IFolder>> CreateFolderAsync(
        const std::string& desiredName, CreationCollisionOption option) = 0;

    /** 
     * Gets an existing subfolder in this folder
     * @throws DirectoryNotFoundException if this folder or the subfolder does not exist
     */
    virtual std::future<std::unique_ptr<IFolder>> GetFolderAsync(const std::string& name) = 0;

    /** 
     * Lists the subfolders in this folder
     * @throws DirectoryNotFoundException if this folder no longer exists
     */
    virtual std::future<FolderList> GetFoldersAsync() = 0;

    /** 
     * Checks whether a file or folder with the given name exists in this folder
     * @throws DirectoryNotFoundException if this folder no longer exists
     */
    virtual std::future<ExistenceCheckResult> CheckExistsAsync(const std::string& name) = 0;

    /** 
     * Deletes this folder and all of its contents
     * @throws RootDeletionException if this is a root storage folder
     * @throws DirectoryNotFoundException if this folder no longer exists
     */
    virtual std::future<void> DeleteAsync() = 0;
};

} // namespace Filesystem
} // namespace PortableStorage

#endif // LIBPS_IFOLDER_H_
