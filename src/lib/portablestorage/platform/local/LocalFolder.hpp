#ifndef LIBPS_LOCALFOLDER_H_
#define LIBPS_LOCALFOLDER_H_

#include <string>

#include "portablestorage/common.hpp"
#include "portablestorage/Debug.hpp"
#include "portablestorage/platform/StorageFolder.hpp"

namespace PortableStorage {
namespace Platform {
namespace Local {

/** 
 * A folder on the local POSIX filesystem
 * Each operation runs as its own async task on a copy of the path, THREAD SAFE
 */
class LocalFolder : public StorageFolder
{
public:

    /** @param path path of the (existing) folder */
    explicit LocalFolder(const std::string& path);

    ~LocalFolder() override = default;
    DELETE_COPY(LocalFolder)
    DELETE_MOVE(LocalFolder)

    std::string GetName() const override { return mName; }

    std::string GetPath() const override { return mPath; }

    std::future<std::unique_ptr<StorageFile>> CreateFileAsync(
        const std::string& desiredName, CreationCollisionOption option) override;

    std::future<std::unique_ptr<StorageFile>> GetFileAsync(const std::string& name) override;

    std::future<FileList> GetFilesAsync() override;

    std::future<std::unique_ptr<StorageFolder>> CreateFolderAsync(
        const std::string& desiredName, CreationCollisionOption option) override;

    std::future<std::unique_ptr<StorageFolder>> GetFolderAsync(const std::string& name) override;

    std::future<FolderList> GetFoldersAsync() override;

    std::future<ItemType> TryGetItemTypeAsync(const std::string& name) override;

    std::future<void> DeleteAsync() override;

private:

    /** Normalized path of the folder */
    const std::string mPath;
    /** Last segment of mPath */
    const std::string mName;

    mutable Debug mDebug;
};

} // namespace Local
} // namespace Platform
} // namespace PortableStorage

#endif // LIBPS_LOCALFOLDER_H_
