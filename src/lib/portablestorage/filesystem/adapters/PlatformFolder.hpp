#ifndef LIBPS_PLATFORMFOLDER_H_
#define LIBPS_PLATFORMFOLDER_H_

#include <memory>
#include <set>
#include <string>

#include "portablestorage/common.hpp"
#include "portablestorage/Debug.hpp"
#include "portablestorage/filesystem/IFolder.hpp"
#include "portablestorage/platform/PlatformTypes.hpp"

namespace PortableStorage {

namespace Platform { 
    class PlatformException;
    class StorageFolder;
    class StorageProvider;
}

namespace Filesystem {
namespace Adapters {

/** 
 * Adapts a platform StorageFolder to the uniform IFolder contract
 * 
 * Every operation re-checks the folder exists by path, then forwards to the
 * platform and translates its errors. The returned futures are deferred and
 * run on the waiting thread, so this folder must outlive them. Nothing is
 * locked here - concurrent operations are arbitrated by the platform.
 */
class PlatformFolder : public IFolder
{
public:

    /** Set of protected root folder paths */
    using RootPaths = std::set<std::string>;

    /** 
     * @param provider the platform used for path lookups (must outlive this)
     * @param folder the platform folder to wrap
     * @param rootPaths protected root paths, isRoot() is decided from these now
     */
    PlatformFolder(Platform::StorageProvider& provider, 
        std::unique_ptr<Platform::StorageFolder> folder, const RootPaths& rootPaths);

    ~PlatformFolder() override;
    DELETE_COPY(PlatformFolder)
    DELETE_MOVE(PlatformFolder)

    std::string GetName() const override;

    std::string GetPath() const override;

    /** Returns true if this folder was a protected root when constructed */
    bool isRoot() const { return mIsRoot; }

    std::future<std::unique_ptr<IFile>> CreateFileAsync(
        const std::string& desiredName, CreationCollisionOption option) override;

    /** 
     * Platform not-found for the file itself is NOT translated 
     * @throws Platform::NotFoundException if the file does not exist
     */
    std::future<std::unique_ptr<IFile>> GetFileAsync(const std::string& name) override;

    std::future<FileList> GetFilesAsync() override;

    std::future<std::unique_ptr<IFolder>> CreateFolderAsync(
        const std::string& desiredName, CreationCollisionOption option) override;

    std::future<std::unique_ptr<IFolder>> GetFolderAsync(const std::string& name) override;

    std::future<FolderList> GetFoldersAsync() override;

    std::future<ExistenceCheckResult> CheckExistsAsync(const std::string& name) override;

    /** Root folders are refused before any existence check or platform call */
    std::future<void> DeleteAsync() override;

    /** 
     * Maps a uniform collision option to the platform's
     * @throws InvalidArgumentException if the option is not recognized
     */
    static Platform::CreationCollisionOption GetPlatformCollisionOption(CreationCollisionOption option);

    /** 
     * Returns true if the platform error is an "already exists" collision
     * This is the only place the platform's numeric status is interpreted,
     * PlatformFile uses it too
     */
    static bool IsAlreadyExists(const Platform::PlatformException& ex);

private:

    /** 
     * Looks up this folder's path again on the platform
     * @throws DirectoryNotFoundException if it no longer exists
     */
    void EnsureExists() const;

    /** Wraps a platform subfolder with this folder's provider and roots */
    std::unique_ptr<IFolder> WrapFolder(std::unique_ptr<Platform::StorageFolder> folder) const;

    Platform::StorageProvider& mProvider;
    const std::unique_ptr<Platform::StorageFolder> mFolder;
    const RootPaths mRootPaths;
    const bool mIsRoot;

    mutable Debug mDebug;
};

} // namespace Adapters
} // namespace Filesystem
} // namespace PortableStorage

#endif // LIBPS_PLATFORMFOLDER_H_
