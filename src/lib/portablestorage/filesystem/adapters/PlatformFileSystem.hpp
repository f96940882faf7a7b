#ifndef LIBPS_PLATFORMFILESYSTEM_H_
#define LIBPS_PLATFORMFILESYSTEM_H_

#include <memory>
#include <string>

#include "PlatformFolder.hpp"
#include "portablestorage/common.hpp"
#include "portablestorage/Debug.hpp"
#include "portablestorage/filesystem/IFileSystem.hpp"

namespace PortableStorage {

namespace Platform { class StorageProvider; }

namespace Filesystem {

struct StorageOptions;

namespace Adapters {

/** 
 * Adapts a platform StorageProvider to the uniform IFileSystem
 * The local and roaming roots are the protected RootPaths of every folder it returns
 */
class PlatformFileSystem : public IFileSystem
{
public:

    /**
     * Creates both storage roots if they do not exist
     * @param provider the platform to wrap (must outlive this and its items)
     * @param options the storage root configuration
     * @throws BaseOptions::MissingOptionException if a root cannot be resolved
     * @throws Platform::PlatformException if a root cannot be created
     */
    PlatformFileSystem(Platform::StorageProvider& provider, const StorageOptions& options);

    ~PlatformFileSystem() override;
    DELETE_COPY(PlatformFileSystem)
    DELETE_MOVE(PlatformFileSystem)

    /** @throws Platform::PlatformException if the root cannot be (re)created */
    std::unique_ptr<IFolder> LocalStorage() override;

    /** @throws Platform::PlatformException if the root cannot be (re)created */
    std::unique_ptr<IFolder> RoamingStorage() override;

    std::future<std::unique_ptr<IFile>> GetFileFromPathAsync(const std::string& path) override;

    std::future<std::unique_ptr<IFolder>> GetFolderFromPathAsync(const std::string& path) override;

    /** Returns the platform paths of the protected roots */
    const PlatformFolder::RootPaths& GetRootPaths() const { return mRootPaths; }

private:

    /** Gets (creating if needed) the root folder at the given path */
    std::unique_ptr<IFolder> GetRoot(const std::string& path);

    Platform::StorageProvider& mProvider;

    std::string mLocalRoot;
    std::string mRoamingRoot;
    PlatformFolder::RootPaths mRootPaths;

    mutable Debug mDebug;
};

} // namespace Adapters
} // namespace Filesystem
} // namespace PortableStorage

#endif // LIBPS_PLATFORMFILESYSTEM_H_
