#ifndef LIBPS_PLATFORMFILE_H_
#define LIBPS_PLATFORMFILE_H_

#include <memory>
#include <string>

#include "portablestorage/common.hpp"
#include "portablestorage/Debug.hpp"
#include "portablestorage/filesystem/IFile.hpp"
#include "portablestorage/platform/PlatformTypes.hpp"

namespace PortableStorage {

namespace Platform { 
    class StorageFile;
    class StorageProvider;
}

namespace Filesystem {
namespace Adapters {

/** 
 * Adapts a platform StorageFile to the uniform IFile contract
 * Like PlatformFolder, every operation re-checks the file exists first
 * and the returned deferred futures must not outlive this file
 */
class PlatformFile : public IFile
{
public:

    /**
     * @param provider the platform used for path lookups (must outlive this)
     * @param file the platform file to wrap
     */
    PlatformFile(Platform::StorageProvider& provider, std::unique_ptr<Platform::StorageFile> file);

    ~PlatformFile() override;
    DELETE_COPY(PlatformFile)
    DELETE_MOVE(PlatformFile)

    std::string GetName() const override;

    std::string GetPath() const override;

    std::future<std::unique_ptr<std::iostream>> OpenAsync(FileAccess access) override;

    std::future<void> DeleteAsync() override;

    std::future<void> RenameAsync(const std::string& newName, NameCollisionOption option) override;

    std::future<void> MoveAsync(const std::string& newPath, NameCollisionOption option) override;

    /** 
     * Maps a uniform access mode to the platform's
     * @throws InvalidArgumentException if the mode is not recognized
     */
    static Platform::FileAccessMode GetPlatformAccessMode(FileAccess access);

    /** 
     * Maps a uniform name collision option to the platform's
     * @throws InvalidArgumentException if the option is not recognized
     */
    static Platform::NameCollisionOption GetPlatformCollisionOption(NameCollisionOption option);

private:

    /** 
     * Looks up this file's path again on the platform
     * @throws FileNotFoundException if it no longer exists
     */
    void EnsureExists() const;

    Platform::StorageProvider& mProvider;
    const std::unique_ptr<Platform::StorageFile> mFile;

    mutable Debug mDebug;
};

} // namespace Adapters
} // namespace Filesystem
} // namespace PortableStorage

#endif // LIBPS_PLATFORMFILE_H_
