#ifndef LIBPS_LOCALFILE_H_
#define LIBPS_LOCALFILE_H_

#include <filesystem>
#include <mutex>
#include <string>

#include "portablestorage/common.hpp"
#include "portablestorage/Debug.hpp"
#include "portablestorage/platform/StorageFile.hpp"

namespace PortableStorage {
namespace Platform {
namespace Local {

/** 
 * A file on the local POSIX filesystem
 * Each operation runs as its own async task, THREAD SAFE
 * Rename/Move tasks update this handle, so it must outlive their futures
 */
class LocalFile : public StorageFile
{
public:

    /** @param path path of the (existing) file */
    explicit LocalFile(const std::string& path);

    ~LocalFile() override = default;
    DELETE_COPY(LocalFile)
    DELETE_MOVE(LocalFile)

    std::string GetName() const override;

    std::string GetPath() const override;

    std::future<std::unique_ptr<std::iostream>> OpenAsync(FileAccessMode mode) override;

    std::future<void> DeleteAsync() override;

    std::future<void> RenameAsync(const std::string& desiredName, NameCollisionOption option) override;

    std::future<void> MoveAsync(const StorageFolder& destination, 
        const std::string& desiredName, NameCollisionOption option) override;

private:

    /** 
     * Moves the file to desiredName in folder, then points this handle at it
     * @throws NotFoundException if the file or folder is missing
     * @throws PlatformException with EEXIST on a collision with FailIfExists
     */
    void MoveTo(const std::filesystem::path& folder, const std::string& desiredName, NameCollisionOption option);

    /** Protects mPath */
    mutable std::mutex mMutex;
    /** Current normalized path of the file */
    std::string mPath;

    mutable Debug mDebug;
};

} // namespace Local
} // namespace Platform
} // namespace PortableStorage

#endif // LIBPS_LOCALFILE_H_
