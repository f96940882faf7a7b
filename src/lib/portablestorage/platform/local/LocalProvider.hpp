#ifndef LIBPS_LOCALPROVIDER_H_
#define LIBPS_LOCALPROVIDER_H_

#include "portablestorage/common.hpp"
#include "portablestorage/Debug.hpp"
#include "portablestorage/platform/StorageProvider.hpp"

namespace PortableStorage {
namespace Platform {
namespace Local {

/** Storage provider for the local POSIX filesystem, THREAD SAFE */
class LocalProvider : public StorageProvider
{
public:

    LocalProvider();
    ~LocalProvider() override = default;
    DELETE_COPY(LocalProvider)
    DELETE_MOVE(LocalProvider)

    std::future<std::unique_ptr<StorageFolder>> GetFolderFromPathAsync(const std::string& path) override;

    std::future<std::unique_ptr<StorageFile>> GetFileFromPathAsync(const std::string& path) override;

    std::future<std::unique_ptr<StorageFolder>> CreateFolderPathAsync(const std::string& path) override;

private:

    mutable Debug mDebug;
};

} // namespace Local
} // namespace Platform
} // namespace PortableStorage

#endif // LIBPS_LOCALPROVIDER_H_
