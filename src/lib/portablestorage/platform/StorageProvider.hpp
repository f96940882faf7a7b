#ifndef LIBPS_STORAGEPROVIDER_H_
#define LIBPS_STORAGEPROVIDER_H_

#include <future>
#include <memory>
#include <string>

#include "StorageFile.hpp"
#include "StorageFolder.hpp"

namespace PortableStorage {
namespace Platform {

/** Entry point of a platform storage subsystem, resolves paths to handles */
class StorageProvider
{
public:

    virtual ~StorageProvider() = default;

    /** Returns the existing folder at the given path (NotFoundException if absent) */
    virtual std::future<std::unique_ptr<StorageFolder>> GetFolderFromPathAsync(const std::string& path) = 0;

    /** Returns the existing file at the given path (NotFoundException if absent) */
    virtual std::future<std::unique_ptr<StorageFile>> GetFileFromPathAsync(const std::string& path) = 0;

    /** Returns the folder at the given path, creating it and its parents if needed */
    virtual std::future<std::unique_ptr<StorageFolder>> CreateFolderPathAsync(const std::string& path) = 0;
};

} // namespace Platform
} // namespace PortableStorage

#endif // LIBPS_STORAGEPROVIDER_H_
