#ifndef LIBPS_IFILESYSTEM_H_
#define LIBPS_IFILESYSTEM_H_

#include <future>
#include <memory>
#include <string>

#include "IFile.hpp"
#include "IFolder.hpp"

namespace PortableStorage {
namespace Filesystem {

/** Entry point to a uniform filesystem and its application storage roots */
class IFileSystem
{
public:

    virtual ~IFileSystem() = default;

    /** Returns the folder for local (per-machine) application data */
    virtual std::unique_ptr<IFolder> LocalStorage() = 0;

    /** Returns the folder for roaming (per-user) application data */
    virtual std::unique_ptr<IFolder> RoamingStorage() = 0;

    /** Returns the file at the given path, or nullptr if it does not exist */
    virtual std::future<std::unique_ptr<IFile>> GetFileFromPathAsync(const std::string& path) = 0;

    /** Returns the folder at the given path, or nullptr if it does not exist */
    virtual std::future<std::unique_ptr<IFolder>> GetFolderFromPathAsync(const std::string& path) = 0;
};

} // namespace Filesystem
} // namespace PortableStorage

#endif // LIBPS_IFILESYSTEM_H_
