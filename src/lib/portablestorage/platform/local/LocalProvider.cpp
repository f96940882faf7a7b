
#include <cerrno>
#include <filesystem>
#include <system_error>

#include "LocalFile.hpp"
#include "LocalFolder.hpp"
#include "LocalProvider.hpp"
#include "LocalUtil.hpp"
#include "portablestorage/platform/PlatformException.hpp"

namespace fs = std::filesystem;

namespace PortableStorage {
namespace Platform {
namespace Local {

/*****************************************************/
LocalProvider::LocalProvider() : mDebug(__func__,this)
{
    MDBG_INFO("()");
}

/*****************************************************/
std::future<std::unique_ptr<StorageFolder>> LocalProvider::GetFolderFromPathAsync(const std::string& path)
{
    MDBG_PLATFORM("(path:" << path << ")");

    return std::async(std::launch::async, [path]()->std::unique_ptr<StorageFolder>
    {
        if (path.empty() || LocalUtil::GetItemType(path) != ItemType::FOLDER)
            throw NotFoundException(path);

        return std::make_unique<LocalFolder>(path);
    });
}

/*****************************************************/
std::future<std::unique_ptr<StorageFile>> LocalProvider::GetFileFromPathAsync(const std::string& path)
{
    MDBG_PLATFORM("(path:" << path << ")");

    return std::async(std::launch::async, [path]()->std::unique_ptr<StorageFile>
    {
        if (path.empty() || LocalUtil::GetItemType(path) != ItemType::FILE)
            throw NotFoundException(path);

        return std::make_unique<LocalFile>(path);
    });
}

/*****************************************************/
std::future<std::unique_ptr<StorageFolder>> LocalProvider::CreateFolderPathAsync(const std::string& path)
{
    MDBG_PLATFORM("(path:" << path << ")");

    return std::async(std::launch::async, [path]()->std::unique_ptr<StorageFolder>
    {
        if (path.empty()) throw PlatformException(EINVAL, "Empty Path");

        std::error_code ec; fs::create_directories(path, ec);
        if (ec) LocalUtil::ThrowError(ec.value(), path);

        if (LocalUtil::GetItemType(path) != ItemType::FOLDER)
            LocalUtil::ThrowError(ENOTDIR, path);

        return std::make_unique<LocalFolder>(path);
    });
}

} // namespace Local
} // namespace Platform
} // namespace PortableStorage
