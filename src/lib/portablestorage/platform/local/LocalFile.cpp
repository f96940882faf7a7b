
#include <cerrno>
#include <fstream>
#include <system_error>

#include "LocalFile.hpp"
#include "LocalUtil.hpp"
#include "portablestorage/platform/PlatformException.hpp"
#include "portablestorage/platform/StorageFolder.hpp"

namespace fs = std::filesystem;

namespace PortableStorage {
namespace Platform {
namespace Local {

/*****************************************************/
LocalFile::LocalFile(const std::string& path) :
    mPath(LocalUtil::NormalizePath(path)), mDebug(__func__,this)
{
    MDBG_INFO("(path:" << mPath << ")");
}

/*****************************************************/
std::string LocalFile::GetName() const
{
    return LocalUtil::GetName(GetPath());
}

/*****************************************************/
std::string LocalFile::GetPath() const
{
    const std::lock_guard<std::mutex> lock(mMutex);
    return mPath;
}

/*****************************************************/
std::future<std::unique_ptr<std::iostream>> LocalFile::OpenAsync(FileAccessMode mode)
{
    const std::string path { GetPath() };
    MDBG_PLATFORM("(path:" << path << " mode:" << static_cast<int>(mode) << ")");

    return std::async(std::launch::async, [path, mode]()->std::unique_ptr<std::iostream>
    {
        if (LocalUtil::GetItemType(path) != ItemType::FILE)
            throw NotFoundException(path);

        std::ios_base::openmode omode { std::ios::in | std::ios::binary };
        switch (mode)
        {
            case FileAccessMode::Read: break;
            case FileAccessMode::ReadWrite: omode |= std::ios::out; break;
            case FileAccessMode::Truncate: omode |= std::ios::out | std::ios::trunc; break;
            default: throw PlatformException(EINVAL, "Invalid Access Mode");
        }

        return LocalUtil::OpenStream(path, omode);
    });
}

/*****************************************************/
std::future<void> LocalFile::DeleteAsync()
{
    const std::string path { GetPath() };
    MDBG_PLATFORM("(path:" << path << ")");

    return std::async(std::launch::async, [path]()
    {
        if (LocalUtil::GetItemType(path) != ItemType::FILE)
            throw NotFoundException(path);

        std::error_code ec; fs::remove(path, ec);
        if (ec) LocalUtil::ThrowError(ec.value(), path);
    });
}

/*****************************************************/
std::future<void> LocalFile::RenameAsync(const std::string& desiredName, NameCollisionOption option)
{
    MDBG_PLATFORM("(path:" << GetPath() << " name:" << desiredName << ")");

    return std::async(std::launch::async, [this, desiredName, option]()
    {
        LocalUtil::ValidateName(desiredName);
        MoveTo(fs::path(GetPath()).parent_path(), desiredName, option);
    });
}

/*****************************************************/
std::future<void> LocalFile::MoveAsync(const StorageFolder& destination, 
    const std::string& desiredName, NameCollisionOption option)
{
    const std::string folder { destination.GetPath() };
    MDBG_PLATFORM("(path:" << GetPath() << " folder:" << folder << " name:" << desiredName << ")");

    return std::async(std::launch::async, [this, folder, desiredName, option]()
    {
        LocalUtil::ValidateName(desiredName);
        MoveTo(folder, desiredName, option);
    });
}

/*****************************************************/
void LocalFile::MoveTo(const fs::path& folder, const std::string& desiredName, NameCollisionOption option)
{
    const fs::path src { GetPath() };

    if (LocalUtil::GetItemType(src) != ItemType::FILE)
        throw NotFoundException(src.string());
    if (LocalUtil::GetItemType(folder) != ItemType::FOLDER)
        throw NotFoundException(folder.string());

    fs::path dest { folder / desiredName };
    if (dest == src) return; // already there

    switch (option)
    {
        case NameCollisionOption::GenerateUniqueName:
        {
            dest = LocalUtil::ClaimUnique(folder, desiredName, true,
                [&](const fs::path& candidate){ return LocalUtil::MoveNoReplace(src, candidate); });
            break;
        }
        case NameCollisionOption::ReplaceExisting:
        {
            if (LocalUtil::GetItemType(dest) == ItemType::FOLDER)
                LocalUtil::ThrowError(EISDIR, dest.string());
            if (const int err { LocalUtil::MoveReplace(src, dest) }; err)
                LocalUtil::ThrowError(err, dest.string());
            break;
        }
        case NameCollisionOption::FailIfExists:
        {
            if (const int err { LocalUtil::MoveNoReplace(src, dest) }; err)
                LocalUtil::ThrowError(err, dest.string());
            break;
        }
        default: throw PlatformException(EINVAL, "Invalid NameCollisionOption");
    }

    MDBG_INFO("... moved to:" << dest.string());

    const std::lock_guard<std::mutex> lock(mMutex);
    mPath = LocalUtil::NormalizePath(dest.string());
}

} // namespace Local
} // namespace Platform
} // namespace PortableStorage
