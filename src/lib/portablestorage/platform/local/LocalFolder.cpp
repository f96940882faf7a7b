
#include <algorithm>
#include <cerrno>
#include <filesystem>
#include <system_error>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include "LocalFile.hpp"
#include "LocalFolder.hpp"
#include "LocalUtil.hpp"
#include "portablestorage/platform/PlatformException.hpp"

namespace fs = std::filesystem;

namespace PortableStorage {
namespace Platform {
namespace Local {

namespace {

/** Creates a file with the given open flags, returns 0 or an errno */
int OpenCreate(const fs::path& path, int flags)
{
    const int fd { ::open(path.c_str(), flags | O_CREAT | O_WRONLY | O_CLOEXEC, 0644) }; // NOLINT(*-vararg)
    if (fd < 0) return errno;

    ::close(fd); return 0;
}

/** Creates a directory, returns 0 or an errno */
int MakeDir(const fs::path& path)
{
    return (::mkdir(path.c_str(), 0755) == 0) ? 0 : errno;
}

/** Throws NotFoundException unless the folder at path exists */
void RequireFolder(const std::string& path)
{
    if (LocalUtil::GetItemType(path) != ItemType::FOLDER)
        throw NotFoundException(path);
}

} // namespace

/*****************************************************/
LocalFolder::LocalFolder(const std::string& path) :
    mPath(LocalUtil::NormalizePath(path)), 
    mName(LocalUtil::GetName(mPath)), mDebug(__func__,this)
{
    MDBG_INFO("(path:" << mPath << ")");
}

/*****************************************************/
std::future<std::unique_ptr<StorageFile>> LocalFolder::CreateFileAsync(
    const std::string& desiredName, CreationCollisionOption option)
{
    MDBG_PLATFORM("(path:" << mPath << " name:" << desiredName << ")");

    return std::async(std::launch::async, [path=mPath, desiredName, option]()->std::unique_ptr<StorageFile>
    {
        LocalUtil::ValidateName(desiredName);
        RequireFolder(path);

        fs::path target { fs::path(path) / desiredName };
        switch (option)
        {
            case CreationCollisionOption::GenerateUniqueName:
            {
                target = LocalUtil::ClaimUnique(path, desiredName, true,
                    [](const fs::path& candidate){ return OpenCreate(candidate, O_EXCL); });
                break;
            }
            case CreationCollisionOption::ReplaceExisting:
            {
                if (const int err { OpenCreate(target, O_TRUNC) }; err)
                    LocalUtil::ThrowError(err, target.string());
                break;
            }
            case CreationCollisionOption::FailIfExists:
            {
                if (const int err { OpenCreate(target, O_EXCL) }; err)
                    LocalUtil::ThrowError(err, target.string());
                break;
            }
            case CreationCollisionOption::OpenIfExists:
            {
                if (const int err { OpenCreate(target, 0) }; err)
                    LocalUtil::ThrowError(err, target.string());
                break;
            }
            default: throw PlatformException(EINVAL, "Invalid CreationCollisionOption");
        }

        return std::make_unique<LocalFile>(target.string());
    });
}

/*****************************************************/
std::future<std::unique_ptr<StorageFile>> LocalFolder::GetFileAsync(const std::string& name)
{
    MDBG_PLATFORM("(path:" << mPath << " name:" << name << ")");

    return std::async(std::launch::async, [path=mPath, name]()->std::unique_ptr<StorageFile>
    {
        LocalUtil::ValidateName(name);

        const fs::path target { fs::path(path) / name };
        if (LocalUtil::GetItemType(target) != ItemType::FILE)
            throw NotFoundException(target.string());

        return std::make_unique<LocalFile>(target.string());
    });
}

/*****************************************************/
std::future<StorageFolder::FileList> LocalFolder::GetFilesAsync()
{
    MDBG_PLATFORM("(path:" << mPath << ")");

    return std::async(std::launch::async, [path=mPath]()->FileList
    {
        RequireFolder(path);

        std::vector<std::string> paths;
        std::error_code ec; fs::directory_iterator it(path, ec);
        for (; !ec && it != fs::directory_iterator(); it.increment(ec))
        {
            std::error_code tec; // broken entries are skipped
            if (!it->is_directory(tec) && it->exists(tec))
                paths.push_back(it->path().string());
        }
        if (ec) LocalUtil::ThrowError(ec.value(), path);

        std::sort(paths.begin(), paths.end());

        FileList files;
        for (const std::string& fpath : paths)
            files.emplace_back(std::make_unique<LocalFile>(fpath));
        return files;
    });
}

/*****************************************************/
std::future<std::unique_ptr<StorageFolder>> LocalFolder::CreateFolderAsync(
    const std::string& desiredName, CreationCollisionOption option)
{
    MDBG_PLATFORM("(path:" << mPath << " name:" << desiredName << ")");

    return std::async(std::launch::async, [path=mPath, desiredName, option]()->std::unique_ptr<StorageFolder>
    {
        LocalUtil::ValidateName(desiredName);
        RequireFolder(path);

        fs::path target { fs::path(path) / desiredName };
        switch (option)
        {
            case CreationCollisionOption::GenerateUniqueName:
            {
                target = LocalUtil::ClaimUnique(path, desiredName, false, MakeDir);
                break;
            }
            case CreationCollisionOption::ReplaceExisting:
            {
                if (LocalUtil::GetItemType(target) == ItemType::FOLDER)
                {
                    std::error_code ec; fs::remove_all(target, ec);
                    if (ec) LocalUtil::ThrowError(ec.value(), target.string());
                }
                if (const int err { MakeDir(target) }; err)
                    LocalUtil::ThrowError(err, target.string());
                break;
            }
            case CreationCollisionOption::FailIfExists:
            {
                if (const int err { MakeDir(target) }; err)
                    LocalUtil::ThrowError(err, target.string());
                break;
            }
            case CreationCollisionOption::OpenIfExists:
            {
                const int err { MakeDir(target) };
                if (err && (err != EEXIST || LocalUtil::GetItemType(target) != ItemType::FOLDER))
                    LocalUtil::ThrowError(err, target.string());
                break;
            }
            default: throw PlatformException(EINVAL, "Invalid CreationCollisionOption");
        }

        return std::make_unique<LocalFolder>(target.string());
    });
}

/*****************************************************/
std::future<std::unique_ptr<StorageFolder>> LocalFolder::GetFolderAsync(const std::string& name)
{
    MDBG_PLATFORM("(path:" << mPath << " name:" << name << ")");

    return std::async(std::launch::async, [path=mPath, name]()->std::unique_ptr<StorageFolder>
    {
        LocalUtil::ValidateName(name);

        const fs::path target { fs::path(path) / name };
        RequireFolder(target.string());

        return std::make_unique<LocalFolder>(target.string());
    });
}

/*****************************************************/
std::future<StorageFolder::FolderList> LocalFolder::GetFoldersAsync()
{
    MDBG_PLATFORM("(path:" << mPath << ")");

    return std::async(std::launch::async, [path=mPath]()->FolderList
    {
        RequireFolder(path);

        std::vector<std::string> paths;
        std::error_code ec; fs::directory_iterator it(path, ec);
        for (; !ec && it != fs::directory_iterator(); it.increment(ec))
        {
            std::error_code tec;
            if (it->is_directory(tec))
                paths.push_back(it->path().string());
        }
        if (ec) LocalUtil::ThrowError(ec.value(), path);

        std::sort(paths.begin(), paths.end());

        FolderList folders;
        for (const std::string& fpath : paths)
            folders.emplace_back(std::make_unique<LocalFolder>(fpath));
        return folders;
    });
}

/*****************************************************/
std::future<ItemType> LocalFolder::TryGetItemTypeAsync(const std::string& name)
{
    MDBG_PLATFORM("(path:" << mPath << " name:" << name << ")");

    return std::async(std::launch::async, [path=mPath, name]()->ItemType
    {
        LocalUtil::ValidateName(name);
        RequireFolder(path);

        return LocalUtil::GetItemType(fs::path(path) / name);
    });
}

/*****************************************************/
std::future<void> LocalFolder::DeleteAsync()
{
    MDBG_PLATFORM("(path:" << mPath << ")");

    return std::async(std::launch::async, [path=mPath]()
    {
        RequireFolder(path);

        std::error_code ec; fs::remove_all(path, ec);
        if (ec) LocalUtil::ThrowError(ec.value(), path);
    });
}

} // namespace Local
} // namespace Platform
} // namespace PortableStorage
