
#include <cerrno>
#include <system_error>
#include <unistd.h>

#include "LocalUtil.hpp"
#include "portablestorage/PlatformUtil.hpp"
#include "portablestorage/StringUtil.hpp"
#include "portablestorage/platform/PlatformException.hpp"

namespace fs = std::filesystem;

namespace PortableStorage {
namespace Platform {
namespace Local {

/*****************************************************/
std::string LocalUtil::NormalizePath(const std::string& path)
{
    std::error_code ec; // absolute() only fails if the cwd is gone
    fs::path retval { fs::absolute(path, ec) };
    if (ec) retval = path;

    std::string str { retval.lexically_normal().string() };
    while (str.size() > 1 && str.back() == '/') str.pop_back();
    return str;
}

/*****************************************************/
std::string LocalUtil::GetName(const std::string& path)
{
    return StringUtil::splitPath(path).second;
}

/*****************************************************/
ItemType LocalUtil::GetItemType(const fs::path& path)
{
    std::error_code ec;
    const fs::file_status status { fs::status(path, ec) };
    if (ec && ec.value() != ENOENT && ec.value() != ENOTDIR)
        ThrowError(ec.value(), path.string());

    if (fs::is_directory(status)) return ItemType::FOLDER;
    if (fs::exists(status)) return ItemType::FILE;
    return ItemType::NONE;
}

/*****************************************************/
void LocalUtil::ValidateName(const std::string& name)
{
    if (name.empty() || name == "." || name == ".." || name.find('/') != std::string::npos)
        throw PlatformException(EINVAL, "Invalid Name: "+name);
}

/*****************************************************/
std::string LocalUtil::UniqueName(const std::string& name, unsigned index, bool isFile)
{
    if (index <= 1) return name;

    const std::string suffix { " ("+std::to_string(index)+")" };
    if (!isFile) return name+suffix;

    const StringUtil::StringPair parts { StringUtil::splitExtension(name) };
    return parts.first+suffix+parts.second;
}

/*****************************************************/
fs::path LocalUtil::ClaimUnique(const fs::path& folder, const std::string& name, bool isFile, const ClaimFunc& claim)
{
    for (unsigned index { 1 }; index <= MAX_UNIQUE_TRIES; ++index)
    {
        const fs::path candidate { folder / UniqueName(name, index, isFile) };

        const int err { claim(candidate) };
        if (!err) return candidate;
        if (err != EEXIST) ThrowError(err, candidate.string());
    }

    ThrowError(EEXIST, (folder / name).string());
}

/*****************************************************/
int LocalUtil::MoveNoReplace(const fs::path& src, const fs::path& dest)
{
    // link() never replaces an existing dest
    if (::link(src.c_str(), dest.c_str()) == 0)
        return (::unlink(src.c_str()) == 0) ? 0 : errno;

    const int err { errno };
    if (err != EXDEV && err != EPERM) return err;

    // different device (or no hard links) - copy then remove
    std::error_code ec;
    fs::copy_file(src, dest, fs::copy_options::none, ec);
    if (ec) return ec.value();

    fs::remove(src, ec);
    return ec.value();
}

/*****************************************************/
int LocalUtil::MoveReplace(const fs::path& src, const fs::path& dest)
{
    std::error_code ec; 
    fs::rename(src, dest, ec);
    if (!ec || ec.value() != EXDEV) return ec.value();

    fs::copy_file(src, dest, fs::copy_options::overwrite_existing, ec);
    if (ec) return ec.value();

    fs::remove(src, ec);
    return ec.value();
}

/*****************************************************/
std::unique_ptr<std::fstream> LocalUtil::OpenStream(const std::string& path, std::ios_base::openmode mode)
{
    errno = 0;
    std::unique_ptr<std::fstream> stream { std::make_unique<std::fstream>(path, mode) };
    if (stream->is_open()) return stream;

    const int err { errno }; // set by the underlying open
    ThrowError((err != 0) ? err : EIO, path);
}

/*****************************************************/
void LocalUtil::ThrowError(int err, const std::string& path)
{
    if (err == ENOENT) throw NotFoundException(path);

    throw PlatformException(err, PlatformUtil::GetErrorString(err)+": "+path);
}

} // namespace Local
} // namespace Platform
} // namespace PortableStorage
