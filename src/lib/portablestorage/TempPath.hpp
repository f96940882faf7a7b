#ifndef LIBPS_TEMPPATH_H_
#define LIBPS_TEMPPATH_H_

#include <filesystem>
#include <string>
#include <system_error>

#include "common.hpp"
#include "StringUtil.hpp"

namespace PortableStorage {

/** Auto-deleting temporary path, removed recursively at destruct */
class TempPath
{
public:

    /** 
     * Create a temp path with the given suffix
     * @param create if true, create the path as a directory
     */
    explicit TempPath(const std::string& suffix, bool create = false) :
        mPath(std::filesystem::temp_directory_path().string()+"/ps_"
            +StringUtil::Random(16)+"_"+suffix)
    {
        if (create) std::filesystem::create_directory(mPath);
    }

    virtual ~TempPath()
    {
        std::error_code ec; // no throwing from destructor
        std::filesystem::remove_all(mPath, ec);
    }
    DELETE_COPY(TempPath)
    DELETE_MOVE(TempPath)

    /** returns the temporary path generated */
    [[nodiscard]] const std::string& Get() const { return mPath; }

private:
    // path to the temporary file or folder
    const std::string mPath;
};

} // namespace PortableStorage

#endif // LIBPS_TEMPPATH_H_
