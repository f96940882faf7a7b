#ifndef LIBPS_FILEEXTENSIONS_H_
#define LIBPS_FILEEXTENSIONS_H_

#include <future>
#include <string>

namespace PortableStorage {
namespace Filesystem {

class IFile;

/** Whole-file convenience operations on top of IFile::OpenAsync() */
class FileExtensions
{
public:

    FileExtensions() = delete; // static only

    /** 
     * Reads the entire contents of the file as text
     * The file must outlive the returned future
     * @throws FileNotFoundException if the file no longer exists
     * @throws IOException if reading fails
     */
    static std::future<std::string> ReadAllTextAsync(IFile& file);

    /** 
     * Replaces the contents of the file with the given text
     * The file must outlive the returned future
     * @throws FileNotFoundException if the file no longer exists
     * @throws IOException if writing fails
     */
    static std::future<void> WriteAllTextAsync(IFile& file, const std::string& text);
};

} // namespace Filesystem
} // namespace PortableStorage

#endif // LIBPS_FILEEXTENSIONS_H_
