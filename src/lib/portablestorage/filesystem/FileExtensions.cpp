
#include <iostream>
#include <memory>
#include <sstream>

#include "FileExtensions.hpp"
#include "IFile.hpp"

namespace PortableStorage {
namespace Filesystem {

/*****************************************************/
std::future<std::string> FileExtensions::ReadAllTextAsync(IFile& file)
{
    return std::async(std::launch::deferred, [&file]()->std::string
    {
        const std::unique_ptr<std::iostream> stream { file.OpenAsync(FileAccess::Read).get() };

        std::ostringstream output; 
        if (stream->peek() != std::char_traits<char>::eof())
            output << stream->rdbuf();

        if (stream->bad())
            throw IOException("Read failed: "+file.GetPath());
        return output.str();
    });
}

/*****************************************************/
std::future<void> FileExtensions::WriteAllTextAsync(IFile& file, const std::string& text)
{
    return std::async(std::launch::deferred, [&file, text]()
    {
        const std::unique_ptr<std::iostream> stream { file.OpenAsync(FileAccess::Overwrite).get() };

        stream->write(text.data(), static_cast<std::streamsize>(text.size()));
        stream->flush();

        if (!stream->good())
            throw IOException("Write failed: "+file.GetPath());
    });
}

} // namespace Filesystem
} // namespace PortableStorage
