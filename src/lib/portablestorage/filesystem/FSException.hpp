#ifndef LIBPS_FSEXCEPTION_H_
#define LIBPS_FSEXCEPTION_H_

#include <string>

#include "portablestorage/BaseException.hpp"

namespace PortableStorage {
namespace Filesystem {

/** Base Exception for all uniform filesystem errors */
class Exception : public BaseException { public:
    /** @param message filesystem error string */
    explicit Exception(const std::string& message) :
        BaseException("Filesystem Error: "+message) {}; };

/** Exception indicating a folder does not exist (or no longer exists) */
class DirectoryNotFoundException : public Exception { public:
    /** @param details the underlying error message */
    explicit DirectoryNotFoundException(const std::string& details) :
        Exception("Directory Not Found: "+details) {}; };

/** Exception indicating a file does not exist (or no longer exists) */
class FileNotFoundException : public Exception { public:
    /** @param details the underlying error message */
    explicit FileNotFoundException(const std::string& details) :
        Exception("File Not Found: "+details) {}; };

/** Exception indicating a storage I/O operation failed */
class IOException : public Exception { public:
    using Exception::Exception; };

/** Exception indicating the item to create/rename already exists */
class AlreadyExistsException : public IOException { public:
    /** @param details the underlying error message */
    explicit AlreadyExistsException(const std::string& details) :
        IOException("Already Exists: "+details) {}; };

/** Exception indicating a protected root folder was to be deleted (not retryable) */
class RootDeletionException : public IOException { public:
    RootDeletionException() : 
        IOException("Cannot delete root storage folder") {}; };

/** Exception indicating an invalid argument value (a programming error) */
class InvalidArgumentException : public Exception { public:
    /** @param details description of the bad argument */
    explicit InvalidArgumentException(const std::string& details) :
        Exception("Invalid Argument: "+details) {}; };

} // namespace Filesystem
} // namespace PortableStorage

#endif // LIBPS_FSEXCEPTION_H_
