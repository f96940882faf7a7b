#ifndef LIBPS_PLATFORMEXCEPTION_H_
#define LIBPS_PLATFORMEXCEPTION_H_

#include <cerrno>
#include <string>

#include "portablestorage/BaseException.hpp"

namespace PortableStorage {
namespace Platform {

/** 
 * Base Exception for all native storage failures
 * Carries the native numeric status (errno vocabulary) of the failure
 */
class PlatformException : public BaseException { public:
    /** 
     * @param status native status code for the failure
     * @param message platform error string
     */
    PlatformException(int status, const std::string& message) :
        BaseException("Platform Error: "+message), mStatus(status) {};

    /** Returns the native status code of the failure */
    int GetStatus() const { return mStatus; }

private:
    int mStatus; };

/** Exception indicating the requested file or folder does not exist */
class NotFoundException : public PlatformException { public:
    /** @param path the path that was not found */
    explicit NotFoundException(const std::string& path) :
        PlatformException(ENOENT, "Not Found: "+path) {}; };

} // namespace Platform
} // namespace PortableStorage

#endif // LIBPS_PLATFORMEXCEPTION_H_
