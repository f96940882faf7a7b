#ifndef LIBPS_BASEEXCEPTION_H_
#define LIBPS_BASEEXCEPTION_H_

#include <stdexcept>

namespace PortableStorage {

/** Base Exception for all PortableStorage errors (uniform and platform) */
class BaseException : public std::runtime_error 
{ 
    using std::runtime_error::runtime_error; 
};

} // namespace PortableStorage

#endif // LIBPS_BASEEXCEPTION_H_
