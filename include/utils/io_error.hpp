#ifndef CRYSTAL_UTILS_IO_ERROR_HPP
#define CRYSTAL_UTILS_IO_ERROR_HPP

#include <stdexcept>
#include <string>

namespace crystal {

// Raised when a file or node location cannot be read or written.
// Node-level I/O errors are considered transient and may be retried.
class IOError : public std::runtime_error {
public:
    explicit IOError(const std::string& message)
        : std::runtime_error(message) {}
};

} // namespace crystal

#endif // CRYSTAL_UTILS_IO_ERROR_HPP
