#ifndef CRYSTAL_CONFIG_ERROR_HPP
#define CRYSTAL_CONFIG_ERROR_HPP

#include <stdexcept>
#include <string>

namespace crystal::config {

class ConfigurationError : public std::runtime_error {
public:
    explicit ConfigurationError(const std::string& message)
        : std::runtime_error("Configuration error: " + message) {}
};

} // namespace crystal::config

#endif // CRYSTAL_CONFIG_ERROR_HPP
