#pragma once

#include <stdexcept>
#include <string>

namespace groundwork {

// Missing collection or structurally invalid configuration. Never retried.
class ConfigurationError : public std::runtime_error {
public:
    explicit ConfigurationError(const std::string& message)
        : std::runtime_error("configuration error: " + message) {}
};

} // namespace groundwork
