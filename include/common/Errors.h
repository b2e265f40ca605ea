#pragma once

#include <stdexcept>
#include <string>

namespace exitforge {

// Raised before any simulation runs when a policy, grid or strategy definition
// cannot produce a meaningful result. The only error surfaced to callers.
class InvalidConfigurationError : public std::runtime_error {
public:
    explicit InvalidConfigurationError(const std::string& what)
        : std::runtime_error("invalid configuration: " + what) {}
};

} // namespace exitforge
