#pragma once

#include <stdexcept>
#include <string>

namespace selforg {

// Raised when a list is built (or re-pointed) with settings it cannot run
// with: zero capacity or no strategy. Every other list operation is total.
class InvalidConfiguration : public std::invalid_argument {
public:
    explicit InvalidConfiguration(const std::string& what)
        : std::invalid_argument("invalid configuration: " + what) {}
};

} // namespace selforg
