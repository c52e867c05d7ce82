#pragma once

#include <stdexcept>
#include <string>

namespace intentcluster {

// Raised when eps or minPts are out of range; nothing has been computed yet
class InvalidParameter : public std::invalid_argument {
public:
    explicit InvalidParameter(const std::string& message)
        : std::invalid_argument(message) {}
};

} // namespace intentcluster
