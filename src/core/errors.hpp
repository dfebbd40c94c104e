#pragma once

#include <stdexcept>
#include <string>

// Raised for caller/programming errors: unsupported sources, relative
// destinations, unsafe remove requests. Transport failures never throw.
class CpConfigError : public std::invalid_argument {
public:
    explicit CpConfigError(const std::string& what)
        : std::invalid_argument(what) {}
};
