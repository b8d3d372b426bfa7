#pragma once

#include <stdexcept>
#include <string>

namespace tradepulse {

// Parameter value outside its declared range.
class ConfigError : public std::invalid_argument {
public:
    explicit ConfigError(const std::string& what) : std::invalid_argument(what) {}
};

// Candle series rejected before any computation (ordering, missing values).
class InputValidationError : public std::invalid_argument {
public:
    explicit InputValidationError(const std::string& what) : std::invalid_argument(what) {}
};

} // namespace tradepulse
