#pragma once

#include <stdexcept>
#include <string>

namespace tl {

// Rate, corner or iteration input rejected before any simulation runs.
class InvalidParameterError : public std::invalid_argument {
public:
    explicit InvalidParameterError(const std::string& what) : std::invalid_argument(what) {}
};

// Decimal odds that cannot be turned into an implied probability.
class InvalidOddsError : public std::invalid_argument {
public:
    explicit InvalidOddsError(const std::string& what) : std::invalid_argument(what) {}
};

} // namespace tl
