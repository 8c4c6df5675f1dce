#pragma once

#include <stdexcept>
#include <string>

namespace libkinship {

// Raised when a matrix or output buffer does not have the dimensions an
// operation requires.
class ShapeMismatchError : public std::invalid_argument {
public:
    explicit ShapeMismatchError(const std::string& message) : std::invalid_argument(message) {}
};

}  // namespace libkinship
