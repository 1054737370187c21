#pragma once

#include <stdexcept>
#include <string>

namespace udmis {

// Raised for rejected construction arguments, temperatures and external samples
class InvalidInputError : public std::invalid_argument {
public:
    explicit InvalidInputError(const std::string& what)
        : std::invalid_argument(what) {}
};

}  // namespace udmis
