/**
 * @file errors.h
 * @brief Taylix v1.0 - Exception types raised by the Taylor wrapping engine
 */
#ifndef TAYLIX_ERRORS_H
#define TAYLIX_ERRORS_H

#include <stdexcept>
#include <string>

namespace taylix {

/**
 * @brief Raised when wrapping a function that already is a Taylor surrogate
 */
class DoubleWrapError : public std::runtime_error {
public:
    DoubleWrapError()
        : std::runtime_error("The function appears to already be a Taylor approximation") {}
};

/**
 * @brief Raised for block indices or composite layouts that do not fit
 */
class StructureError : public std::invalid_argument {
public:
    explicit StructureError(const std::string& what) : std::invalid_argument(what) {}
};

} // namespace taylix

#endif // TAYLIX_ERRORS_H
