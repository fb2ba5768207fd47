/**
 * @file consts.h
 * @brief Taylix v1.0 - Numerical constants shared by the Taylor surrogates
 */
#ifndef TAYLIX_CONSTS_H
#define TAYLIX_CONSTS_H

#include <cmath>

namespace taylix {
namespace consts {

// Default tolerance for convergence checks.
constexpr double TOLERANCE = 5e-8;

// Machine epsilon for double precision.
constexpr double FLOAT_EPSILON = 2.220446049250313e-16;

/**
 * @brief Lipschitz constant reported by first-order surrogates
 *
 * The gradient of a linear surrogate is constant, so any positive value is valid.
 */
inline double taylor_lipschitz() { return std::sqrt(TOLERANCE); }

} // namespace consts
} // namespace taylix

#endif // TAYLIX_CONSTS_H
