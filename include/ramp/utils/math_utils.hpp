/**
 * @file math_utils.hpp
 * @brief Scalar helpers shared by the profile planners
 */

#pragma once

#include <cmath>
#include <limits>

namespace ramp::utils {

/**
 * @brief One root of a*x^2 + b*x + c = 0
 * @param a Quadratic coefficient (must be nonzero)
 * @param b Linear coefficient
 * @param c Constant coefficient
 * @param rootSign +1 selects (-b + sqrt(d)) / 2a, -1 selects (-b - sqrt(d)) / 2a
 * @return Selected root, NaN if the discriminant is negative
 */
inline double solveQuadraticRoot(double a, double b, double c, double rootSign) {
    double discriminant = b * b - 4.0 * a * c;
    if (discriminant < 0) {
        return std::numeric_limits<double>::quiet_NaN();
    }
    return (-b + rootSign * std::sqrt(discriminant)) / (2.0 * a);
}

/**
 * @brief Time for constant-acceleration motion to cover a displacement
 *
 * Solves dx = v0*t + 0.5*a*t^2 for t. With a == 0 this is dx / v0.
 *
 * @param displacement Signed distance to cover
 * @param initialVelocity Velocity at t = 0
 * @param acceleration Constant acceleration
 * @param direction +1 or -1, direction of travel
 * @return Elapsed time, NaN if the displacement is never reached
 */
inline double timeToCover(double displacement, double initialVelocity,
                          double acceleration, double direction) {
    if (acceleration == 0) {
        if (initialVelocity == 0) {
            return std::numeric_limits<double>::quiet_NaN();
        }
        return displacement / initialVelocity;
    }
    double radicand = initialVelocity * initialVelocity + 2.0 * acceleration * displacement;
    if (radicand < 0) {
        // Rounding at a ramp's turning point can push this just below zero
        if (radicand > -1e-12) {
            radicand = 0;
        } else {
            return std::numeric_limits<double>::quiet_NaN();
        }
    }
    return (-initialVelocity + direction * std::sqrt(radicand)) / acceleration;
}

}  // namespace ramp::utils
