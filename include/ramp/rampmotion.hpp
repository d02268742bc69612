/**
 * @file rampmotion.hpp
 * @brief Main RampMotion library header - includes all components
 */

#pragma once

// Motion profiles
#include "ramp/motion/motion.hpp"

// Utilities
#include "ramp/utils/utils.hpp"

/**
 * @namespace ramp
 * @brief RampMotion - closed-form motion profile generation
 *
 * RampMotion plans one-dimensional constant-acceleration profiles that a
 * feedback controller samples once per control cycle:
 * - Asymmetric trapezoid (separate acceleration and deceleration limits)
 * - Symmetric trapezoid with position-to-time lookup
 * - Step-wise trapezoid for targets that change every cycle
 *
 * @example Basic Usage:
 * @code
 * #include <ramp/rampmotion.hpp>
 *
 * ramp::motion::TrapezoidProfile profile(
 *     ramp::motion::TrapezoidConstraints(2.0, 4.0),
 *     ramp::motion::State(1.5, 0.0));
 *
 * // Control loop
 * double t = 0;
 * while (!profile.isFinished(t)) {
 *     ramp::motion::State setpoint = profile.sample(t);
 *     controller.update(setpoint.position, setpoint.velocity);
 *     t += 0.02;
 * }
 * @endcode
 */
namespace ramp {

/**
 * @brief Library version information
 */
struct Version {
    static constexpr int MAJOR = 1;
    static constexpr int MINOR = 0;
    static constexpr int PATCH = 0;

    static const char* getString() {
        return "1.0.0";
    }
};

/**
 * @brief Version string of the compiled library
 */
const char* getVersion();

}  // namespace ramp
