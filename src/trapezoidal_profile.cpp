/**
 * @file trapezoidal_profile.cpp
 * @brief Symmetric trapezoidal velocity profile
 */

#include "ramp/motion/trapezoidal_profile.hpp"

namespace ramp::motion {

TrapezoidProfile::TrapezoidProfile(const TrapezoidConstraints& constraints,
                                   const State& target,
                                   const State& initial)
    : AsymmetricTrapezoidProfile(constraints.toAsymmetric(), target, initial)
    , trapezoidConstraints_(constraints)
{
}

}  // namespace ramp::motion
