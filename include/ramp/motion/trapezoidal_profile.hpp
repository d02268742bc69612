/**
 * @file trapezoidal_profile.hpp
 * @brief Symmetric trapezoidal velocity profile
 */

#pragma once

#include "asymmetric_trapezoid_profile.hpp"
#include <cmath>
#include <ostream>

namespace ramp::motion {

/**
 * @brief Limits for a profile that accelerates and decelerates at one rate
 */
struct TrapezoidConstraints {
    double maxVelocity = 1.0;
    double maxAcceleration = 1.0;  // Used for both ramps

    TrapezoidConstraints() = default;
    TrapezoidConstraints(double maxVel, double maxAccel)
        : maxVelocity(maxVel), maxAcceleration(maxAccel) {}

    /**
     * @brief Equivalent asymmetric limits
     */
    ProfileConstraints toAsymmetric() const {
        return ProfileConstraints(maxVelocity, maxAcceleration, maxAcceleration);
    }

    bool validate() const { return toAsymmetric().validate(); }

    bool operator==(const TrapezoidConstraints& other) const {
        return std::abs(maxVelocity - other.maxVelocity) < kStateEpsilon &&
               std::abs(maxAcceleration - other.maxAcceleration) < kStateEpsilon;
    }

    bool operator!=(const TrapezoidConstraints& other) const { return !(*this == other); }
};

inline std::ostream& operator<<(std::ostream& os, const TrapezoidConstraints& c) {
    return os << "TrapezoidConstraints[maxVelocity: " << c.maxVelocity
              << ", maxAcceleration: " << c.maxAcceleration << "]";
}

/**
 * @brief Trapezoidal velocity profile (T-curve)
 *
 * Special case of AsymmetricTrapezoidProfile where both ramps share the
 * same acceleration limit.
 */
class TrapezoidProfile : public AsymmetricTrapezoidProfile {
public:
    /**
     * @brief Plan a profile
     * @param constraints Velocity and acceleration limits
     * @param target State to reach when the profile finishes
     * @param initial State to start from
     * @throws std::invalid_argument on invalid limits or endpoints
     * @throws std::domain_error if the inputs admit no finite profile
     */
    TrapezoidProfile(const TrapezoidConstraints& constraints,
                     const State& target,
                     const State& initial = State(0, 0));

    ~TrapezoidProfile() override = default;

    const TrapezoidConstraints& getTrapezoidConstraints() const { return trapezoidConstraints_; }

private:
    TrapezoidConstraints trapezoidConstraints_;
};

}  // namespace ramp::motion
