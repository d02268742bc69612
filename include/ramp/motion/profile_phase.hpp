/**
 * @file profile_phase.hpp
 * @brief Constant-acceleration segment of a motion profile
 */

#pragma once

#include "trajectory.hpp"
#include <ostream>

namespace ramp::motion {

/**
 * @brief One constant-acceleration interval of a profile
 *
 * A phase with zero acceleration is a coast. Phases are immutable once
 * built. Units are free as long as they agree (time in seconds,
 * displacement in position units).
 */
class ProfilePhase {
public:
    /**
     * @brief Construct from all four quantities
     * @param duration Length of the phase (seconds, >= 0)
     * @param displacement Net position change over the phase
     * @param acceleration Constant acceleration (0 for a coast)
     * @param initialVelocity Velocity at the start of the phase
     */
    ProfilePhase(double duration, double displacement,
                 double acceleration, double initialVelocity);

    /**
     * @brief Construct from rates, deriving the displacement
     * @param acceleration Constant acceleration
     * @param initialVelocity Velocity at the start of the phase
     * @param duration Length of the phase (seconds)
     */
    static ProfilePhase fromRates(double acceleration, double initialVelocity, double duration);

    double getDuration() const { return duration_; }
    double getDisplacement() const { return displacement_; }
    double getAcceleration() const { return acceleration_; }
    double getInitialVelocity() const { return initialVelocity_; }

    /**
     * @brief Velocity at the end of the phase
     */
    double finalVelocity() const;

    /**
     * @brief Displacement and velocity at an offset into the phase
     *
     * The position of the returned state is relative to the phase start.
     * The offset is not clamped to the phase duration.
     *
     * @param time Seconds since the phase started
     */
    State stateAt(double time) const;

    bool isCoast() const { return acceleration_ == 0; }

    /**
     * @brief Equality: exact duration, other fields within kStateEpsilon
     */
    bool operator==(const ProfilePhase& other) const;
    bool operator!=(const ProfilePhase& other) const { return !(*this == other); }

private:
    double duration_;
    double displacement_;
    double acceleration_;
    double initialVelocity_;
};

std::ostream& operator<<(std::ostream& os, const ProfilePhase& phase);

}  // namespace ramp::motion
