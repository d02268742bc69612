/**
 * @file trajectory.hpp
 * @brief Base trajectory types and interfaces
 */

#pragma once

#include <cmath>
#include <ostream>

namespace ramp::motion {

/**
 * @brief Tolerance used by the value-type equality operators
 *
 * Profiles are rebuilt from floating-point arithmetic, so states and
 * constraints compare equal when every field is within this distance.
 */
constexpr double kStateEpsilon = 1e-4;

/**
 * @brief Position and velocity of a profile at one instant
 */
struct State {
    double position = 0.0;  // Position (rad or m)
    double velocity = 0.0;  // Velocity (rad/s or m/s)

    State() = default;
    State(double p, double v) : position(p), velocity(v) {}

    bool operator==(const State& other) const {
        return std::abs(position - other.position) < kStateEpsilon &&
               std::abs(velocity - other.velocity) < kStateEpsilon;
    }

    bool operator!=(const State& other) const { return !(*this == other); }
};

inline std::ostream& operator<<(std::ostream& os, const State& state) {
    return os << "State[position: " << state.position
              << ", velocity: " << state.velocity << "]";
}

/**
 * @brief Motion constraints
 *
 * Acceleration and deceleration are magnitudes; the planner applies the
 * sign from the direction of travel. A negative value is read as its
 * magnitude.
 */
struct ProfileConstraints {
    double maxVelocity = 1.0;
    double maxAcceleration = 1.0;
    double maxDeceleration = 1.0;

    ProfileConstraints() = default;
    ProfileConstraints(double maxVel, double maxAccel, double maxDecel)
        : maxVelocity(maxVel), maxAcceleration(maxAccel), maxDeceleration(maxDecel) {}

    /**
     * @brief Check that every limit is finite and strictly positive
     */
    bool validate() const {
        return isPositiveLimit(maxVelocity) &&
               isPositiveLimit(std::abs(maxAcceleration)) &&
               isPositiveLimit(std::abs(maxDeceleration));
    }

    bool operator==(const ProfileConstraints& other) const {
        return std::abs(maxVelocity - other.maxVelocity) < kStateEpsilon &&
               std::abs(maxAcceleration - other.maxAcceleration) < kStateEpsilon &&
               std::abs(maxDeceleration - other.maxDeceleration) < kStateEpsilon;
    }

    bool operator!=(const ProfileConstraints& other) const { return !(*this == other); }

private:
    static bool isPositiveLimit(double value) {
        return std::isfinite(value) && value > 0;
    }
};

inline std::ostream& operator<<(std::ostream& os, const ProfileConstraints& c) {
    return os << "ProfileConstraints[maxVelocity: " << c.maxVelocity
              << ", maxAcceleration: " << c.maxAcceleration
              << ", maxDeceleration: " << c.maxDeceleration << "]";
}

/**
 * @brief Time-parameterized trajectory interface
 */
class ITrajectory {
public:
    virtual ~ITrajectory() = default;

    /**
     * @brief Evaluate trajectory at given time
     * @param time Time since start (seconds)
     * @return Setpoint at given time
     */
    virtual State sample(double time) const = 0;

    /**
     * @brief Get total trajectory duration
     * @return Duration in seconds
     */
    virtual double totalTime() const = 0;

    /**
     * @brief Check whether the trajectory has run to completion
     * @param time Time since start (seconds)
     */
    virtual bool isFinished(double time) const = 0;

    /**
     * @brief Get starting state
     */
    virtual State getInitialState() const = 0;
};

}  // namespace ramp::motion
