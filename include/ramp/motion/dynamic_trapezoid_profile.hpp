/**
 * @file dynamic_trapezoid_profile.hpp
 * @brief Step-wise trapezoidal setpoint generator
 */

#pragma once

#include "trajectory.hpp"
#include "ramp/utils/logger.hpp"
#include <cmath>
#include <stdexcept>

namespace ramp::motion {

/**
 * @brief Limits for DynamicTrapezoidProfile
 */
struct DynamicTrapezoidConstraints {
    double maxVelocity = 1.0;
    double maxAcceleration = 1.0;

    DynamicTrapezoidConstraints() = default;
    DynamicTrapezoidConstraints(double maxVel, double maxAccel)
        : maxVelocity(maxVel), maxAcceleration(maxAccel) {}

    bool validate() const {
        return std::isfinite(maxVelocity) && maxVelocity > 0 &&
               std::isfinite(maxAcceleration) && maxAcceleration > 0;
    }
};

/**
 * @brief Trapezoidal setpoint generator advanced one control period at a time
 *
 * Unlike the precomputed profiles this keeps no phase list: each call looks
 * at the current setpoint and picks full acceleration, full braking, or
 * coasting for the next period. The target may change between calls.
 */
class DynamicTrapezoidProfile {
public:
    /**
     * @brief Construct with limits
     * @throws std::invalid_argument if a limit is not finite and positive
     */
    explicit DynamicTrapezoidProfile(const DynamicTrapezoidConstraints& constraints)
        : constraints_(constraints) {
        if (!constraints.validate()) {
            RAMP_LOG_ERROR("Rejected dynamic trapezoid limits: vel=%g accel=%g",
                           constraints.maxVelocity, constraints.maxAcceleration);
            throw std::invalid_argument(
                "dynamic trapezoid limits must be finite and strictly positive");
        }
    }

    /**
     * @brief Setpoint one control period after the current one
     * @param targetPosition Position to settle at
     * @param current Current setpoint
     * @param controlPeriod Period length (seconds, > 0)
     * @return Next setpoint; (targetPosition, 0) once the target is reached
     * @throws std::invalid_argument if controlPeriod is not positive
     */
    State nextSetpoint(double targetPosition, const State& current, double controlPeriod) const {
        if (!(controlPeriod > 0)) {
            throw std::invalid_argument("control period must be positive");
        }

        if (current.position == targetPosition) {
            return State(targetPosition, 0);
        }

        double maxAccel = constraints_.maxAcceleration;
        double dt = controlPeriod;

        double distance = targetPosition - current.position;
        double direction = (distance >= 0) ? 1.0 : -1.0;

        // Distance needed to come to rest from the current velocity
        double stopTime = std::abs(current.velocity) / maxAccel;
        double stopDistance = 0.5 * direction * maxAccel * stopTime * stopTime;

        // Distance left after one more period of full acceleration
        double futureDistance = targetPosition
                                - current.velocity * dt
                                - 0.5 * maxAccel * direction * dt * dt
                                - current.position;

        double accel;
        if (std::abs(stopDistance) >= std::abs(futureDistance)) {
            accel = -direction * maxAccel;
        } else {
            accel = direction * maxAccel;
            if (std::abs(current.velocity + accel * dt) > constraints_.maxVelocity) {
                accel = 0;
            }
        }

        double nextPosition = current.position + current.velocity * dt + 0.5 * accel * dt * dt;
        double nextVelocity = current.velocity + accel * dt;

        // Never step past the target
        if ((nextPosition - targetPosition) * direction > 0) {
            return State(targetPosition, 0);
        }
        return State(nextPosition, nextVelocity);
    }

    const DynamicTrapezoidConstraints& getConstraints() const { return constraints_; }

private:
    DynamicTrapezoidConstraints constraints_;
};

}  // namespace ramp::motion
