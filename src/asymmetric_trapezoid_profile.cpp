/**
 * @file asymmetric_trapezoid_profile.cpp
 * @brief Asymmetric trapezoidal velocity profile planner
 */

#include "ramp/motion/asymmetric_trapezoid_profile.hpp"
#include "ramp/utils/logger.hpp"
#include "ramp/utils/math_utils.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace ramp::motion {

namespace {

bool isFiniteState(const State& state) {
    return std::isfinite(state.position) && std::isfinite(state.velocity);
}

void validateInputs(const ProfileConstraints& constraints,
                    const State& target, const State& initial) {
    if (!constraints.validate()) {
        RAMP_LOG_ERROR("Rejected trapezoid constraints: vel=%g accel=%g decel=%g",
                       constraints.maxVelocity, constraints.maxAcceleration,
                       constraints.maxDeceleration);
        throw std::invalid_argument(
            "trapezoid profile limits must be finite and strictly positive");
    }
    if (!isFiniteState(target) || !isFiniteState(initial)) {
        RAMP_LOG_ERROR("Rejected non-finite trapezoid endpoint");
        throw std::invalid_argument("trapezoid profile endpoints must be finite");
    }
}

}  // namespace

AsymmetricTrapezoidProfile::AsymmetricTrapezoidProfile(const ProfileConstraints& constraints,
                                                       const State& target,
                                                       const State& initial)
    : MotionProfile(initial, target.velocity)
    , constraints_(constraints)
    , target_(target)
    , direction_(1.0)
{
    validateInputs(constraints, target, initial);

    // Solve as if moving toward larger positions, with the signs of every
    // rate flipped when the target lies behind the start
    double displacement = target.position - initial.position;
    direction_ = (displacement < 0) ? -1.0 : 1.0;

    double maxVelocity = constraints.maxVelocity * direction_;
    double maxAccel = std::abs(constraints.maxAcceleration) * direction_;
    double maxDecel = -std::abs(constraints.maxDeceleration) * direction_;

    // The initial velocity may point away from the target; the target
    // velocity is taken to point along the direction of travel
    double initialVelocity = (direction_ > 0) ? std::min(initial.velocity, maxVelocity)
                                              : std::max(initial.velocity, maxVelocity);
    double targetVelocity = (direction_ > 0) ? std::min(target.velocity, maxVelocity)
                                             : std::max(target.velocity, maxVelocity);

    if (displacement == 0 && targetVelocity != 0) {
        RAMP_LOG_ERROR("Rejected target velocity %g with zero displacement", targetVelocity);
        throw std::invalid_argument(
            "trapezoid profile cannot reach a nonzero velocity over zero displacement");
    }

    setInitialState(State(initial.position, initialVelocity));
    setTerminalVelocity(targetVelocity);
    target_ = State(target.position, targetVelocity);

    // Ramp up to max velocity, ignoring any overshoot of the target for now
    double accelTime = (maxVelocity - initialVelocity) / maxAccel;
    double accelPos = initialVelocity * accelTime + 0.5 * maxAccel * accelTime * accelTime;

    // Ramp from max velocity down to the target velocity
    double decelTime = (targetVelocity - maxVelocity) / maxDecel;
    double decelPos = targetVelocity * decelTime - 0.5 * maxDecel * decelTime * decelTime;

    // Whatever is left is covered at max velocity
    double coastPos = displacement - (accelPos + decelPos);
    double coastTime = coastPos / maxVelocity;

    if (coastPos * direction_ < 0) {
        // Max velocity is out of reach: the accel and decel ramps meet early.
        // Total displacement is split into three integrals (accelerate to the
        // peak, decelerate back to the initial velocity, decelerate from there
        // to the target velocity). Using maxAccel*accelTime = -maxDecel*decelTime
        // everything reduces to a quadratic in accelTime.
        double vDiff = initialVelocity - targetVelocity;
        double a = 0.5 * maxAccel - (maxAccel * maxAccel) / (2.0 * maxDecel);
        double b = initialVelocity - (initialVelocity * maxAccel) / maxDecel;
        double c = -((vDiff * vDiff) / (2.0 * maxDecel) +
                     (targetVelocity * vDiff) / maxDecel +
                     displacement);

        // Adding direction * sqrt always gives the non-negative root
        accelTime = utils::solveQuadraticRoot(a, b, c, direction_);
        decelTime = -((maxAccel / maxDecel) * accelTime + vDiff / maxDecel);

        accelPos = initialVelocity * accelTime + 0.5 * maxAccel * accelTime * accelTime;
        decelPos = targetVelocity * decelTime - 0.5 * maxDecel * decelTime * decelTime;

        coastTime = 0;
        coastPos = 0;

        if (decelTime < 0) {
            // Target velocity too high: go as fast as possible the whole way
            RAMP_LOG_DEBUG("Target velocity %g unreachable, accelerating over %g",
                           targetVelocity, displacement);
            accelPos = displacement;
            accelTime = utils::timeToCover(displacement, initialVelocity, maxAccel, direction_);
            setTerminalVelocity(initialVelocity + maxAccel * accelTime);
        } else if (accelTime < 0) {
            // Target velocity too low: brake harder than maxDecel to land on it
            decelPos = displacement;
            decelTime = (2.0 * decelPos) / (initialVelocity + targetVelocity);
            if (decelTime > 0) {
                maxDecel = (targetVelocity - initialVelocity) / decelTime;
            }
            RAMP_LOG_DEBUG("Target velocity %g unreachable, decelerating at %g",
                           targetVelocity, maxDecel);
            accelTime = 0;
            accelPos = 0;
        }
    }

    if (!std::isfinite(accelTime) || !std::isfinite(coastTime) ||
        !std::isfinite(decelTime) || !std::isfinite(maxDecel)) {
        RAMP_LOG_ERROR("No finite trapezoid from (%g, %g) to (%g, %g)",
                       initial.position, initialVelocity, target.position, targetVelocity);
        throw std::domain_error("trapezoid profile has no finite solution for these endpoints");
    }

    double decelStartVelocity = initialVelocity + std::max(accelTime, 0.0) * maxAccel;

    appendPhase(ProfilePhase(accelTime, accelPos, maxAccel, initialVelocity));
    appendPhase(ProfilePhase(coastTime, coastPos, 0, maxVelocity));
    appendPhase(ProfilePhase(decelTime, decelPos, maxDecel, decelStartVelocity));
}

double AsymmetricTrapezoidProfile::timeLeftUntil(double position) const {
    double remaining = position - getInitialState().position;
    if (remaining * direction_ <= 0) {
        return 0;
    }

    double time = 0;
    for (const ProfilePhase& phase : getPhases()) {
        if ((remaining - phase.getDisplacement()) * direction_ < 0) {
            // Position falls inside this phase
            if (phase.isCoast()) {
                return time + remaining / phase.getInitialVelocity();
            }
            return time + utils::timeToCover(remaining, phase.getInitialVelocity(),
                                             phase.getAcceleration(), direction_);
        }
        time += phase.getDuration();
        remaining -= phase.getDisplacement();
    }
    return time;
}

}  // namespace ramp::motion
