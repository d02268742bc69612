/**
 * @file asymmetric_trapezoid_profile.hpp
 * @brief Trapezoidal velocity profile with independent accel/decel limits
 */

#pragma once

#include "motion_profile.hpp"

namespace ramp::motion {

/**
 * @brief Asymmetric trapezoidal velocity profile
 *
 * Plans at most three phases (accelerate, coast, decelerate) that move from
 * an initial state to a target state within the given limits. The whole
 * phase list is computed in the constructor.
 *
 * "Acceleration" is the limit for the first phase of motion and
 * "deceleration" the limit for the last one, whatever the direction of
 * travel. When the target velocity cannot be reached over the available
 * distance the profile still ends exactly at the target position:
 * - target velocity too high: accelerate over the whole distance; the
 *   profile ends at the velocity reached there instead of the target's
 * - target velocity too low: decelerate over the whole distance at
 *   whatever rate lands on the target velocity (this may exceed
 *   maxDeceleration)
 *
 * @code
 * AsymmetricTrapezoidProfile profile(ProfileConstraints(2.0, 1.0, 4.0),
 *                                    State(10.0, 0.0), State(0.0, 0.0));
 * while (!profile.isFinished(t)) {
 *     State setpoint = profile.sample(t);
 *     ...
 * }
 * @endcode
 */
class AsymmetricTrapezoidProfile : public MotionProfile {
public:
    /**
     * @brief Plan a profile
     * @param constraints Velocity, acceleration and deceleration limits
     * @param target State to reach when the profile finishes
     * @param initial State to start from (usually the current state)
     * @throws std::invalid_argument if a limit is not finite and strictly
     *         positive, an endpoint is not finite, or the endpoints share a
     *         position while the target velocity is nonzero
     * @throws std::domain_error if the inputs admit no finite profile
     */
    AsymmetricTrapezoidProfile(const ProfileConstraints& constraints,
                               const State& target,
                               const State& initial = State(0, 0));

    ~AsymmetricTrapezoidProfile() override = default;

    /**
     * @brief Time from the profile start until a position is reached
     *
     * Positions behind the start (against the direction of travel) return
     * 0; positions at or past the target return totalTime().
     *
     * @param position Absolute position along the profile
     * @return Seconds since the profile start
     */
    double timeLeftUntil(double position) const;

    const ProfileConstraints& getConstraints() const { return constraints_; }

    /**
     * @brief Target state, velocity clamped to maxVelocity
     */
    const State& getTargetState() const { return target_; }

    /**
     * @brief +1 when moving toward larger positions, -1 otherwise
     */
    double getDirection() const { return direction_; }

private:
    ProfileConstraints constraints_;
    State target_;
    double direction_;
};

}  // namespace ramp::motion
