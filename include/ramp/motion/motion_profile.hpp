/**
 * @file motion_profile.hpp
 * @brief Piecewise constant-acceleration motion profile
 */

#pragma once

#include "trajectory.hpp"
#include "profile_phase.hpp"
#include <vector>

namespace ramp::motion {

/**
 * @brief Ordered sequence of phases starting from a known state
 *
 * Provides the sampling primitives shared by every planner. The phase list
 * is fixed once construction finishes, so a profile can be sampled from
 * several threads without locking.
 *
 * Past the end of the profile, sample() holds the final position and
 * reports the terminal velocity: 0 for a profile assembled from explicit
 * phases, the (clamped) target velocity for the trapezoid planners, or the
 * best velocity reachable at the target when that is lower.
 */
class MotionProfile : public ITrajectory {
public:
    /**
     * @brief Construct from explicit phases, starting at rest at the origin
     * @param phases Phases in chronological order
     */
    explicit MotionProfile(const std::vector<ProfilePhase>& phases);

    /**
     * @brief Construct from explicit phases and a starting state
     * @param initial State the first phase starts from
     * @param phases Phases in chronological order
     * @throws std::invalid_argument if a phase holds a non-finite value
     */
    MotionProfile(const State& initial, const std::vector<ProfilePhase>& phases);

    ~MotionProfile() override = default;

    /**
     * @brief Setpoint at a time since the start of the profile
     *
     * Times at or before zero return the initial state.
     */
    State sample(double time) const override;

    double totalTime() const override;

    bool isFinished(double time) const override;

    State getInitialState() const override { return initial_; }

    /**
     * @brief State once every phase has run
     */
    State getFinalState() const;

    /**
     * @brief Velocity reported by sample() past the end of the profile
     */
    double getTerminalVelocity() const { return terminalVelocity_; }

    /**
     * @brief Phases in chronological order (zero-length phases excluded)
     */
    const std::vector<ProfilePhase>& getPhases() const { return phases_; }

protected:
    MotionProfile(const State& initial, double terminalVelocity);

    /**
     * @brief Append a phase during construction
     *
     * Phases with a non-positive duration are skipped.
     */
    void appendPhase(const ProfilePhase& phase);

    void setInitialState(const State& initial) { initial_ = initial; }
    void setTerminalVelocity(double velocity) { terminalVelocity_ = velocity; }

private:
    State initial_;
    double terminalVelocity_;
    std::vector<ProfilePhase> phases_;
};

}  // namespace ramp::motion
