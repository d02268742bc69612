/**
 * @file motion_profile.cpp
 * @brief Piecewise constant-acceleration motion profile implementation
 */

#include "ramp/motion/motion_profile.hpp"
#include <cmath>
#include <stdexcept>

namespace ramp::motion {

namespace {

bool isFinitePhase(const ProfilePhase& phase) {
    return std::isfinite(phase.getDuration()) &&
           std::isfinite(phase.getDisplacement()) &&
           std::isfinite(phase.getAcceleration()) &&
           std::isfinite(phase.getInitialVelocity());
}

}  // namespace

MotionProfile::MotionProfile(const std::vector<ProfilePhase>& phases)
    : MotionProfile(State(0, 0), phases) {}

MotionProfile::MotionProfile(const State& initial, const std::vector<ProfilePhase>& phases)
    : initial_(initial)
    , terminalVelocity_(0)
{
    phases_.reserve(phases.size());
    for (const ProfilePhase& phase : phases) {
        appendPhase(phase);
    }
}

MotionProfile::MotionProfile(const State& initial, double terminalVelocity)
    : initial_(initial)
    , terminalVelocity_(terminalVelocity)
{
    phases_.reserve(3);
}

void MotionProfile::appendPhase(const ProfilePhase& phase) {
    if (!isFinitePhase(phase)) {
        throw std::invalid_argument("motion profile phase must hold finite values");
    }
    if (phase.getDuration() > 0) {
        phases_.push_back(phase);
    }
}

State MotionProfile::sample(double time) const {
    if (time <= 0) {
        return initial_;
    }

    double position = initial_.position;
    for (const ProfilePhase& phase : phases_) {
        if (time < phase.getDuration()) {
            State offset = phase.stateAt(time);
            return State(position + offset.position, offset.velocity);
        }
        time -= phase.getDuration();
        position += phase.getDisplacement();
    }

    // No phases, or past the end of the last one
    return State(position, terminalVelocity_);
}

double MotionProfile::totalTime() const {
    double time = 0;
    for (const ProfilePhase& phase : phases_) {
        time += phase.getDuration();
    }
    return time;
}

bool MotionProfile::isFinished(double time) const {
    return time >= totalTime();
}

State MotionProfile::getFinalState() const {
    return sample(totalTime());
}

}  // namespace ramp::motion
