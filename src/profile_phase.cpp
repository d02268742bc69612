/**
 * @file profile_phase.cpp
 * @brief Constant-acceleration segment implementation
 */

#include "ramp/motion/profile_phase.hpp"
#include <cmath>

namespace ramp::motion {

ProfilePhase::ProfilePhase(double duration, double displacement,
                           double acceleration, double initialVelocity)
    : duration_(duration)
    , displacement_(displacement)
    , acceleration_(acceleration)
    , initialVelocity_(initialVelocity)
{
}

ProfilePhase ProfilePhase::fromRates(double acceleration, double initialVelocity,
                                     double duration) {
    double displacement = 0.5 * acceleration * duration * duration +
                          initialVelocity * duration;
    return ProfilePhase(duration, displacement, acceleration, initialVelocity);
}

double ProfilePhase::finalVelocity() const {
    return initialVelocity_ + acceleration_ * duration_;
}

State ProfilePhase::stateAt(double time) const {
    return State(initialVelocity_ * time + 0.5 * acceleration_ * time * time,
                 initialVelocity_ + acceleration_ * time);
}

bool ProfilePhase::operator==(const ProfilePhase& other) const {
    return duration_ == other.duration_ &&
           std::abs(displacement_ - other.displacement_) < kStateEpsilon &&
           std::abs(acceleration_ - other.acceleration_) < kStateEpsilon &&
           std::abs(initialVelocity_ - other.initialVelocity_) < kStateEpsilon;
}

std::ostream& operator<<(std::ostream& os, const ProfilePhase& phase) {
    return os << "Phase[time: " << phase.getDuration()
              << ", position: " << phase.getDisplacement()
              << ", acceleration: " << phase.getAcceleration()
              << ", initialVelocity: " << phase.getInitialVelocity() << "]";
}

}  // namespace ramp::motion
