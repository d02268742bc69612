/**
 * @file main.cpp
 * @brief Feeding profile setpoints to a simulated position loop
 *
 * Plans an asymmetric trapezoid, then runs a 1 kHz loop in which a
 * simulated axis tracks the sampled setpoint with a PD law. A second move
 * starts from the axis' measured state while it is still moving.
 */

#include <ramp/rampmotion.hpp>
#include <cmath>
#include <iostream>
#include <stdexcept>

using namespace ramp::motion;

// Double integrator driven by a PD law with velocity feedforward
class SimulatedAxis {
public:
    void update(const State& setpoint, double dt) {
        double accel = kp_ * (setpoint.position - position_) +
                       kd_ * (setpoint.velocity - velocity_);
        velocity_ += accel * dt;
        position_ += velocity_ * dt;
    }

    State getState() const { return State(position_, velocity_); }

private:
    double kp_ = 400.0;
    double kd_ = 40.0;
    double position_ = 0;
    double velocity_ = 0;
};

static void runMove(SimulatedAxis& axis, const MotionProfile& profile, double stopAfter) {
    const double dt = 0.001;
    double lastPrintTime = -1;

    for (double t = 0; t < stopAfter; t += dt) {
        State setpoint = profile.sample(t);
        axis.update(setpoint, dt);

        if (t - lastPrintTime >= 0.25) {
            State actual = axis.getState();
            std::cout << "t=" << t << "s"
                      << " setpoint=" << setpoint.position
                      << " actual=" << actual.position
                      << " error=" << (setpoint.position - actual.position)
                      << (profile.isFinished(t) ? " [done]" : "")
                      << std::endl;
            lastPrintTime = t;
        }
    }
}

int main() {
    std::cout << "RampMotion Setpoint Feed Example" << std::endl;
    std::cout << "Version: " << ramp::getVersion() << std::endl;
    std::cout << std::endl;

    ramp::utils::Logger::instance().setLevel(ramp::utils::LogLevel::Debug);

    try {
        SimulatedAxis axis;

        // Fast acceleration, gentle braking
        ProfileConstraints constraints(1.5, 4.0, 1.0);
        AsymmetricTrapezoidProfile outbound(constraints, State(3.0, 0.0), axis.getState());

        std::cout << "Outbound move, " << outbound.getPhases().size() << " phases:" << std::endl;
        for (const ProfilePhase& phase : outbound.getPhases()) {
            std::cout << "  " << phase << std::endl;
        }
        std::cout << "Reaches 2.0 at t=" << outbound.timeLeftUntil(2.0) << "s" << std::endl;
        runMove(axis, outbound, 1.5);

        // Retarget mid-move from wherever the axis actually is
        std::cout << std::endl << "Return move from " << axis.getState() << std::endl;
        TrapezoidProfile inbound(TrapezoidConstraints(1.0, 2.0), State(0.0, 0.0), axis.getState());
        runMove(axis, inbound, inbound.totalTime() + 0.5);

        std::cout << std::endl << "Final state: " << axis.getState() << std::endl;
    } catch (const std::exception& e) {
        RAMP_LOG_ERROR("Profile planning failed: %s", e.what());
        return 1;
    }

    return 0;
}
