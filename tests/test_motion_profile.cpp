/**
 * @file test_motion_profile.cpp
 * @brief Unit tests for phase-sequence sampling
 */

#include <gtest/gtest.h>
#include <ramp/motion/motion_profile.hpp>
#include <cmath>
#include <limits>
#include <stdexcept>
#include <vector>

using namespace ramp::motion;

class MotionProfileTest : public ::testing::Test {
protected:
    void SetUp() override {
        // Accelerate to 2, coast, brake back to rest: 1 + 2 + 1 units of travel
        phases_ = {
            ProfilePhase::fromRates(2.0, 0.0, 1.0),
            ProfilePhase::fromRates(0.0, 2.0, 1.0),
            ProfilePhase::fromRates(-2.0, 2.0, 1.0),
        };
    }

    std::vector<ProfilePhase> phases_;
};

TEST_F(MotionProfileTest, SingleAccelerationPhase) {
    MotionProfile profile({ProfilePhase::fromRates(1.0, 0.0, 5.0)});

    State state = profile.sample(4.0);
    EXPECT_DOUBLE_EQ(state.position, 8.0);
    EXPECT_DOUBLE_EQ(state.velocity, 4.0);
}

TEST_F(MotionProfileTest, NegativeTimeReturnsInitialState) {
    MotionProfile atOrigin({ProfilePhase::fromRates(1.0, 0.0, 5.0)});
    EXPECT_EQ(atOrigin.sample(-1.0), State(0.0, 0.0));

    MotionProfile offset(State(3.0, 1.0), phases_);
    EXPECT_EQ(offset.sample(-0.5), State(3.0, 1.0));
    EXPECT_EQ(offset.sample(0.0), State(3.0, 1.0));
}

TEST_F(MotionProfileTest, PastEndHoldsFinalPosition) {
    MotionProfile profile({ProfilePhase::fromRates(10.0, 10.0, 2.0)});

    State state = profile.sample(5.0);
    EXPECT_DOUBLE_EQ(state.position, 40.0);
    EXPECT_DOUBLE_EQ(state.velocity, 0.0);
    EXPECT_DOUBLE_EQ(profile.getTerminalVelocity(), 0.0);
}

TEST_F(MotionProfileTest, EmptyProfile) {
    MotionProfile profile(State(2.5, 0.0), std::vector<ProfilePhase>());

    EXPECT_TRUE(profile.getPhases().empty());
    EXPECT_DOUBLE_EQ(profile.totalTime(), 0.0);
    EXPECT_TRUE(profile.isFinished(0.0));
    EXPECT_EQ(profile.sample(1.0), State(2.5, 0.0));
}

TEST_F(MotionProfileTest, WalksPhasesInOrder) {
    MotionProfile profile(State(1.0, 0.0), phases_);

    EXPECT_DOUBLE_EQ(profile.totalTime(), 3.0);
    EXPECT_EQ(profile.sample(0.5), State(1.25, 1.0));
    EXPECT_EQ(profile.sample(1.5), State(3.0, 2.0));
    EXPECT_EQ(profile.sample(2.5), State(4.75, 1.0));
    EXPECT_EQ(profile.sample(3.0), State(5.0, 0.0));
    EXPECT_EQ(profile.getFinalState(), State(5.0, 0.0));
}

TEST_F(MotionProfileTest, PhaseDisplacementsSumToFinalPosition) {
    MotionProfile profile(State(-2.0, 0.0), phases_);

    double position = profile.getInitialState().position;
    for (const ProfilePhase& phase : profile.getPhases()) {
        position += phase.getDisplacement();
    }
    EXPECT_NEAR(profile.sample(profile.totalTime() + 1.0).position, position, 1e-12);
}

TEST_F(MotionProfileTest, DropsZeroLengthPhases) {
    MotionProfile profile({
        ProfilePhase::fromRates(1.0, 0.0, 0.0),
        ProfilePhase::fromRates(1.0, 0.0, 1.0),
        ProfilePhase(-1.0, 0.0, 0.0, 0.0),
    });

    ASSERT_EQ(profile.getPhases().size(), 1u);
    EXPECT_DOUBLE_EQ(profile.getPhases().front().getDuration(), 1.0);
    EXPECT_EQ(profile.sample(0.5), State(0.125, 0.5));
}

TEST_F(MotionProfileTest, RejectsNonFinitePhase) {
    double nan = std::numeric_limits<double>::quiet_NaN();
    double inf = std::numeric_limits<double>::infinity();

    EXPECT_THROW(MotionProfile({ProfilePhase(1.0, nan, 0.0, 0.0)}), std::invalid_argument);
    EXPECT_THROW(MotionProfile({ProfilePhase(inf, 1.0, 0.0, 0.0)}), std::invalid_argument);
}

TEST_F(MotionProfileTest, IsFinished) {
    MotionProfile profile(phases_);

    EXPECT_FALSE(profile.isFinished(0.0));
    EXPECT_FALSE(profile.isFinished(2.999));
    EXPECT_TRUE(profile.isFinished(3.0));
    EXPECT_TRUE(profile.isFinished(10.0));
}

TEST_F(MotionProfileTest, SamplingIsRepeatable) {
    MotionProfile profile(State(1.0, 0.0), phases_);

    for (double t = -0.5; t < 4.0; t += 0.37) {
        State first = profile.sample(t);
        State second = profile.sample(t);
        EXPECT_DOUBLE_EQ(first.position, second.position);
        EXPECT_DOUBLE_EQ(first.velocity, second.velocity);
    }
}

TEST_F(MotionProfileTest, UsableThroughInterface) {
    MotionProfile profile(State(1.0, 0.0), phases_);
    const ITrajectory& trajectory = profile;

    EXPECT_DOUBLE_EQ(trajectory.totalTime(), 3.0);
    EXPECT_EQ(trajectory.getInitialState(), State(1.0, 0.0));
    EXPECT_EQ(trajectory.sample(1.5), State(3.0, 2.0));
}

TEST(StateTest, EqualityUsesTolerance) {
    EXPECT_EQ(State(1.0, 2.0), State(1.00005, 1.99995));
    EXPECT_NE(State(1.0, 2.0), State(1.001, 2.0));
    EXPECT_NE(State(1.0, 2.0), State(1.0, 2.001));
}

TEST(ProfileConstraintsTest, EqualityUsesTolerance) {
    ProfileConstraints a(1.0, 3.0, 2.0);
    ProfileConstraints b(0.99999, 3.00001, 2.00001);

    EXPECT_TRUE(a == b);
    EXPECT_FALSE(a == ProfileConstraints(1.0, 3.0, 2.1));
}

TEST(ProfileConstraintsTest, Validate) {
    EXPECT_TRUE(ProfileConstraints(1.0, 2.0, 3.0).validate());
    EXPECT_TRUE(ProfileConstraints(1.0, -2.0, -3.0).validate());
    EXPECT_FALSE(ProfileConstraints(0.0, 2.0, 3.0).validate());
    EXPECT_FALSE(ProfileConstraints(-1.0, 2.0, 3.0).validate());
    EXPECT_FALSE(ProfileConstraints(1.0, 0.0, 3.0).validate());
    EXPECT_FALSE(ProfileConstraints(1.0, 2.0, 0.0).validate());
    EXPECT_FALSE(ProfileConstraints(std::numeric_limits<double>::infinity(), 2.0, 3.0).validate());
    EXPECT_FALSE(ProfileConstraints(1.0, std::numeric_limits<double>::quiet_NaN(), 3.0).validate());
}
