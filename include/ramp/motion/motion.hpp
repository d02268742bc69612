/**
 * @file motion.hpp
 * @brief Main motion profile include file
 */

#pragma once

#include "ramp/motion/trajectory.hpp"
#include "ramp/motion/profile_phase.hpp"
#include "ramp/motion/motion_profile.hpp"
#include "ramp/motion/asymmetric_trapezoid_profile.hpp"
#include "ramp/motion/trapezoidal_profile.hpp"
#include "ramp/motion/dynamic_trapezoid_profile.hpp"
