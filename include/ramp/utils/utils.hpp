/**
 * @file utils.hpp
 * @brief Main utilities include file
 */

#pragma once

#include "ramp/utils/math_utils.hpp"
#include "ramp/utils/logger.hpp"
