/**
 * @file version.cpp
 * @brief Library version query
 */

#include "ramp/rampmotion.hpp"

namespace ramp {

const char* getVersion() {
    return Version::getString();
}

}  // namespace ramp
