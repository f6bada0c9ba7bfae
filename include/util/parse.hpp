#pragma once

#include <cstdint>
#include <string>

namespace canopy::util {

// Strict decimal count in [0, max]. Rejects signs, whitespace and trailing text.
uint32_t parseCount(const std::string& str, uint32_t max);

}
