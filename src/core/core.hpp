#pragma once

/**
 * @file core.hpp
 * @brief Core module umbrella header
 */

#include "core/types.hpp"
#include "core/math/math.hpp"
#include "core/logging/logger.hpp"

namespace salvo {

constexpr const char* VERSION_STRING = "0.4.0";

} // namespace salvo
