/**
 * @file math_utils.hpp
 * @brief Shared scalar helpers for reporting.
 * @author Watosn
 */
#pragma once

#include <algorithm>
#include <cmath>

namespace agrorisk::core {

/**
 * @brief Round half away from zero to a fixed number of decimal places.
 */
inline double round_to(double value, int decimals) {
  const double scale = std::pow(10.0, decimals);
  return std::round(value * scale) / scale;
}

/**
 * @brief Clamp to the unit interval.
 */
inline double clamp_unit(double value) { return std::clamp(value, 0.0, 1.0); }

}  // namespace agrorisk::core
