/**
 * @file constants.hpp
 * @brief Shared geodetic and unit constants.
 * @author Watosn
 */
#pragma once

namespace agrorisk::core::constants {

inline constexpr double kPi = 3.14159265358979323846;
inline constexpr double kDegToRad = kPi / 180.0;
inline constexpr double kEarthRadiusWgs84M = 6378137.0;
inline constexpr double kSquareMetersPerHectare = 10000.0;
inline constexpr double kMaxLongitudeDeg = 180.0;
inline constexpr double kMaxLatitudeDeg = 90.0;

}  // namespace agrorisk::core::constants
