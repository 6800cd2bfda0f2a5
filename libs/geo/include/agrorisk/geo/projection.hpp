/**
 * @file projection.hpp
 * @brief Spherical Web Mercator projection and projected parcel area.
 * @author Watosn
 */
#pragma once

#include "agrorisk/core/types.hpp"
#include "agrorisk/geo/polygon.hpp"

namespace agrorisk::geo {

/**
 * @brief Planar position in meters.
 */
struct ProjectedPoint {
  double x_m{};
  double y_m{};
};

/**
 * @brief Projected area output.
 */
struct AreaResult {
  double area_m2{};
  double area_ha{};
  agrorisk::core::Status status{agrorisk::core::Status::Ok};
};

/**
 * @brief Forward spherical Web Mercator (EPSG:4326 -> EPSG:3857), sphere radius 6378137 m.
 */
[[nodiscard]] ProjectedPoint web_mercator_forward(const agrorisk::core::LonLat& p);

/**
 * @brief Parcel area after projecting every ring to Web Mercator, holes subtracted.
 * @note Web Mercator inflates area by roughly 1/cos^2(lat); the value is what pricing was calibrated on.
 * @return `NumericalError` when a vertex projects to a non-finite coordinate (latitude at or beyond a pole).
 */
[[nodiscard]] AreaResult web_mercator_area(const Polygon& polygon);

}  // namespace agrorisk::geo
