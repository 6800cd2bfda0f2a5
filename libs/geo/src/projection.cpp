/**
 * @file projection.cpp
 * @brief Web Mercator projection implementation.
 * @author Watosn
 */

#include "agrorisk/geo/projection.hpp"

#include <cmath>
#include <cstddef>

#include "agrorisk/core/constants.hpp"

namespace agrorisk::geo {
namespace {

namespace constants = agrorisk::core::constants;

bool projected_ring_area(const Ring& ring, double& area_m2) {
  area_m2 = 0.0;
  if (ring.size() < 3) {
    return true;
  }
  for (const auto& p : ring) {
    if (!(std::abs(p.lat_deg) < constants::kMaxLatitudeDeg)) {
      return false;  // poles map to infinity
    }
  }
  const auto origin = web_mercator_forward(ring.front());
  double twice_area = 0.0;
  for (std::size_t i = 0; i + 1 < ring.size(); ++i) {
    const auto a = web_mercator_forward(ring[i]);
    const auto b = web_mercator_forward(ring[i + 1]);
    if (!std::isfinite(a.x_m) || !std::isfinite(a.y_m) || !std::isfinite(b.x_m) || !std::isfinite(b.y_m)) {
      return false;
    }
    twice_area += (a.x_m - origin.x_m) * (b.y_m - origin.y_m) - (b.x_m - origin.x_m) * (a.y_m - origin.y_m);
  }
  area_m2 = std::abs(0.5 * twice_area);
  return true;
}

}  // namespace

ProjectedPoint web_mercator_forward(const agrorisk::core::LonLat& p) {
  const double lon_rad = p.lon_deg * constants::kDegToRad;
  const double lat_rad = p.lat_deg * constants::kDegToRad;
  return ProjectedPoint{
      .x_m = constants::kEarthRadiusWgs84M * lon_rad,
      .y_m = constants::kEarthRadiusWgs84M * std::log(std::tan(0.25 * constants::kPi + 0.5 * lat_rad)),
  };
}

AreaResult web_mercator_area(const Polygon& polygon) {
  double area_m2 = 0.0;
  if (!projected_ring_area(polygon.exterior, area_m2)) {
    return AreaResult{.status = agrorisk::core::Status::NumericalError};
  }
  for (const auto& hole : polygon.holes) {
    double hole_m2 = 0.0;
    if (!projected_ring_area(hole, hole_m2)) {
      return AreaResult{.status = agrorisk::core::Status::NumericalError};
    }
    area_m2 -= hole_m2;
  }
  if (area_m2 < 0.0) {
    area_m2 = 0.0;
  }
  return AreaResult{.area_m2 = area_m2,
                    .area_ha = area_m2 / constants::kSquareMetersPerHectare,
                    .status = agrorisk::core::Status::Ok};
}

}  // namespace agrorisk::geo
