/**
 * @file polygon.hpp
 * @brief Planar polygon model over WGS84 longitude/latitude.
 * @author Watosn
 */
#pragma once

#include <string>
#include <vector>

#include "agrorisk/core/types.hpp"

namespace agrorisk::geo {

/**
 * @brief Closed ring of positions; the first and last positions are identical.
 */
using Ring = std::vector<agrorisk::core::LonLat>;

/**
 * @brief Polygon with one exterior ring and zero or more holes.
 *
 * Coordinates are treated as planar (x = longitude, y = latitude) for containment,
 * centroid and nearest-sample distance.
 */
struct Polygon {
  Ring exterior{};
  std::vector<Ring> holes{};
};

/**
 * @brief Geometry validation outcome.
 */
struct GeometryCheck {
  agrorisk::core::Status status{agrorisk::core::Status::Ok};
  std::string error{};
};

/**
 * @brief Area-weighted centroid output.
 */
struct CentroidResult {
  agrorisk::core::LonLat centroid{};
  double area_deg2{};
  agrorisk::core::Status status{agrorisk::core::Status::Ok};
};

/**
 * @brief Validate rings for closure, coordinate range, non-zero area and self-intersection.
 *
 * Holes must lie strictly inside the exterior ring and must not overlap, cross or touch each other.
 * @return `InvalidGeometry` with a reason on the first failed check.
 */
[[nodiscard]] GeometryCheck validate(const Polygon& polygon);

/**
 * @brief Signed shoelace area of a closed ring (positive when counter-clockwise).
 */
[[nodiscard]] double signed_ring_area(const Ring& ring);

/**
 * @brief Polygon area in squared degrees with holes subtracted.
 */
[[nodiscard]] double planar_area(const Polygon& polygon);

/**
 * @brief Even-odd containment over all rings; points on any edge count as contained.
 */
[[nodiscard]] bool contains(const Polygon& polygon, const agrorisk::core::LonLat& point);

/**
 * @brief Area-weighted geometric centroid with holes subtracted.
 *
 * Returns `InvalidGeometry` when the net area is zero.
 */
[[nodiscard]] CentroidResult centroid(const Polygon& polygon);

}  // namespace agrorisk::geo
