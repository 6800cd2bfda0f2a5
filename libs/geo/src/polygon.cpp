/**
 * @file polygon.cpp
 * @brief Polygon validation, containment and centroid implementation.
 * @author Watosn
 */

#include "agrorisk/geo/polygon.hpp"

#include <algorithm>
#include <cmath>
#include <cstddef>

#include <Eigen/Dense>
#include <fmt/format.h>

#include "agrorisk/core/constants.hpp"

namespace agrorisk::geo {
namespace {

constexpr double kEdgeTolerance = 1e-12;
constexpr double kMinRingAreaDeg2 = 1e-15;
constexpr std::size_t kMinRingPositions = 4;

Eigen::Vector2d to_vec(const agrorisk::core::LonLat& p) { return Eigen::Vector2d(p.lon_deg, p.lat_deg); }

double cross2(const Eigen::Vector2d& a, const Eigen::Vector2d& b) { return a.x() * b.y() - a.y() * b.x(); }

double orient(const Eigen::Vector2d& a, const Eigen::Vector2d& b, const Eigen::Vector2d& c) {
  return cross2(b - a, c - a);
}

// Assumes p is collinear with [a, b] within tolerance.
bool within_segment_box(const Eigen::Vector2d& a, const Eigen::Vector2d& b, const Eigen::Vector2d& p) {
  return p.x() >= std::min(a.x(), b.x()) - kEdgeTolerance && p.x() <= std::max(a.x(), b.x()) + kEdgeTolerance &&
         p.y() >= std::min(a.y(), b.y()) - kEdgeTolerance && p.y() <= std::max(a.y(), b.y()) + kEdgeTolerance;
}

bool on_segment(const Eigen::Vector2d& a, const Eigen::Vector2d& b, const Eigen::Vector2d& p) {
  const Eigen::Vector2d ab = b - a;
  const double len = ab.norm();
  if (len == 0.0) {
    return (p - a).norm() <= kEdgeTolerance;
  }
  if (std::abs(cross2(ab, p - a)) > kEdgeTolerance * len) {
    return false;
  }
  return within_segment_box(a, b, p);
}

bool segments_intersect(const Eigen::Vector2d& p1, const Eigen::Vector2d& p2, const Eigen::Vector2d& q1,
                        const Eigen::Vector2d& q2) {
  const double d1 = orient(q1, q2, p1);
  const double d2 = orient(q1, q2, p2);
  const double d3 = orient(p1, p2, q1);
  const double d4 = orient(p1, p2, q2);
  const bool straddle_q = (d1 > kEdgeTolerance && d2 < -kEdgeTolerance) || (d1 < -kEdgeTolerance && d2 > kEdgeTolerance);
  const bool straddle_p = (d3 > kEdgeTolerance && d4 < -kEdgeTolerance) || (d3 < -kEdgeTolerance && d4 > kEdgeTolerance);
  if (straddle_q && straddle_p) {
    return true;
  }
  return on_segment(q1, q2, p1) || on_segment(q1, q2, p2) || on_segment(p1, p2, q1) || on_segment(p1, p2, q2);
}

// Open vertex list with consecutive duplicates removed; the closing position is dropped.
std::vector<Eigen::Vector2d> compact_vertices(const Ring& ring) {
  std::vector<Eigen::Vector2d> out;
  out.reserve(ring.size());
  for (std::size_t i = 0; i + 1 < ring.size(); ++i) {
    const auto v = to_vec(ring[i]);
    if (out.empty() || v != out.back()) {
      out.push_back(v);
    }
  }
  while (out.size() > 1 && out.back() == out.front()) {
    out.pop_back();
  }
  return out;
}

bool ring_self_intersects(const Ring& ring) {
  const auto v = compact_vertices(ring);
  const std::size_t n = v.size();
  if (n < 4) {
    return false;
  }
  for (std::size_t i = 0; i < n; ++i) {
    const std::size_t i2 = (i + 1) % n;
    for (std::size_t j = i + 2; j < n; ++j) {
      const std::size_t j2 = (j + 1) % n;
      if (j2 == i) {
        continue;  // last edge closes onto the first
      }
      if (segments_intersect(v[i], v[i2], v[j], v[j2])) {
        return true;
      }
    }
  }
  return false;
}

GeometryCheck check_ring(const Ring& ring, const char* label) {
  using agrorisk::core::Status;
  namespace constants = agrorisk::core::constants;
  if (ring.size() < kMinRingPositions) {
    return GeometryCheck{.status = Status::InvalidGeometry,
                         .error = fmt::format("{} ring has {} positions, need at least {}", label, ring.size(),
                                              kMinRingPositions)};
  }
  for (const auto& p : ring) {
    if (!std::isfinite(p.lon_deg) || !std::isfinite(p.lat_deg)) {
      return GeometryCheck{.status = Status::InvalidGeometry, .error = fmt::format("{} ring has a non-finite position", label)};
    }
    if (std::abs(p.lon_deg) > constants::kMaxLongitudeDeg || std::abs(p.lat_deg) > constants::kMaxLatitudeDeg) {
      return GeometryCheck{.status = Status::InvalidGeometry,
                           .error = fmt::format("{} ring position ({}, {}) is outside WGS84 bounds", label, p.lon_deg,
                                                p.lat_deg)};
    }
  }
  if (ring.front() != ring.back()) {
    return GeometryCheck{.status = Status::InvalidGeometry, .error = fmt::format("{} ring is not closed", label)};
  }
  if (std::abs(signed_ring_area(ring)) <= kMinRingAreaDeg2) {
    return GeometryCheck{.status = Status::InvalidGeometry, .error = fmt::format("{} ring has zero area", label)};
  }
  if (ring_self_intersects(ring)) {
    return GeometryCheck{.status = Status::InvalidGeometry, .error = fmt::format("{} ring self-intersects", label)};
  }
  return GeometryCheck{};
}

bool ring_crossing_parity(const Ring& ring, const Eigen::Vector2d& p) {
  bool inside = false;
  for (std::size_t i = 0, j = ring.size() - 1; i < ring.size(); j = i++) {
    const auto a = to_vec(ring[i]);
    const auto b = to_vec(ring[j]);
    if ((a.y() > p.y()) != (b.y() > p.y())) {
      const double x_cross = (b.x() - a.x()) * (p.y() - a.y()) / (b.y() - a.y()) + a.x();
      if (p.x() < x_cross) {
        inside = !inside;
      }
    }
  }
  return inside;
}

bool on_ring_boundary(const Ring& ring, const Eigen::Vector2d& p) {
  for (std::size_t i = 0; i + 1 < ring.size(); ++i) {
    if (on_segment(to_vec(ring[i]), to_vec(ring[i + 1]), p)) {
      return true;
    }
  }
  return false;
}

// Any edge of `a` intersecting or touching any edge of `b`.
bool rings_touch(const Ring& a, const Ring& b) {
  for (std::size_t i = 0; i + 1 < a.size(); ++i) {
    const auto a1 = to_vec(a[i]);
    const auto a2 = to_vec(a[i + 1]);
    for (std::size_t j = 0; j + 1 < b.size(); ++j) {
      if (segments_intersect(a1, a2, to_vec(b[j]), to_vec(b[j + 1]))) {
        return true;
      }
    }
  }
  return false;
}

// Holes must sit strictly inside the exterior and be pairwise disjoint. With no edge contact,
// one vertex decides which side a whole ring is on.
GeometryCheck check_hole_layout(const Polygon& polygon) {
  using agrorisk::core::Status;
  for (std::size_t i = 0; i < polygon.holes.size(); ++i) {
    const auto& hole = polygon.holes[i];
    if (rings_touch(hole, polygon.exterior)) {
      return GeometryCheck{.status = Status::InvalidGeometry,
                           .error = fmt::format("hole {} crosses or touches the exterior ring", i)};
    }
    if (!ring_crossing_parity(polygon.exterior, to_vec(hole.front()))) {
      return GeometryCheck{.status = Status::InvalidGeometry,
                           .error = fmt::format("hole {} lies outside the exterior ring", i)};
    }
    for (std::size_t j = 0; j < i; ++j) {
      const auto& other = polygon.holes[j];
      if (rings_touch(hole, other) || ring_crossing_parity(other, to_vec(hole.front())) ||
          ring_crossing_parity(hole, to_vec(other.front()))) {
        return GeometryCheck{.status = Status::InvalidGeometry,
                             .error = fmt::format("holes {} and {} overlap", j, i)};
      }
    }
  }
  return GeometryCheck{};
}

struct RingMoments {
  double area{};
  Eigen::Vector2d first_moment{Eigen::Vector2d::Zero()};
};

// Shoelace moments relative to `origin` to limit cancellation far from (0, 0).
RingMoments ring_moments(const Ring& ring, const Eigen::Vector2d& origin) {
  RingMoments m{};
  for (std::size_t i = 0; i + 1 < ring.size(); ++i) {
    const Eigen::Vector2d a = to_vec(ring[i]) - origin;
    const Eigen::Vector2d b = to_vec(ring[i + 1]) - origin;
    const double c = cross2(a, b);
    m.area += c;
    m.first_moment += (a + b) * c;
  }
  m.area *= 0.5;
  return m;
}

}  // namespace

double signed_ring_area(const Ring& ring) {
  if (ring.size() < 3) {
    return 0.0;
  }
  return ring_moments(ring, to_vec(ring.front())).area;
}

double planar_area(const Polygon& polygon) {
  double area = std::abs(signed_ring_area(polygon.exterior));
  for (const auto& hole : polygon.holes) {
    area -= std::abs(signed_ring_area(hole));
  }
  return area;
}

GeometryCheck validate(const Polygon& polygon) {
  auto check = check_ring(polygon.exterior, "exterior");
  if (check.status != agrorisk::core::Status::Ok) {
    return check;
  }
  for (std::size_t i = 0; i < polygon.holes.size(); ++i) {
    const auto label = fmt::format("hole {}", i);
    check = check_ring(polygon.holes[i], label.c_str());
    if (check.status != agrorisk::core::Status::Ok) {
      return check;
    }
  }
  check = check_hole_layout(polygon);
  if (check.status != agrorisk::core::Status::Ok) {
    return check;
  }
  if (!(planar_area(polygon) > 0.0)) {
    return GeometryCheck{.status = agrorisk::core::Status::InvalidGeometry, .error = "holes cover the exterior ring"};
  }
  return GeometryCheck{};
}

bool contains(const Polygon& polygon, const agrorisk::core::LonLat& point) {
  if (polygon.exterior.size() < kMinRingPositions) {
    return false;
  }
  const auto p = to_vec(point);
  if (on_ring_boundary(polygon.exterior, p)) {
    return true;
  }
  for (const auto& hole : polygon.holes) {
    if (on_ring_boundary(hole, p)) {
      return true;
    }
  }
  bool inside = ring_crossing_parity(polygon.exterior, p);
  for (const auto& hole : polygon.holes) {
    if (ring_crossing_parity(hole, p)) {
      inside = !inside;
    }
  }
  return inside;
}

CentroidResult centroid(const Polygon& polygon) {
  if (polygon.exterior.size() < kMinRingPositions) {
    return CentroidResult{.status = agrorisk::core::Status::InvalidGeometry};
  }
  const Eigen::Vector2d origin = to_vec(polygon.exterior.front());

  // Exterior counts positive and holes negative regardless of ring winding.
  const auto ext = ring_moments(polygon.exterior, origin);
  const double ext_sign = ext.area < 0.0 ? -1.0 : 1.0;
  double area = ext_sign * ext.area;
  Eigen::Vector2d moment = ext_sign * ext.first_moment;
  for (const auto& hole : polygon.holes) {
    const auto h = ring_moments(hole, origin);
    const double hole_sign = h.area < 0.0 ? 1.0 : -1.0;
    area += hole_sign * h.area;
    moment += hole_sign * h.first_moment;
  }

  if (!(area > 0.0)) {
    return CentroidResult{.area_deg2 = area, .status = agrorisk::core::Status::InvalidGeometry};
  }
  const Eigen::Vector2d c = origin + moment / (6.0 * area);
  if (!std::isfinite(c.x()) || !std::isfinite(c.y())) {
    return CentroidResult{.area_deg2 = area, .status = agrorisk::core::Status::NumericalError};
  }
  return CentroidResult{.centroid = agrorisk::core::LonLat{c.x(), c.y()}, .area_deg2 = area,
                        .status = agrorisk::core::Status::Ok};
}

}  // namespace agrorisk::geo
