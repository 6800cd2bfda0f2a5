/**
 * @file test_polygon.cpp
 * @brief Polygon validation, containment and centroid tests.
 * @author Watosn
 */

#include <algorithm>
#include <cmath>

#include <spdlog/spdlog.h>

#include "agrorisk/geo/polygon.hpp"

namespace {

bool approx(double a, double b, double tol = 1e-12) { return std::abs(a - b) <= tol; }

agrorisk::geo::Ring box(double x0, double y0, double x1, double y1) {
  return {{x0, y0}, {x1, y0}, {x1, y1}, {x0, y1}, {x0, y0}};
}

}  // namespace

int main() {
  using namespace agrorisk;

  const geo::Polygon square{.exterior = box(0.0, 0.0, 1.0, 1.0)};
  if (geo::validate(square).status != core::Status::Ok) {
    spdlog::error("unit square rejected");
    return 1;
  }

  geo::Polygon unclosed{.exterior = {{0.0, 0.0}, {1.0, 0.0}, {1.0, 1.0}, {0.0, 1.0}}};
  if (geo::validate(unclosed).status != core::Status::InvalidGeometry) {
    spdlog::error("unclosed ring accepted");
    return 2;
  }
  unclosed.exterior.push_back({0.0, 0.5});
  if (geo::validate(unclosed).status != core::Status::InvalidGeometry) {
    spdlog::error("ring ending off its start accepted");
    return 3;
  }

  const geo::Polygon too_short{.exterior = {{0.0, 0.0}, {1.0, 0.0}, {0.0, 0.0}}};
  if (geo::validate(too_short).status != core::Status::InvalidGeometry) {
    spdlog::error("two-vertex ring accepted");
    return 4;
  }

  const geo::Polygon flat{.exterior = {{0.0, 0.0}, {1.0, 1.0}, {2.0, 2.0}, {0.0, 0.0}}};
  if (geo::validate(flat).status != core::Status::InvalidGeometry) {
    spdlog::error("zero-area ring accepted");
    return 5;
  }

  const geo::Polygon bowtie{.exterior = {{0.0, 0.0}, {1.0, 1.0}, {1.0, 0.0}, {0.0, 1.0}, {0.0, 0.0}}};
  const auto bowtie_check = geo::validate(bowtie);
  if (bowtie_check.status != core::Status::InvalidGeometry || bowtie_check.error.empty()) {
    spdlog::error("self-intersecting ring accepted");
    return 6;
  }

  const geo::Polygon off_globe{.exterior = box(179.5, 10.0, 180.5, 11.0)};
  if (geo::validate(off_globe).status != core::Status::InvalidGeometry) {
    spdlog::error("longitude beyond 180 accepted");
    return 7;
  }

  const geo::Polygon nan_vertex{.exterior = {{0.0, 0.0}, {1.0, 0.0}, {std::nan(""), 1.0}, {0.0, 0.0}}};
  if (geo::validate(nan_vertex).status != core::Status::InvalidGeometry) {
    spdlog::error("non-finite vertex accepted");
    return 8;
  }

  geo::Polygon repeated = square;
  repeated.exterior.insert(repeated.exterior.begin() + 1, repeated.exterior.front());
  if (geo::validate(repeated).status != core::Status::Ok) {
    spdlog::error("repeated consecutive vertex rejected");
    return 9;
  }

  // Containment: interior, exterior, edge and vertex.
  if (!geo::contains(square, {0.25, 0.75}) || geo::contains(square, {1.5, 0.5}) || geo::contains(square, {-0.01, 0.5})) {
    spdlog::error("interior/exterior containment mismatch");
    return 10;
  }
  if (!geo::contains(square, {1.0, 0.5}) || !geo::contains(square, {0.5, 0.0}) || !geo::contains(square, {1.0, 1.0}) ||
      !geo::contains(square, {0.0, 0.0})) {
    spdlog::error("boundary points must be contained");
    return 11;
  }

  const geo::Polygon donut{.exterior = box(0.0, 0.0, 4.0, 4.0), .holes = {box(0.5, 0.5, 1.5, 1.5)}};
  if (geo::validate(donut).status != core::Status::Ok) {
    spdlog::error("polygon with hole rejected");
    return 12;
  }
  if (geo::contains(donut, {1.0, 1.0}) || !geo::contains(donut, {3.0, 3.0}) || !geo::contains(donut, {1.5, 1.0})) {
    spdlog::error("hole containment mismatch");
    return 13;
  }
  if (!approx(geo::planar_area(donut), 15.0)) {
    spdlog::error("area with hole mismatch");
    return 14;
  }

  // Hole layouts that would flip containment outside the parcel.
  const geo::Polygon detached_hole{.exterior = box(0.0, 0.0, 4.0, 4.0), .holes = {box(10.0, 10.0, 11.0, 11.0)}};
  const geo::Polygon crossing_hole{.exterior = box(0.0, 0.0, 4.0, 4.0), .holes = {box(3.0, 1.0, 6.0, 2.0)}};
  const geo::Polygon touching_hole{.exterior = box(0.0, 0.0, 4.0, 4.0), .holes = {box(0.0, 1.0, 1.0, 2.0)}};
  const geo::Polygon enclosing_hole{.exterior = box(1.0, 1.0, 2.0, 2.0), .holes = {box(0.0, 0.0, 4.0, 4.0)}};
  const geo::Polygon overlapping_holes{.exterior = box(0.0, 0.0, 4.0, 4.0),
                                       .holes = {box(0.5, 0.5, 2.0, 2.0), box(1.5, 1.5, 3.0, 3.0)}};
  const geo::Polygon nested_holes{.exterior = box(0.0, 0.0, 4.0, 4.0),
                                  .holes = {box(0.5, 0.5, 3.5, 3.5), box(1.0, 1.0, 2.0, 2.0)}};
  for (const auto* bad : {&detached_hole, &crossing_hole, &touching_hole, &enclosing_hole, &overlapping_holes,
                          &nested_holes}) {
    const auto check = geo::validate(*bad);
    if (check.status != core::Status::InvalidGeometry || check.error.empty()) {
      spdlog::error("malformed hole layout accepted");
      return 20;
    }
  }
  const geo::Polygon two_holes{.exterior = box(0.0, 0.0, 4.0, 4.0),
                               .holes = {box(0.5, 0.5, 1.5, 1.5), box(2.5, 2.5, 3.5, 3.5)}};
  if (geo::validate(two_holes).status != core::Status::Ok) {
    spdlog::error("disjoint holes rejected");
    return 21;
  }

  const auto c_square = geo::centroid(square);
  if (c_square.status != core::Status::Ok || !approx(c_square.centroid.lon_deg, 0.5) ||
      !approx(c_square.centroid.lat_deg, 0.5) || !approx(c_square.area_deg2, 1.0)) {
    spdlog::error("unit square centroid mismatch");
    return 15;
  }

  // L-shape: area centroid (5/6, 5/6), vertex average (1, 1).
  const geo::Polygon ell{.exterior = {{0.0, 0.0}, {2.0, 0.0}, {2.0, 1.0}, {1.0, 1.0}, {1.0, 2.0}, {0.0, 2.0}, {0.0, 0.0}}};
  const auto c_ell = geo::centroid(ell);
  if (c_ell.status != core::Status::Ok || !approx(c_ell.centroid.lon_deg, 5.0 / 6.0) ||
      !approx(c_ell.centroid.lat_deg, 5.0 / 6.0)) {
    spdlog::error("L-shape centroid is not area weighted");
    return 16;
  }

  geo::Polygon ell_cw = ell;
  std::reverse(ell_cw.exterior.begin(), ell_cw.exterior.end());
  const auto c_ell_cw = geo::centroid(ell_cw);
  if (c_ell_cw.status != core::Status::Ok || !approx(c_ell_cw.centroid.lon_deg, 5.0 / 6.0) ||
      !approx(c_ell_cw.centroid.lat_deg, 5.0 / 6.0) || !(geo::signed_ring_area(ell_cw.exterior) < 0.0)) {
    spdlog::error("clockwise ring centroid mismatch");
    return 17;
  }

  const auto c_donut = geo::centroid(donut);
  if (c_donut.status != core::Status::Ok || !approx(c_donut.centroid.lon_deg, 31.0 / 15.0) ||
      !approx(c_donut.centroid.lat_deg, 31.0 / 15.0) || !approx(c_donut.area_deg2, 15.0)) {
    spdlog::error("centroid with hole mismatch");
    return 18;
  }

  // Far from the origin the centroid still lands on the square center.
  const geo::Polygon far{.exterior = box(120.0, -35.0, 120.01, -34.99)};
  const auto c_far = geo::centroid(far);
  if (c_far.status != core::Status::Ok || !approx(c_far.centroid.lon_deg, 120.005, 1e-9) ||
      !approx(c_far.centroid.lat_deg, -34.995, 1e-9)) {
    spdlog::error("far-from-origin centroid mismatch");
    return 19;
  }

  return 0;
}
