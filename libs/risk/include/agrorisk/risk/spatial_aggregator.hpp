/**
 * @file spatial_aggregator.hpp
 * @brief Reduces a point-sample table to one value over a parcel polygon.
 * @author Watosn
 */
#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "agrorisk/core/interfaces.hpp"
#include "agrorisk/geo/polygon.hpp"

namespace agrorisk::risk {

/**
 * @brief Aggregation output for one dataset.
 */
struct AggregateResult {
  double value{};
  std::size_t sample_count{};
  std::size_t contained_count{};
  bool used_fallback{};
  std::size_t nearest_index{};
  double nearest_distance_deg{};
  agrorisk::core::Status status{agrorisk::core::Status::Ok};
  std::string error{};
};

/**
 * @brief Mean of the samples inside the polygon, or the nearest sample to its centroid.
 *
 * Containment follows `geo::contains` (edges inclusive). With no contained sample, the value of
 * the sample closest (Euclidean, in degrees) to the area-weighted centroid is returned; the
 * earliest sample in input order wins ties. The polygon is expected to have passed `geo::validate`.
 *
 * @return `DataUnavailable` for an empty sample sequence; the aggregator never invents a value.
 */
[[nodiscard]] AggregateResult aggregate(const agrorisk::geo::Polygon& polygon,
                                        const std::vector<agrorisk::core::Sample>& samples);

/**
 * @brief Load one dataset from a store and aggregate it; store failures propagate unchanged.
 */
[[nodiscard]] AggregateResult aggregate_dataset(const agrorisk::core::ISampleStore& store,
                                                agrorisk::core::Dataset dataset,
                                                const agrorisk::geo::Polygon& polygon);

}  // namespace agrorisk::risk
