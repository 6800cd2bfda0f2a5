/**
 * @file spatial_aggregator.cpp
 * @brief Spatial aggregation with nearest-sample fallback.
 * @author Watosn
 */

#include "agrorisk/risk/spatial_aggregator.hpp"

#include <cmath>
#include <limits>
#include <utility>

#include <Eigen/Dense>

namespace agrorisk::risk {

AggregateResult aggregate(const agrorisk::geo::Polygon& polygon, const std::vector<agrorisk::core::Sample>& samples) {
  using agrorisk::core::Status;
  if (samples.empty()) {
    return AggregateResult{.status = Status::DataUnavailable, .error = "sample table is empty"};
  }

  double sum = 0.0;
  std::size_t contained = 0;
  for (const auto& s : samples) {
    if (agrorisk::geo::contains(polygon, agrorisk::core::LonLat{s.lon_deg, s.lat_deg})) {
      sum += s.value;
      ++contained;
    }
  }
  if (contained > 0) {
    const double mean = sum / static_cast<double>(contained);
    if (!std::isfinite(mean)) {
      return AggregateResult{.sample_count = samples.size(), .contained_count = contained,
                             .status = Status::NumericalError, .error = "non-finite sample mean"};
    }
    return AggregateResult{.value = mean, .sample_count = samples.size(), .contained_count = contained};
  }

  const auto c = agrorisk::geo::centroid(polygon);
  if (c.status != Status::Ok) {
    return AggregateResult{.sample_count = samples.size(), .status = c.status, .error = "polygon centroid is undefined"};
  }
  const Eigen::Vector2d center(c.centroid.lon_deg, c.centroid.lat_deg);

  std::size_t best = 0;
  double best_distance = std::numeric_limits<double>::infinity();
  for (std::size_t i = 0; i < samples.size(); ++i) {
    const double d = (Eigen::Vector2d(samples[i].lon_deg, samples[i].lat_deg) - center).norm();
    if (d < best_distance) {  // strict: first occurrence wins ties
      best_distance = d;
      best = i;
    }
  }
  if (!std::isfinite(best_distance)) {
    return AggregateResult{.sample_count = samples.size(), .status = Status::NumericalError,
                           .error = "no sample at a finite distance from the centroid"};
  }

  return AggregateResult{.value = samples[best].value,
                         .sample_count = samples.size(),
                         .contained_count = 0,
                         .used_fallback = true,
                         .nearest_index = best,
                         .nearest_distance_deg = best_distance};
}

AggregateResult aggregate_dataset(const agrorisk::core::ISampleStore& store, agrorisk::core::Dataset dataset,
                                  const agrorisk::geo::Polygon& polygon) {
  auto table = store.load(dataset);
  if (table.status != agrorisk::core::Status::Ok) {
    return AggregateResult{.status = table.status, .error = std::move(table.error)};
  }
  return aggregate(polygon, table.samples);
}

}  // namespace agrorisk::risk
