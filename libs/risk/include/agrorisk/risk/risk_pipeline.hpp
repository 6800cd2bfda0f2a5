/**
 * @file risk_pipeline.hpp
 * @brief Parcel risk pipeline: aggregation, scoring and pricing.
 * @author Watosn
 */
#pragma once

#include <array>
#include <cstddef>
#include <optional>
#include <string>

#include "agrorisk/core/interfaces.hpp"
#include "agrorisk/geo/polygon.hpp"
#include "agrorisk/risk/config.hpp"
#include "agrorisk/risk/peril_scorer.hpp"
#include "agrorisk/risk/premium_calculator.hpp"
#include "agrorisk/risk/spatial_aggregator.hpp"

namespace agrorisk::risk {

/**
 * @brief One parcel to evaluate.
 *
 * `area_ha` comes from the caller's projection step (see `geo::web_mercator_area`).
 */
struct RiskRequest {
  agrorisk::geo::Polygon polygon{};
  double area_ha{};
  std::optional<double> coverage{};
};

/**
 * @brief Aggregate actually used for one dataset.
 */
struct DatasetAggregate {
  agrorisk::core::Dataset dataset{agrorisk::core::Dataset::Vegetation};
  double value{};
  std::size_t sample_count{};
  std::size_t contained_count{};
  bool used_fallback{};
  bool substituted{};
};

/**
 * @brief Full parcel report handed to the boundary layer.
 */
struct RiskReport {
  std::array<DatasetAggregate, agrorisk::core::kDatasetCount> aggregates{};
  double area_ha{};
  double coverage{kDefaultCoverage};
  PerilReport perils{};
  PremiumBreakdown premium{};
  agrorisk::core::Status status{agrorisk::core::Status::Ok};
  std::string error{};

  [[nodiscard]] const DatasetAggregate& aggregate(agrorisk::core::Dataset dataset) const {
    return aggregates[static_cast<std::size_t>(dataset)];
  }
  [[nodiscard]] double ndvi() const { return aggregate(agrorisk::core::Dataset::Vegetation).value; }
  [[nodiscard]] double elevation_m() const { return aggregate(agrorisk::core::Dataset::Elevation).value; }
  [[nodiscard]] double weather() const { return aggregate(agrorisk::core::Dataset::Weather).value; }
  [[nodiscard]] double risk_score() const { return perils.risk_score; }
  [[nodiscard]] double total_premium() const { return premium.total; }
};

/**
 * @brief Runs the three aggregations, the scorer and the premium calculator for one parcel.
 *
 * Holds only const references; concurrent `evaluate` calls on one instance are safe as long
 * as the store's `load` is.
 */
class RiskPipeline {
 public:
  RiskPipeline(const agrorisk::core::ISampleStore& store, const RiskModelConfig& config)
      : store_(store), config_(config), scorer_(config), calculator_(config) {}

  /**
   * @brief Evaluate a parcel.
   *
   * Status mapping: `InvalidGeometry` for a polygon failing `geo::validate`, `InvalidInput` for a
   * negative or non-finite area or a non-finite coverage, `DataUnavailable` for an unavailable
   * dataset under `MissingDataPolicy::Fail`.
   */
  [[nodiscard]] RiskReport evaluate(const RiskRequest& request) const;

 private:
  const agrorisk::core::ISampleStore& store_;
  const RiskModelConfig& config_;
  PerilScorer scorer_;
  PremiumCalculator calculator_;
};

}  // namespace agrorisk::risk
