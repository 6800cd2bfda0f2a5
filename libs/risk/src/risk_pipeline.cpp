/**
 * @file risk_pipeline.cpp
 * @brief Parcel risk pipeline implementation.
 * @author Watosn
 */

#include "agrorisk/risk/risk_pipeline.hpp"

#include <cmath>
#include <utility>

#include <fmt/format.h>

namespace agrorisk::risk {
namespace {

using agrorisk::core::Status;

RiskReport failed(Status status, std::string error) {
  return RiskReport{.status = status, .error = std::move(error)};
}

}  // namespace

RiskReport RiskPipeline::evaluate(const RiskRequest& request) const {
  const auto geometry = agrorisk::geo::validate(request.polygon);
  if (geometry.status != Status::Ok) {
    return failed(geometry.status, geometry.error);
  }
  if (!std::isfinite(request.area_ha) || request.area_ha < 0.0) {
    return failed(Status::InvalidInput, fmt::format("area {} ha is not a finite non-negative number", request.area_ha));
  }
  const double coverage = request.coverage.value_or(kDefaultCoverage);
  if (!std::isfinite(coverage)) {
    return failed(Status::InvalidInput, "coverage is not finite");
  }

  RiskReport out{.area_ha = request.area_ha, .coverage = coverage};
  for (const auto dataset : agrorisk::core::kAllDatasets) {
    auto& slot = out.aggregates[static_cast<std::size_t>(dataset)];
    slot.dataset = dataset;

    const auto agg = aggregate_dataset(store_, dataset, request.polygon);
    if (agg.status == Status::DataUnavailable && config_.missing_data == MissingDataPolicy::SubstituteNeutral) {
      slot.value = config_.neutral_value(dataset);
      slot.substituted = true;
      continue;
    }
    if (agg.status != Status::Ok) {
      return failed(agg.status, fmt::format("{}: {}", agrorisk::core::dataset_name(dataset), agg.error));
    }
    slot.value = agg.value;
    slot.sample_count = agg.sample_count;
    slot.contained_count = agg.contained_count;
    slot.used_fallback = agg.used_fallback;
  }

  out.perils = scorer_.score(PerilInputs{.ndvi = out.ndvi(), .elevation_m = out.elevation_m(), .weather = out.weather()});
  if (out.perils.status != Status::Ok) {
    return failed(out.perils.status, "peril scoring rejected the aggregates");
  }
  out.premium = calculator_.calculate(out.perils, out.area_ha, out.coverage);
  if (out.premium.status != Status::Ok) {
    return failed(out.premium.status, "premium calculation failed");
  }
  return out;
}

}  // namespace agrorisk::risk
