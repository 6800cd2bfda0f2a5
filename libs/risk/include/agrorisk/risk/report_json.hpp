/**
 * @file report_json.hpp
 * @brief JSON serialization of parcel risk reports.
 * @author Watosn
 */
#pragma once

#include <nlohmann/json.hpp>

#include "agrorisk/risk/risk_pipeline.hpp"

namespace agrorisk::risk {

/**
 * @brief Serialize a report.
 *
 * Successful reports carry `risk_score`, `premium`, `coverage`, `perils`, `peril_premiums`,
 * `explanations`, `severity`, `aggregation` and `report{NDVI, Elevation_m, Weather_value, Area_ha}`.
 * Every document carries `status`; failed reports add `error` and nothing else.
 */
[[nodiscard]] nlohmann::json report_to_json(const RiskReport& report);

}  // namespace agrorisk::risk
