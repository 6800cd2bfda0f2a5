/**
 * @file report_json.cpp
 * @brief Report JSON serialization implementation.
 * @author Watosn
 */

#include "agrorisk/risk/report_json.hpp"

#include <utility>

#include "agrorisk/core/math_utils.hpp"

namespace agrorisk::risk {

nlohmann::json report_to_json(const RiskReport& report) {
  nlohmann::json doc;
  doc["status"] = agrorisk::core::status_name(report.status);
  if (report.status != agrorisk::core::Status::Ok) {
    doc["error"] = report.error;
    return doc;
  }

  doc["risk_score"] = report.risk_score();
  doc["premium"] = report.total_premium();
  doc["coverage"] = report.coverage;

  nlohmann::json perils = nlohmann::json::object();
  nlohmann::json premiums = nlohmann::json::object();
  nlohmann::json explanations = nlohmann::json::object();
  nlohmann::json severity = nlohmann::json::object();
  for (const auto peril : agrorisk::core::kAllPerils) {
    const char* name = agrorisk::core::peril_name(peril);
    const auto& p = report.perils.at(peril);
    perils[name] = p.score;
    premiums[name] = report.premium.at(peril).amount;
    explanations[name] = p.explanation;
    severity[name] = agrorisk::core::severity_name(p.severity);
  }
  doc["perils"] = std::move(perils);
  doc["peril_premiums"] = std::move(premiums);
  doc["explanations"] = std::move(explanations);
  doc["severity"] = std::move(severity);

  nlohmann::json aggregation = nlohmann::json::object();
  for (const auto& a : report.aggregates) {
    aggregation[agrorisk::core::dataset_name(a.dataset)] = {
        {"value", a.value},
        {"samples", a.sample_count},
        {"contained", a.contained_count},
        {"fallback", a.used_fallback},
        {"substituted", a.substituted},
    };
  }
  doc["aggregation"] = std::move(aggregation);

  doc["report"] = {
      {"NDVI", report.ndvi()},
      {"Elevation_m", report.elevation_m()},
      {"Weather_value", report.weather()},
      {"Area_ha", agrorisk::core::round_to(report.area_ha, 2)},
  };
  return doc;
}

}  // namespace agrorisk::risk
