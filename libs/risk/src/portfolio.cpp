/**
 * @file portfolio.cpp
 * @brief Batch row parsing, formatting and portfolio totals.
 * @author Watosn
 */

#include "agrorisk/risk/portfolio.hpp"

#include <cstdlib>
#include <sstream>

#include <fmt/format.h>

#include "agrorisk/core/math_utils.hpp"

namespace agrorisk::risk {
namespace {

// Everything between the coverage column and the status column.
constexpr std::size_t kMetricColumns = 16;

}  // namespace

std::optional<ParcelEntry> parse_parcel_entry(const std::string& line) {
  std::string text = line;
  if (!text.empty() && text.back() == '\r') {
    text.pop_back();
  }
  std::stringstream ss(text);
  std::string path;
  std::string coverage;
  if (!std::getline(ss, path, ',') || path.empty()) {
    return std::nullopt;
  }
  ParcelEntry entry{.geojson_file = path};
  if (std::getline(ss, coverage, ',') && !coverage.empty()) {
    char* end = nullptr;
    const double v = std::strtod(coverage.c_str(), &end);
    if (end == coverage.c_str() || *end != '\0') {
      return std::nullopt;
    }
    entry.coverage = v;
  }
  return entry;
}

const std::string& batch_csv_header() {
  static const std::string header =
      "geojson,coverage,area_ha,ndvi,elevation_m,weather,"
      "drought,flood,hail,frost,pestilence,"
      "drought_premium,flood_premium,hail_premium,frost_premium,pestilence_premium,"
      "risk_score,premium,status\n";
  return header;
}

std::string format_batch_row(const ParcelEntry& entry, const RiskReport& report) {
  using agrorisk::core::Peril;
  if (report.status != agrorisk::core::Status::Ok) {
    return format_batch_failure(entry, report.status);
  }
  const auto score = [&](Peril p) { return report.perils.at(p).score; };
  const auto premium = [&](Peril p) { return report.premium.at(p).amount; };
  return fmt::format(
      "{},{},{:.2f},{:.6f},{:.3f},{:.6f},{:.3f},{:.3f},{:.3f},{:.3f},{:.3f},{:.2f},{:.2f},{:.2f},{:.2f},{:.2f},{:.3f},{:.2f},{}\n",
      entry.geojson_file.string(), report.coverage, report.area_ha, report.ndvi(), report.elevation_m(),
      report.weather(), score(Peril::Drought), score(Peril::Flood), score(Peril::Hail), score(Peril::Frost),
      score(Peril::Pestilence), premium(Peril::Drought), premium(Peril::Flood), premium(Peril::Hail),
      premium(Peril::Frost), premium(Peril::Pestilence), report.risk_score(), report.total_premium(),
      agrorisk::core::status_name(report.status));
}

std::string format_batch_failure(const ParcelEntry& entry, agrorisk::core::Status status) {
  return fmt::format("{},{}{}{}\n", entry.geojson_file.string(), entry.coverage, std::string(kMetricColumns + 1, ','),
                     agrorisk::core::status_name(status));
}

void PortfolioSummary::add(const RiskReport& report) {
  if (report.status != agrorisk::core::Status::Ok) {
    ++failed_;
    return;
  }
  ++parcels_;
  total_premium_ = agrorisk::core::round_to(total_premium_ + report.total_premium(), 2);
  for (const auto& item : report.premium.items) {
    auto& slot = exposure_[static_cast<std::size_t>(item.peril)];
    slot = agrorisk::core::round_to(slot + item.amount, 2);
  }
  if (report.risk_score() > hotspot_threshold_) {
    ++hotspots_;
  }
}

}  // namespace agrorisk::risk
