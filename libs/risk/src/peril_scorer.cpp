/**
 * @file peril_scorer.cpp
 * @brief Multi-peril scoring implementation.
 * @author Watosn
 */

#include "agrorisk/risk/peril_scorer.hpp"

#include <algorithm>
#include <cmath>

#include <fmt/format.h>

#include "agrorisk/core/math_utils.hpp"

namespace agrorisk::risk {
namespace {

using agrorisk::core::Peril;
using agrorisk::core::Severity;

constexpr double kElevationScaleM = 2000.0;
constexpr double kWeatherScale = 20.0;

const char* severity_label(Severity severity) {
  switch (severity) {
    case Severity::High:
      return "High";
    case Severity::Moderate:
      return "Moderate";
    case Severity::Low:
    default:
      return "Low";
  }
}

}  // namespace

double peril_formula(Peril peril, const PerilInputs& in) {
  const double elev = in.elevation_m / kElevationScaleM;
  const double wet = in.weather / kWeatherScale;
  switch (peril) {
    case Peril::Drought:
      return std::max(0.0, 1.0 - (in.ndvi + wet));
    case Peril::Flood:
      return std::max(0.0, 1.0 - elev + wet);
    case Peril::Hail:
      return std::min(1.0, elev * 0.7 + 0.2);
    case Peril::Frost:
      return std::min(1.0, elev * 0.5 + (1.0 - in.ndvi) * 0.5);
    case Peril::Pestilence:
      return std::min(1.0, in.ndvi * 0.8);
  }
  return 0.0;
}

Severity PerilScorer::severity_of(double score) const {
  if (score > config_.severity.high) {
    return Severity::High;
  }
  if (score > config_.severity.moderate) {
    return Severity::Moderate;
  }
  return Severity::Low;
}

std::string PerilScorer::explain(Peril peril, Severity severity, const PerilInputs& in) const {
  const char* label = severity_label(severity);
  const char* name = agrorisk::core::peril_name(peril);
  switch (peril) {
    case Peril::Drought:
      return fmt::format("{} {} risk (NDVI {:.2f}, weather {:.2f})", label, name, in.ndvi, in.weather);
    case Peril::Flood:
      return fmt::format("{} {} risk (elevation {:.0f} m, weather {:.2f})", label, name, in.elevation_m, in.weather);
    case Peril::Hail:
      return fmt::format("{} {} risk (elevation {:.0f} m)", label, name, in.elevation_m);
    case Peril::Frost:
      return fmt::format("{} {} risk (elevation {:.0f} m, NDVI {:.2f})", label, name, in.elevation_m, in.ndvi);
    case Peril::Pestilence:
      return fmt::format("{} {} risk (NDVI {:.2f})", label, name, in.ndvi);
  }
  return fmt::format("{} {} risk", label, name);
}

PerilReport PerilScorer::score(const PerilInputs& in) const {
  if (!std::isfinite(in.ndvi) || !std::isfinite(in.elevation_m) || !std::isfinite(in.weather)) {
    return PerilReport{.status = agrorisk::core::Status::InvalidInput};
  }

  PerilReport out{};
  double sum = 0.0;
  for (const auto peril : agrorisk::core::kAllPerils) {
    auto& p = out.perils[static_cast<std::size_t>(peril)];
    p.peril = peril;
    p.raw_score = agrorisk::core::clamp_unit(peril_formula(peril, in));
    p.score = agrorisk::core::round_to(p.raw_score, 3);
    p.severity = severity_of(p.score);
    p.explanation = explain(peril, p.severity, in);
    sum += p.raw_score;
  }
  out.raw_risk_score = agrorisk::core::clamp_unit(sum / static_cast<double>(agrorisk::core::kPerilCount));
  out.risk_score = agrorisk::core::round_to(out.raw_risk_score, 3);
  return out;
}

}  // namespace agrorisk::risk
