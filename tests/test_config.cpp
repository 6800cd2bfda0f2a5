/**
 * @file test_config.cpp
 * @brief Risk model configuration loading tests.
 * @author Watosn
 */

#include <cmath>
#include <filesystem>
#include <fstream>

#include <spdlog/spdlog.h>

#include "agrorisk/risk/config.hpp"

namespace {

bool approx(double a, double b, double tol = 1e-12) { return std::abs(a - b) <= tol; }

}  // namespace

int main() {
  using namespace agrorisk;
  using core::Peril;

  const auto defaults = risk::validate_config(risk::RiskModelConfig{});
  if (defaults.status != core::Status::Ok || !approx(defaults.config.base_rate, 100.0) ||
      defaults.config.missing_data != risk::MissingDataPolicy::Fail || !approx(defaults.config.neutral.ndvi, 0.5) ||
      !approx(defaults.config.neutral.elevation_m, 1000.0) || !approx(defaults.config.neutral.weather, 5.0)) {
    spdlog::error("default config mismatch");
    return 1;
  }
  if (!approx(defaults.config.neutral_value(core::Dataset::Elevation), 1000.0) ||
      !approx(defaults.config.neutral_value(core::Dataset::Weather), 5.0) ||
      !approx(defaults.config.neutral_value(core::Dataset::Vegetation), 0.5)) {
    spdlog::error("neutral value lookup mismatch");
    return 2;
  }

  const auto partial = risk::parse_model_config(R"({
    "base_rate": 120,
    "missing_data_policy": "substitute_neutral",
    "neutral_defaults": {"elevation_m": 800},
    "severity": {"high": 0.7}
  })");
  if (partial.status != core::Status::Ok || !approx(partial.config.base_rate, 120.0) ||
      partial.config.missing_data != risk::MissingDataPolicy::SubstituteNeutral ||
      !approx(partial.config.neutral.elevation_m, 800.0) || !approx(partial.config.neutral.ndvi, 0.5) ||
      !approx(partial.config.severity.high, 0.7) || !approx(partial.config.severity.moderate, 0.3) ||
      !approx(partial.config.weight(Peril::Drought), 0.30)) {
    spdlog::error("partial config mismatch: {}", partial.error);
    return 3;
  }

  const auto reweighted = risk::parse_model_config(
      R"({"peril_weights": {"drought": 0.2, "flood": 0.2, "hail": 0.2, "frost": 0.2, "pestilence": 0.2}})");
  if (reweighted.status != core::Status::Ok || !approx(reweighted.config.weight(Peril::Hail), 0.2)) {
    spdlog::error("weights override failed: {}", reweighted.error);
    return 4;
  }

  const auto unbalanced = risk::parse_model_config(R"({"peril_weights": {"drought": 0.5}})");
  if (unbalanced.status != core::Status::InvalidInput || unbalanced.error.empty()) {
    spdlog::error("weights not summing to one accepted");
    return 5;
  }

  const auto negative = risk::parse_model_config(
      R"({"peril_weights": {"drought": -0.1, "flood": 0.65, "hail": 0.15, "frost": 0.15, "pestilence": 0.15}})");
  if (negative.status != core::Status::InvalidInput) {
    spdlog::error("negative weight accepted");
    return 6;
  }

  if (risk::parse_model_config(R"({"missing_data_policy": "guess"})").status != core::Status::InvalidInput) {
    spdlog::error("unknown policy accepted");
    return 7;
  }
  if (risk::parse_model_config(R"({"base_rate": "cheap"})").status != core::Status::InvalidInput) {
    spdlog::error("non-numeric base rate accepted");
    return 8;
  }
  if (risk::parse_model_config("{ not json").status != core::Status::InvalidInput) {
    spdlog::error("malformed config accepted");
    return 9;
  }
  if (risk::parse_model_config(R"({"severity": {"high": 0.2, "moderate": 0.5}})").status != core::Status::InvalidInput) {
    spdlog::error("inverted severity thresholds accepted");
    return 10;
  }

  const auto path = std::filesystem::temp_directory_path() / "agrorisk_config_test.json";
  {
    std::ofstream out(path);
    out << R"({"base_rate": 95.5})";
  }
  const auto loaded = risk::load_model_config(path);
  std::error_code ec;
  std::filesystem::remove(path, ec);
  if (loaded.status != core::Status::Ok || !approx(loaded.config.base_rate, 95.5)) {
    spdlog::error("config file load failed: {}", loaded.error);
    return 11;
  }
  if (risk::load_model_config(path).status != core::Status::InvalidInput) {
    spdlog::error("missing config file accepted");
    return 12;
  }

  return 0;
}
