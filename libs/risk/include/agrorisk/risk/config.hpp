/**
 * @file config.hpp
 * @brief Immutable risk model configuration and its JSON loader.
 * @author Watosn
 */
#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>

#include "agrorisk/core/types.hpp"

namespace agrorisk::risk {

/**
 * @brief What the pipeline does when a dataset table is unavailable.
 */
enum class MissingDataPolicy : std::uint8_t { Fail, SubstituteNeutral };

/**
 * @brief Values substituted for unavailable aggregates under `MissingDataPolicy::SubstituteNeutral`.
 */
struct NeutralDefaults {
  double ndvi{0.5};
  double elevation_m{1000.0};
  double weather{5.0};
};

/**
 * @brief Severity bucket lower bounds (exclusive).
 */
struct SeverityThresholds {
  double high{0.6};
  double moderate{0.3};
};

/**
 * @brief Model constants shared by the scorer, premium calculator and pipeline.
 *
 * Built once at startup and passed by const reference; never mutated afterwards.
 */
struct RiskModelConfig {
  double base_rate{100.0};
  std::array<double, agrorisk::core::kPerilCount> peril_weights{0.30, 0.25, 0.15, 0.15, 0.15};
  NeutralDefaults neutral{};
  SeverityThresholds severity{};
  MissingDataPolicy missing_data{MissingDataPolicy::Fail};

  [[nodiscard]] double weight(agrorisk::core::Peril peril) const {
    return peril_weights[static_cast<std::size_t>(peril)];
  }

  [[nodiscard]] double neutral_value(agrorisk::core::Dataset dataset) const {
    switch (dataset) {
      case agrorisk::core::Dataset::Elevation:
        return neutral.elevation_m;
      case agrorisk::core::Dataset::Weather:
        return neutral.weather;
      case agrorisk::core::Dataset::Vegetation:
      default:
        return neutral.ndvi;
    }
  }
};

inline constexpr double kPerilWeightSumTolerance = 1e-9;

/**
 * @brief Config load/validation outcome.
 */
struct ConfigResult {
  RiskModelConfig config{};
  agrorisk::core::Status status{agrorisk::core::Status::Ok};
  std::string error{};
};

/**
 * @brief Check weights (finite, non-negative, sum to 1), base rate, neutral defaults and thresholds.
 */
[[nodiscard]] ConfigResult validate_config(const RiskModelConfig& config);

/**
 * @brief Parse a JSON config document; absent keys keep their defaults.
 *
 * Recognized keys: `base_rate`, `peril_weights{drought,flood,hail,frost,pestilence}`,
 * `neutral_defaults{ndvi,elevation_m,weather}`, `severity{high,moderate}`,
 * `missing_data_policy` (`"fail"` or `"substitute_neutral"`).
 */
[[nodiscard]] ConfigResult parse_model_config(const std::string& text);

/**
 * @brief Read and parse a JSON config file.
 */
[[nodiscard]] ConfigResult load_model_config(const std::filesystem::path& path);

}  // namespace agrorisk::risk
