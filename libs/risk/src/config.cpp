/**
 * @file config.cpp
 * @brief Risk model configuration loading and validation.
 * @author Watosn
 */

#include "agrorisk/risk/config.hpp"

#include <cmath>
#include <fstream>
#include <sstream>
#include <utility>

#include <fmt/format.h>
#include <nlohmann/json.hpp>

namespace agrorisk::risk {
namespace {

using agrorisk::core::Status;

ConfigResult invalid(std::string error) {
  return ConfigResult{.status = Status::InvalidInput, .error = std::move(error)};
}

void read_number(const nlohmann::json& node, const char* key, double& value) {
  const auto it = node.find(key);
  if (it != node.end()) {
    value = it->get<double>();
  }
}

}  // namespace

ConfigResult validate_config(const RiskModelConfig& config) {
  double weight_sum = 0.0;
  for (const auto peril : agrorisk::core::kAllPerils) {
    const double w = config.weight(peril);
    if (!std::isfinite(w) || w < 0.0) {
      return invalid(fmt::format("{} weight {} is not a finite non-negative number", agrorisk::core::peril_name(peril), w));
    }
    weight_sum += w;
  }
  if (std::abs(weight_sum - 1.0) > kPerilWeightSumTolerance) {
    return invalid(fmt::format("peril weights sum to {}, expected 1", weight_sum));
  }
  if (!std::isfinite(config.base_rate) || config.base_rate < 0.0) {
    return invalid(fmt::format("base rate {} is not a finite non-negative number", config.base_rate));
  }
  if (!std::isfinite(config.neutral.ndvi) || !std::isfinite(config.neutral.elevation_m) ||
      !std::isfinite(config.neutral.weather)) {
    return invalid("neutral defaults must be finite");
  }
  if (!(config.severity.moderate <= config.severity.high)) {
    return invalid("severity thresholds must satisfy moderate <= high");
  }
  return ConfigResult{.config = config, .status = Status::Ok};
}

ConfigResult parse_model_config(const std::string& text) {
  RiskModelConfig config{};
  try {
    const auto doc = nlohmann::json::parse(text);
    if (!doc.is_object()) {
      return invalid("config document is not a JSON object");
    }
    read_number(doc, "base_rate", config.base_rate);

    if (const auto weights = doc.find("peril_weights"); weights != doc.end()) {
      for (const auto peril : agrorisk::core::kAllPerils) {
        read_number(*weights, agrorisk::core::peril_name(peril), config.peril_weights[static_cast<std::size_t>(peril)]);
      }
    }
    if (const auto neutral = doc.find("neutral_defaults"); neutral != doc.end()) {
      read_number(*neutral, "ndvi", config.neutral.ndvi);
      read_number(*neutral, "elevation_m", config.neutral.elevation_m);
      read_number(*neutral, "weather", config.neutral.weather);
    }
    if (const auto severity = doc.find("severity"); severity != doc.end()) {
      read_number(*severity, "high", config.severity.high);
      read_number(*severity, "moderate", config.severity.moderate);
    }
    if (const auto policy = doc.find("missing_data_policy"); policy != doc.end()) {
      const auto name = policy->get<std::string>();
      if (name == "fail") {
        config.missing_data = MissingDataPolicy::Fail;
      } else if (name == "substitute_neutral") {
        config.missing_data = MissingDataPolicy::SubstituteNeutral;
      } else {
        return invalid(fmt::format("unknown missing_data_policy '{}'", name));
      }
    }
  } catch (const nlohmann::json::exception& e) {
    return invalid(fmt::format("malformed config: {}", e.what()));
  }
  return validate_config(config);
}

ConfigResult load_model_config(const std::filesystem::path& path) {
  std::ifstream in(path);
  if (!in) {
    return invalid(fmt::format("cannot open {}", path.string()));
  }
  std::stringstream buffer;
  buffer << in.rdbuf();
  return parse_model_config(buffer.str());
}

}  // namespace agrorisk::risk
