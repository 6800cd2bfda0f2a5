/**
 * @file peril_scorer.hpp
 * @brief Multi-peril scoring from the three parcel aggregates.
 * @author Watosn
 */
#pragma once

#include <array>
#include <string>

#include "agrorisk/core/types.hpp"
#include "agrorisk/risk/config.hpp"

namespace agrorisk::risk {

/**
 * @brief Concrete aggregates fed to the scorer; missing values are substituted upstream.
 */
struct PerilInputs {
  double ndvi{};
  double elevation_m{};
  double weather{};
};

/**
 * @brief One peril's score and explanation.
 *
 * `raw_score` is clamped to [0,1]; `score` is `raw_score` rounded to 3 decimals and drives `severity`.
 */
struct PerilScore {
  agrorisk::core::Peril peril{agrorisk::core::Peril::Drought};
  double raw_score{};
  double score{};
  agrorisk::core::Severity severity{agrorisk::core::Severity::Low};
  std::string explanation{};
};

/**
 * @brief Scores for all five perils plus the overall risk score.
 */
struct PerilReport {
  std::array<PerilScore, agrorisk::core::kPerilCount> perils{};
  double raw_risk_score{};
  double risk_score{};
  agrorisk::core::Status status{agrorisk::core::Status::Ok};

  [[nodiscard]] const PerilScore& at(agrorisk::core::Peril peril) const {
    return perils[static_cast<std::size_t>(peril)];
  }
};

/**
 * @brief Unclamped peril formula.
 *
 * drought    = max(0, 1 - (ndvi + weather/20))
 * flood      = max(0, 1 - elevation/2000 + weather/20)
 * hail       = min(1, 0.7 * elevation/2000 + 0.2)
 * frost      = min(1, 0.5 * elevation/2000 + 0.5 * (1 - ndvi))
 * pestilence = min(1, 0.8 * ndvi)
 */
[[nodiscard]] double peril_formula(agrorisk::core::Peril peril, const PerilInputs& in);

/**
 * @brief Pure mapping from the three aggregates to peril scores.
 */
class PerilScorer {
 public:
  explicit PerilScorer(const RiskModelConfig& config) : config_(config) {}

  /**
   * @brief Score every peril.
   * @return `InvalidInput` when any input is non-finite.
   */
  [[nodiscard]] PerilReport score(const PerilInputs& in) const;

  [[nodiscard]] agrorisk::core::Severity severity_of(double score) const;

 private:
  [[nodiscard]] std::string explain(agrorisk::core::Peril peril, agrorisk::core::Severity severity,
                                    const PerilInputs& in) const;

  const RiskModelConfig& config_;
};

}  // namespace agrorisk::risk
