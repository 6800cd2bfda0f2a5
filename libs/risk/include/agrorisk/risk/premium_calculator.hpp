/**
 * @file premium_calculator.hpp
 * @brief Per-peril and total premium from peril scores and parcel area.
 * @author Watosn
 */
#pragma once

#include <array>

#include "agrorisk/core/types.hpp"
#include "agrorisk/risk/config.hpp"
#include "agrorisk/risk/peril_scorer.hpp"

namespace agrorisk::risk {

inline constexpr double kDefaultCoverage = 1.0;

/**
 * @brief One peril's share of the premium.
 */
struct PremiumLineItem {
  agrorisk::core::Peril peril{agrorisk::core::Peril::Drought};
  double weight{};
  double amount{};
};

/**
 * @brief Premium line items and their total.
 */
struct PremiumBreakdown {
  std::array<PremiumLineItem, agrorisk::core::kPerilCount> items{};
  double total{};
  agrorisk::core::Status status{agrorisk::core::Status::Ok};

  [[nodiscard]] const PremiumLineItem& at(agrorisk::core::Peril peril) const {
    return items[static_cast<std::size_t>(peril)];
  }
};

/**
 * @brief Premium pricing with static peril weights.
 *
 * amount(p) = round2(base_rate * score(p) * area_ha * coverage * weight(p)); total = sum of the
 * rounded amounts. Coverage range is not checked here.
 */
class PremiumCalculator {
 public:
  explicit PremiumCalculator(const RiskModelConfig& config) : config_(config) {}

  /**
   * @brief Price explicit peril scores, indexed by `core::Peril`.
   * @return `InvalidInput` when a score, the area or the coverage is non-finite.
   */
  [[nodiscard]] PremiumBreakdown calculate(const std::array<double, agrorisk::core::kPerilCount>& scores,
                                           double area_ha,
                                           double coverage = kDefaultCoverage) const;

  /**
   * @brief Price the reported (3-decimal) scores of a peril report.
   */
  [[nodiscard]] PremiumBreakdown calculate(const PerilReport& perils, double area_ha,
                                           double coverage = kDefaultCoverage) const;

 private:
  const RiskModelConfig& config_;
};

}  // namespace agrorisk::risk
