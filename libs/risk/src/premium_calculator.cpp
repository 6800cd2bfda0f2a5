/**
 * @file premium_calculator.cpp
 * @brief Premium calculation implementation.
 * @author Watosn
 */

#include "agrorisk/risk/premium_calculator.hpp"

#include <cmath>

#include "agrorisk/core/math_utils.hpp"

namespace agrorisk::risk {

PremiumBreakdown PremiumCalculator::calculate(const std::array<double, agrorisk::core::kPerilCount>& scores,
                                              double area_ha, double coverage) const {
  if (!std::isfinite(area_ha) || !std::isfinite(coverage)) {
    return PremiumBreakdown{.status = agrorisk::core::Status::InvalidInput};
  }

  PremiumBreakdown out{};
  double total = 0.0;
  for (const auto peril : agrorisk::core::kAllPerils) {
    const auto i = static_cast<std::size_t>(peril);
    if (!std::isfinite(scores[i])) {
      return PremiumBreakdown{.status = agrorisk::core::Status::InvalidInput};
    }
    const double weight = config_.weight(peril);
    const double raw = config_.base_rate * scores[i] * area_ha * coverage * weight;
    out.items[i] = PremiumLineItem{.peril = peril, .weight = weight, .amount = agrorisk::core::round_to(raw, 2)};
    total += out.items[i].amount;
  }
  // Summing already-rounded cents; the final round only strips binary residue.
  out.total = agrorisk::core::round_to(total, 2);
  return out;
}

PremiumBreakdown PremiumCalculator::calculate(const PerilReport& perils, double area_ha, double coverage) const {
  if (perils.status != agrorisk::core::Status::Ok) {
    return PremiumBreakdown{.status = perils.status};
  }
  std::array<double, agrorisk::core::kPerilCount> scores{};
  for (const auto& p : perils.perils) {
    scores[static_cast<std::size_t>(p.peril)] = p.score;
  }
  return calculate(scores, area_ha, coverage);
}

}  // namespace agrorisk::risk
