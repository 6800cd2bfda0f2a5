/**
 * @file portfolio.hpp
 * @brief Batch parcel rows and the portfolio roll-up over their reports.
 * @author Watosn
 */
#pragma once

#include <array>
#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>

#include "agrorisk/core/types.hpp"
#include "agrorisk/risk/risk_pipeline.hpp"

namespace agrorisk::risk {

/**
 * @brief One batch input row: `geojson_path[,coverage]`.
 */
struct ParcelEntry {
  std::filesystem::path geojson_file{};
  double coverage{kDefaultCoverage};
};

/**
 * @brief Parse a batch input row. A trailing carriage return is ignored.
 * @return `std::nullopt` for an empty path or an unparsable coverage.
 */
[[nodiscard]] std::optional<ParcelEntry> parse_parcel_entry(const std::string& line);

/**
 * @brief Header of the batch output CSV.
 */
[[nodiscard]] const std::string& batch_csv_header();

/**
 * @brief One output CSV row (with trailing newline) for an evaluated parcel.
 *
 * Failed reports keep the path, coverage and status columns and leave every other column empty.
 */
[[nodiscard]] std::string format_batch_row(const ParcelEntry& entry, const RiskReport& report);

/**
 * @brief Output CSV row for a parcel that failed before evaluation (polygon or area step).
 */
[[nodiscard]] std::string format_batch_failure(const ParcelEntry& entry, agrorisk::core::Status status);

/**
 * @brief Running totals over a batch of parcel reports.
 *
 * A hotspot is a parcel whose overall risk score exceeds the high severity threshold.
 */
class PortfolioSummary {
 public:
  explicit PortfolioSummary(double hotspot_threshold) : hotspot_threshold_(hotspot_threshold) {}

  /**
   * @brief Fold one report in; failed reports only count toward `failed()`.
   */
  void add(const RiskReport& report);

  /**
   * @brief Count a parcel that failed before it reached the pipeline.
   */
  void add_failure() { ++failed_; }

  [[nodiscard]] std::size_t parcels() const noexcept { return parcels_; }
  [[nodiscard]] std::size_t failed() const noexcept { return failed_; }
  [[nodiscard]] std::size_t hotspots() const noexcept { return hotspots_; }
  [[nodiscard]] double total_premium() const noexcept { return total_premium_; }
  [[nodiscard]] double exposure(agrorisk::core::Peril peril) const {
    return exposure_[static_cast<std::size_t>(peril)];
  }

 private:
  double hotspot_threshold_;
  std::size_t parcels_{};
  std::size_t failed_{};
  std::size_t hotspots_{};
  double total_premium_{};
  std::array<double, agrorisk::core::kPerilCount> exposure_{};
};

}  // namespace agrorisk::risk
