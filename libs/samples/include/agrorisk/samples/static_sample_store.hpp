/**
 * @file static_sample_store.hpp
 * @brief In-memory sample store.
 * @author Watosn
 */
#pragma once

#include <array>
#include <cstddef>
#include <optional>
#include <utility>
#include <vector>

#include "agrorisk/core/interfaces.hpp"

namespace agrorisk::samples {

/**
 * @brief Fixed in-memory tables for testing and deterministic runs.
 * @note A dataset that was never set, or was set to an empty table, loads as `DataUnavailable`.
 */
class StaticSampleStore final : public agrorisk::core::ISampleStore {
 public:
  StaticSampleStore() = default;

  void set(agrorisk::core::Dataset dataset, std::vector<agrorisk::core::Sample> samples) {
    tables_[static_cast<std::size_t>(dataset)] = std::move(samples);
  }

  [[nodiscard]] agrorisk::core::SampleTable load(agrorisk::core::Dataset dataset) const override {
    const auto& table = tables_[static_cast<std::size_t>(dataset)];
    if (!table.has_value() || table->empty()) {
      return agrorisk::core::SampleTable{.dataset = dataset,
                                         .status = agrorisk::core::Status::DataUnavailable,
                                         .error = "no samples configured"};
    }
    return agrorisk::core::SampleTable{.dataset = dataset, .samples = *table, .status = agrorisk::core::Status::Ok};
  }

 private:
  std::array<std::optional<std::vector<agrorisk::core::Sample>>, agrorisk::core::kDatasetCount> tables_{};
};

}  // namespace agrorisk::samples
