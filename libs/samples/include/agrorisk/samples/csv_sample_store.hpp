/**
 * @file csv_sample_store.hpp
 * @brief Point sample store backed by one CSV table per dataset.
 * @author Watosn
 */
#pragma once

#include <filesystem>
#include <string>
#include <utility>

#include "agrorisk/core/interfaces.hpp"

namespace agrorisk::samples {

/**
 * @brief Sample store that re-reads its CSV table on every load.
 *
 * Each table has a header row naming at least `lon`, `lat` and the dataset's value column.
 */
class CsvSampleStore final : public agrorisk::core::ISampleStore {
 public:
  /**
   * @brief Location and value column of one table.
   */
  struct TableSource {
    std::filesystem::path csv_file{};
    std::string value_column{};
  };

  /**
   * @brief CSV store configuration.
   */
  struct Config {
    TableSource ndvi{.value_column = "ndvi"};
    TableSource elevation{.value_column = "elevation"};
    TableSource weather{.value_column = "value"};

    /**
     * @brief Resolve `ndvi.csv`, `elevation.csv` and `weather.csv` under a data directory.
     */
    static Config from_directory(const std::filesystem::path& data_dir);
  };

  explicit CsvSampleStore(Config config) : config_(std::move(config)) {}

  /**
   * @brief Parse the dataset's table from disk.
   */
  [[nodiscard]] agrorisk::core::SampleTable load(agrorisk::core::Dataset dataset) const override;

  [[nodiscard]] const Config& config() const noexcept { return config_; }

 private:
  [[nodiscard]] const TableSource& source_for(agrorisk::core::Dataset dataset) const;

  Config config_{};
};

}  // namespace agrorisk::samples
