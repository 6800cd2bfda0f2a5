/**
 * @file interfaces.hpp
 * @brief Core data-source interfaces.
 * @author Watosn
 */
#pragma once

#include "agrorisk/core/types.hpp"

namespace agrorisk::core {

/**
 * @brief Interface for named point-sample tables.
 */
class ISampleStore {
 public:
  virtual ~ISampleStore() = default;
  /**
   * @brief Load the full sample table for one dataset.
   * @param dataset Dataset identifier.
   * @return Table with `status` set; `DataUnavailable` when the backing table is missing, malformed or empty.
   */
  [[nodiscard]] virtual SampleTable load(Dataset dataset) const = 0;
};

}  // namespace agrorisk::core
