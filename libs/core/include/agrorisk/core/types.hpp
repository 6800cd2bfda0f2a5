/**
 * @file types.hpp
 * @brief Core domain types for agrorisk.
 * @author Watosn
 */
#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace agrorisk::core {

/**
 * @brief Standard status code used by every fallible operation.
 */
enum class Status : std::uint8_t { Ok, InvalidInput, InvalidGeometry, DataUnavailable, NumericalError };

/**
 * @brief Short lowercase name for a status, used in logs and CSV output.
 */
inline const char* status_name(Status status) {
  switch (status) {
    case Status::Ok:
      return "ok";
    case Status::InvalidInput:
      return "invalid_input";
    case Status::InvalidGeometry:
      return "invalid_geometry";
    case Status::DataUnavailable:
      return "data_unavailable";
    case Status::NumericalError:
      return "numerical_error";
  }
  return "unknown";
}

/**
 * @brief The three point-sampled datasets aggregated over a parcel.
 */
enum class Dataset : std::uint8_t { Vegetation, Elevation, Weather };

inline constexpr std::size_t kDatasetCount = 3;
inline constexpr std::array<Dataset, kDatasetCount> kAllDatasets{Dataset::Vegetation, Dataset::Elevation, Dataset::Weather};

inline const char* dataset_name(Dataset dataset) {
  switch (dataset) {
    case Dataset::Vegetation:
      return "ndvi";
    case Dataset::Elevation:
      return "elevation";
    case Dataset::Weather:
      return "weather";
  }
  return "unknown";
}

/**
 * @brief Named agricultural perils, in report order.
 */
enum class Peril : std::uint8_t { Drought, Flood, Hail, Frost, Pestilence };

inline constexpr std::size_t kPerilCount = 5;
inline constexpr std::array<Peril, kPerilCount> kAllPerils{Peril::Drought, Peril::Flood, Peril::Hail, Peril::Frost,
                                                           Peril::Pestilence};

inline const char* peril_name(Peril peril) {
  switch (peril) {
    case Peril::Drought:
      return "drought";
    case Peril::Flood:
      return "flood";
    case Peril::Hail:
      return "hail";
    case Peril::Frost:
      return "frost";
    case Peril::Pestilence:
      return "pestilence";
  }
  return "unknown";
}

/**
 * @brief Severity bucket attached to each peril score.
 */
enum class Severity : std::uint8_t { Low, Moderate, High };

inline const char* severity_name(Severity severity) {
  switch (severity) {
    case Severity::Low:
      return "low";
    case Severity::Moderate:
      return "moderate";
    case Severity::High:
      return "high";
  }
  return "unknown";
}

/**
 * @brief WGS84 geographic position in degrees.
 */
struct LonLat {
  double lon_deg{};
  double lat_deg{};
};

inline bool operator==(const LonLat& a, const LonLat& b) { return a.lon_deg == b.lon_deg && a.lat_deg == b.lat_deg; }
inline bool operator!=(const LonLat& a, const LonLat& b) { return !(a == b); }

/**
 * @brief One dataset sample at a geographic position.
 *
 * `value` is dataset specific: NDVI in [-1,1], elevation in meters, weather index nominally in [0,10].
 */
struct Sample {
  double lon_deg{};
  double lat_deg{};
  double value{};
};

/**
 * @brief Full sample table for one dataset, as loaded from its backing store.
 */
struct SampleTable {
  Dataset dataset{Dataset::Vegetation};
  std::vector<Sample> samples{};
  Status status{Status::Ok};
  std::string error{};
};

}  // namespace agrorisk::core
