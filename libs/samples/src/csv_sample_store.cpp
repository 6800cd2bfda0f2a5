/**
 * @file csv_sample_store.cpp
 * @brief CSV sample store implementation.
 * @author Watosn
 */

#include "agrorisk/samples/csv_sample_store.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <optional>
#include <sstream>
#include <utility>
#include <vector>

#include <fmt/format.h>

namespace agrorisk::samples {
namespace {

using agrorisk::core::Dataset;
using agrorisk::core::SampleTable;
using agrorisk::core::Status;

std::string trim(const std::string& text) {
  std::size_t begin = 0;
  std::size_t end = text.size();
  while (begin < end && std::isspace(static_cast<unsigned char>(text[begin])) != 0) {
    ++begin;
  }
  while (end > begin && std::isspace(static_cast<unsigned char>(text[end - 1])) != 0) {
    --end;
  }
  std::string out = text.substr(begin, end - begin);
  if (out.size() >= 2 && out.front() == '"' && out.back() == '"') {
    out = out.substr(1, out.size() - 2);
  }
  return out;
}

std::vector<std::string> split_csv_line(const std::string& line) {
  std::vector<std::string> fields;
  std::string token;
  std::stringstream ss(line);
  while (std::getline(ss, token, ',')) {
    fields.push_back(trim(token));
  }
  if (!line.empty() && line.back() == ',') {
    fields.emplace_back();
  }
  return fields;
}

std::string lower(std::string text) {
  std::transform(text.begin(), text.end(), text.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return text;
}

std::optional<std::size_t> find_column(const std::vector<std::string>& header, const std::string& name) {
  const auto key = lower(name);
  for (std::size_t i = 0; i < header.size(); ++i) {
    if (lower(header[i]) == key) {
      return i;
    }
  }
  return std::nullopt;
}

bool parse_double(const std::string& text, double& value) {
  if (text.empty()) {
    return false;
  }
  char* end = nullptr;
  value = std::strtod(text.c_str(), &end);
  return end != text.c_str() && *end == '\0' && std::isfinite(value);
}

bool is_blank(const std::string& line) {
  return std::all_of(line.begin(), line.end(), [](unsigned char c) { return std::isspace(c) != 0; });
}

SampleTable unavailable(Dataset dataset, std::string error) {
  return SampleTable{.dataset = dataset, .status = Status::DataUnavailable, .error = std::move(error)};
}

}  // namespace

CsvSampleStore::Config CsvSampleStore::Config::from_directory(const std::filesystem::path& data_dir) {
  Config config{};
  config.ndvi.csv_file = data_dir / "ndvi.csv";
  config.elevation.csv_file = data_dir / "elevation.csv";
  config.weather.csv_file = data_dir / "weather.csv";
  return config;
}

const CsvSampleStore::TableSource& CsvSampleStore::source_for(Dataset dataset) const {
  switch (dataset) {
    case Dataset::Elevation:
      return config_.elevation;
    case Dataset::Weather:
      return config_.weather;
    case Dataset::Vegetation:
    default:
      return config_.ndvi;
  }
}

SampleTable CsvSampleStore::load(Dataset dataset) const {
  const auto& source = source_for(dataset);
  std::ifstream in(source.csv_file);
  if (!in) {
    return unavailable(dataset, fmt::format("cannot open {}", source.csv_file.string()));
  }

  std::string line;
  std::size_t line_no = 0;
  std::vector<std::string> header;
  while (std::getline(in, line)) {
    ++line_no;
    if (!is_blank(line)) {
      header = split_csv_line(line);
      break;
    }
  }
  if (header.empty()) {
    return unavailable(dataset, fmt::format("{} has no header row", source.csv_file.string()));
  }

  const auto lon_col = find_column(header, "lon");
  const auto lat_col = find_column(header, "lat");
  const auto value_col = find_column(header, source.value_column);
  if (!lon_col || !lat_col || !value_col) {
    return unavailable(dataset, fmt::format("{} header lacks lon, lat or {} column", source.csv_file.string(),
                                            source.value_column));
  }
  const std::size_t min_fields = std::max({*lon_col, *lat_col, *value_col}) + 1U;

  SampleTable table{.dataset = dataset};
  while (std::getline(in, line)) {
    ++line_no;
    if (is_blank(line)) {
      continue;
    }
    const auto fields = split_csv_line(line);
    agrorisk::core::Sample sample{};
    if (fields.size() < min_fields || !parse_double(fields[*lon_col], sample.lon_deg) ||
        !parse_double(fields[*lat_col], sample.lat_deg) || !parse_double(fields[*value_col], sample.value)) {
      return unavailable(dataset, fmt::format("{}:{} is malformed", source.csv_file.string(), line_no));
    }
    table.samples.push_back(sample);
  }

  if (table.samples.empty()) {
    return unavailable(dataset, fmt::format("{} has no samples", source.csv_file.string()));
  }
  table.status = Status::Ok;
  return table;
}

}  // namespace agrorisk::samples
