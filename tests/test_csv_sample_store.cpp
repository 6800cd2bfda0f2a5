/**
 * @file test_csv_sample_store.cpp
 * @brief CSV point sample store tests.
 * @author Watosn
 */

#include <chrono>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <random>
#include <string>

#include <spdlog/spdlog.h>

#include "agrorisk/samples/csv_sample_store.hpp"
#include "agrorisk/samples/static_sample_store.hpp"

namespace {

bool approx(double a, double b, double tol = 1e-12) { return std::abs(a - b) <= tol; }

std::filesystem::path make_data_dir() {
  const auto dir = std::filesystem::temp_directory_path() /
                   ("agrorisk_csv_store_test_" +
                    std::to_string(std::chrono::high_resolution_clock::now().time_since_epoch().count()) + "_" +
                    std::to_string(std::random_device{}()));
  std::filesystem::create_directories(dir);
  return dir;
}

void write_file(const std::filesystem::path& path, const std::string& text) {
  std::ofstream out(path);
  out << text;
}

}  // namespace

int main() {
  using namespace agrorisk;
  const auto dir = make_data_dir();

  write_file(dir / "ndvi.csv", "lon,lat,ndvi,source\n10.0,45.0,0.42,s2\n\n10.01,45.0,0.58,s2\r\n");
  write_file(dir / "elevation.csv", "lat, lon ,elevation\n45.0,10.0,512.5\n45.01,10.01,498\n45.02,10.02,505\n");
  write_file(dir / "weather.csv", "lon,lat,value\n10.0,45.0,3.5\n");

  const samples::CsvSampleStore store(samples::CsvSampleStore::Config::from_directory(dir));
  if (store.config().weather.csv_file != dir / "weather.csv" || store.config().weather.value_column != "value" ||
      store.config().elevation.value_column != "elevation") {
    spdlog::error("from_directory layout mismatch");
    return 1;
  }

  const auto ndvi = store.load(core::Dataset::Vegetation);
  if (ndvi.status != core::Status::Ok || ndvi.dataset != core::Dataset::Vegetation || ndvi.samples.size() != 2U ||
      !approx(ndvi.samples[0].value, 0.42) || !approx(ndvi.samples[1].lon_deg, 10.01) ||
      !approx(ndvi.samples[1].value, 0.58)) {
    spdlog::error("ndvi table mismatch: {}", ndvi.error);
    return 2;
  }

  const auto elevation = store.load(core::Dataset::Elevation);
  if (elevation.status != core::Status::Ok || elevation.samples.size() != 3U ||
      !approx(elevation.samples[0].lon_deg, 10.0) || !approx(elevation.samples[0].lat_deg, 45.0) ||
      !approx(elevation.samples[0].value, 512.5)) {
    spdlog::error("reordered header columns not honored: {}", elevation.error);
    return 3;
  }

  // Every load re-reads the table.
  write_file(dir / "weather.csv", "lon,lat,value\n10.0,45.0,3.5\n10.01,45.01,4.5\n");
  const auto weather = store.load(core::Dataset::Weather);
  if (weather.status != core::Status::Ok || weather.samples.size() != 2U || !approx(weather.samples[1].value, 4.5)) {
    spdlog::error("weather table was not reloaded");
    return 4;
  }

  write_file(dir / "weather.csv", "lon,lat,rain\n10.0,45.0,3.5\n");
  const auto wrong_column = store.load(core::Dataset::Weather);
  if (wrong_column.status != core::Status::DataUnavailable || wrong_column.error.empty()) {
    spdlog::error("missing value column accepted");
    return 5;
  }

  write_file(dir / "weather.csv", "lon,lat,value\n10.0,45.0,3.5\n10.01,north,4.5\n");
  if (store.load(core::Dataset::Weather).status != core::Status::DataUnavailable) {
    spdlog::error("malformed row accepted");
    return 6;
  }

  write_file(dir / "weather.csv", "lon,lat,value\n10.0,45.0\n");
  if (store.load(core::Dataset::Weather).status != core::Status::DataUnavailable) {
    spdlog::error("short row accepted");
    return 7;
  }

  write_file(dir / "weather.csv", "lon,lat,value\n");
  if (store.load(core::Dataset::Weather).status != core::Status::DataUnavailable) {
    spdlog::error("header-only table accepted");
    return 8;
  }

  std::filesystem::remove(dir / "weather.csv");
  if (store.load(core::Dataset::Weather).status != core::Status::DataUnavailable) {
    spdlog::error("missing table accepted");
    return 9;
  }

  samples::CsvSampleStore::Config custom = samples::CsvSampleStore::Config::from_directory(dir);
  custom.ndvi.value_column = "source";
  const samples::CsvSampleStore custom_store(custom);
  if (custom_store.load(core::Dataset::Vegetation).status != core::Status::DataUnavailable) {
    spdlog::error("non-numeric value column accepted");
    return 10;
  }

  std::error_code ec;
  std::filesystem::remove_all(dir, ec);

  samples::StaticSampleStore fixed;
  if (fixed.load(core::Dataset::Elevation).status != core::Status::DataUnavailable) {
    spdlog::error("unset static table should be unavailable");
    return 11;
  }
  fixed.set(core::Dataset::Elevation, {{1.0, 2.0, 300.0}});
  const auto fixed_elev = fixed.load(core::Dataset::Elevation);
  if (fixed_elev.status != core::Status::Ok || fixed_elev.samples.size() != 1U || !approx(fixed_elev.samples[0].value, 300.0)) {
    spdlog::error("static table mismatch");
    return 12;
  }
  fixed.set(core::Dataset::Weather, {});
  if (fixed.load(core::Dataset::Weather).status != core::Status::DataUnavailable) {
    spdlog::error("empty static table should be unavailable");
    return 13;
  }

  return 0;
}
