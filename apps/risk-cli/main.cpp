/**
 * @file main.cpp
 * @brief agrorisk single-parcel command-line entrypoint.
 * @author Watosn
 */

#include <cstdlib>
#include <filesystem>
#include <string>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include "agrorisk/geo/geojson.hpp"
#include "agrorisk/geo/projection.hpp"
#include "agrorisk/risk/config.hpp"
#include "agrorisk/risk/report_json.hpp"
#include "agrorisk/risk/risk_pipeline.hpp"
#include "agrorisk/samples/csv_sample_store.hpp"

int main(int argc, char** argv) {
  if (argc < 2 || argc > 6) {
    spdlog::error("usage: risk_cli <polygon.geojson> [coverage] [data_dir] [config_json] [json:0|1]");
    spdlog::error("data_dir holds ndvi.csv, elevation.csv and weather.csv (default: data)");
    return 1;
  }

  const std::filesystem::path polygon_file = argv[1];
  const double coverage = (argc >= 3) ? std::atof(argv[2]) : agrorisk::risk::kDefaultCoverage;
  const std::filesystem::path data_dir = (argc >= 4) ? argv[3] : "data";
  const std::string config_file = (argc >= 5) ? argv[4] : "";
  const bool as_json = (argc >= 6) ? (std::atoi(argv[5]) != 0) : false;

  agrorisk::risk::RiskModelConfig config{};
  if (!config_file.empty()) {
    const auto loaded = agrorisk::risk::load_model_config(config_file);
    if (loaded.status != agrorisk::core::Status::Ok) {
      spdlog::error("config rejected: {}", loaded.error);
      return 2;
    }
    config = loaded.config;
  }

  const auto parsed = agrorisk::geo::load_geojson(polygon_file);
  if (parsed.status != agrorisk::core::Status::Ok) {
    spdlog::error("polygon rejected ({}): {}", agrorisk::core::status_name(parsed.status), parsed.error);
    return 3;
  }

  const auto area = agrorisk::geo::web_mercator_area(parsed.polygon);
  if (area.status != agrorisk::core::Status::Ok) {
    spdlog::error("area projection failed ({})", agrorisk::core::status_name(area.status));
    return 4;
  }

  const agrorisk::samples::CsvSampleStore store(agrorisk::samples::CsvSampleStore::Config::from_directory(data_dir));
  const agrorisk::risk::RiskPipeline pipeline(store, config);
  const auto report = pipeline.evaluate(agrorisk::risk::RiskRequest{
      .polygon = parsed.polygon, .area_ha = area.area_ha, .coverage = coverage});

  if (as_json) {
    fmt::print("{}\n", agrorisk::risk::report_to_json(report).dump(2));
    return report.status == agrorisk::core::Status::Ok ? 0 : 5;
  }
  if (report.status != agrorisk::core::Status::Ok) {
    spdlog::error("risk evaluation failed ({}): {}", agrorisk::core::status_name(report.status), report.error);
    return 5;
  }

  for (const auto& a : report.aggregates) {
    if (a.substituted) {
      spdlog::warn("{} unavailable, neutral default {} used", agrorisk::core::dataset_name(a.dataset), a.value);
    }
    fmt::print("{}={} contained={}/{} fallback={}\n", agrorisk::core::dataset_name(a.dataset), a.value, a.contained_count,
               a.sample_count, a.used_fallback ? 1 : 0);
  }
  fmt::print("area_ha={:.2f} coverage={}\n", report.area_ha, report.coverage);
  for (const auto& p : report.perils.perils) {
    fmt::print("{:<10} score={:.3f} premium={:.2f}  {}\n", agrorisk::core::peril_name(p.peril), p.score,
               report.premium.at(p.peril).amount, p.explanation);
  }
  fmt::print("risk_score={:.3f} premium={:.2f}\n", report.risk_score(), report.total_premium());
  return 0;
}
