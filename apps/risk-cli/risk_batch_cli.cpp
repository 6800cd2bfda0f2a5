/**
 * @file risk_batch_cli.cpp
 * @brief Batch parcel risk CLI.
 * @author Watosn
 */

#include <filesystem>
#include <fstream>
#include <string>

#include <spdlog/spdlog.h>

#include "agrorisk/geo/geojson.hpp"
#include "agrorisk/geo/projection.hpp"
#include "agrorisk/risk/config.hpp"
#include "agrorisk/risk/portfolio.hpp"
#include "agrorisk/risk/risk_pipeline.hpp"
#include "agrorisk/samples/csv_sample_store.hpp"

int main(int argc, char** argv) {
  if (argc < 3 || argc > 5) {
    spdlog::error("usage: risk_batch_cli <input_csv> <output_csv> [data_dir] [config_json]");
    spdlog::error("input row: geojson_path[,coverage]");
    return 1;
  }

  const std::filesystem::path input_csv = argv[1];
  const std::filesystem::path output_csv = argv[2];
  const std::filesystem::path data_dir = (argc >= 4) ? argv[3] : "data";
  const std::string config_file = (argc >= 5) ? argv[4] : "";

  agrorisk::risk::RiskModelConfig config{};
  if (!config_file.empty()) {
    const auto loaded = agrorisk::risk::load_model_config(config_file);
    if (loaded.status != agrorisk::core::Status::Ok) {
      spdlog::error("config rejected: {}", loaded.error);
      return 2;
    }
    config = loaded.config;
  }

  std::ifstream in(input_csv);
  if (!in) {
    spdlog::error("failed to open input csv: {}", input_csv.string());
    return 3;
  }
  std::ofstream out(output_csv);
  if (!out) {
    spdlog::error("failed to open output csv: {}", output_csv.string());
    return 4;
  }

  const agrorisk::samples::CsvSampleStore store(agrorisk::samples::CsvSampleStore::Config::from_directory(data_dir));
  const agrorisk::risk::RiskPipeline pipeline(store, config);

  out << agrorisk::risk::batch_csv_header();

  agrorisk::risk::PortfolioSummary portfolio(config.severity.high);
  std::string line;
  std::size_t line_no = 0;
  while (std::getline(in, line)) {
    ++line_no;
    if (line.empty() || line == "\r") {
      continue;
    }
    if (line_no == 1 && line.rfind("geojson", 0) == 0) {
      continue;
    }
    const auto entry = agrorisk::risk::parse_parcel_entry(line);
    if (!entry) {
      spdlog::warn("skipping malformed row {}", line_no);
      continue;
    }

    const auto parsed = agrorisk::geo::load_geojson(entry->geojson_file);
    if (parsed.status != agrorisk::core::Status::Ok) {
      spdlog::warn("row {}: polygon rejected: {}", line_no, parsed.error);
      out << agrorisk::risk::format_batch_failure(*entry, parsed.status);
      portfolio.add_failure();
      continue;
    }
    const auto area = agrorisk::geo::web_mercator_area(parsed.polygon);
    if (area.status != agrorisk::core::Status::Ok) {
      spdlog::warn("row {}: area projection failed", line_no);
      out << agrorisk::risk::format_batch_failure(*entry, area.status);
      portfolio.add_failure();
      continue;
    }

    const auto report = pipeline.evaluate(agrorisk::risk::RiskRequest{
        .polygon = parsed.polygon, .area_ha = area.area_ha, .coverage = entry->coverage});
    if (report.status != agrorisk::core::Status::Ok) {
      spdlog::warn("row {}: {}", line_no, report.error);
    }
    out << agrorisk::risk::format_batch_row(*entry, report);
    portfolio.add(report);
  }

  spdlog::info("wrote risk batch output: {} ({} parcels, {} failed rows)", output_csv.string(), portfolio.parcels(),
               portfolio.failed());
  spdlog::info("portfolio premium={:.2f} hotspots={} (risk_score > {})", portfolio.total_premium(),
               portfolio.hotspots(), config.severity.high);
  for (const auto peril : agrorisk::core::kAllPerils) {
    spdlog::info("exposure {}={:.2f}", agrorisk::core::peril_name(peril), portfolio.exposure(peril));
  }
  return 0;
}
