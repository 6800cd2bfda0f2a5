/**
 * @file geojson.hpp
 * @brief GeoJSON polygon reader.
 * @author Watosn
 */
#pragma once

#include <filesystem>
#include <string>

#include "agrorisk/core/types.hpp"
#include "agrorisk/geo/polygon.hpp"

namespace agrorisk::geo {

/**
 * @brief Parsed and validated polygon.
 */
struct ParsedPolygon {
  Polygon polygon{};
  agrorisk::core::Status status{agrorisk::core::Status::Ok};
  std::string error{};
};

/**
 * @brief Parse a GeoJSON `Feature` with Polygon geometry, or a bare `Polygon` geometry.
 *
 * The first ring is the exterior and the remaining rings are holes. Positions may carry
 * a third (altitude) member, which is ignored. The result is passed through `validate`.
 * Any JSON or structural problem yields `InvalidGeometry`.
 */
[[nodiscard]] ParsedPolygon parse_geojson(const std::string& text);

/**
 * @brief Read a file and parse it with `parse_geojson`.
 * @return `InvalidInput` when the file cannot be opened.
 */
[[nodiscard]] ParsedPolygon load_geojson(const std::filesystem::path& path);

}  // namespace agrorisk::geo
