/**
 * @file geojson.cpp
 * @brief GeoJSON polygon reader implementation.
 * @author Watosn
 */

#include "agrorisk/geo/geojson.hpp"

#include <fstream>
#include <sstream>
#include <utility>

#include <fmt/format.h>
#include <nlohmann/json.hpp>

namespace agrorisk::geo {
namespace {

using agrorisk::core::Status;

ParsedPolygon geometry_error(std::string message) {
  return ParsedPolygon{.status = Status::InvalidGeometry, .error = std::move(message)};
}

bool parse_ring(const nlohmann::json& node, Ring& ring, std::string& error) {
  if (!node.is_array()) {
    error = "ring is not an array";
    return false;
  }
  ring.clear();
  ring.reserve(node.size());
  for (const auto& position : node) {
    if (!position.is_array() || position.size() < 2 || !position[0].is_number() || !position[1].is_number()) {
      error = fmt::format("position {} is not a [lon, lat] pair", ring.size());
      return false;
    }
    ring.push_back(agrorisk::core::LonLat{position[0].get<double>(), position[1].get<double>()});
  }
  return true;
}

ParsedPolygon parse_polygon_geometry(const nlohmann::json& geometry) {
  if (!geometry.is_object()) {
    return geometry_error("geometry is not an object");
  }
  const std::string type = geometry.value("type", std::string{});
  if (type != "Polygon") {
    return geometry_error(fmt::format("unsupported geometry type '{}'", type));
  }
  const auto coords = geometry.find("coordinates");
  if (coords == geometry.end() || !coords->is_array() || coords->empty()) {
    return geometry_error("polygon has no coordinates");
  }

  ParsedPolygon out{};
  std::string error;
  if (!parse_ring(coords->at(0), out.polygon.exterior, error)) {
    return geometry_error("exterior " + error);
  }
  for (std::size_t i = 1; i < coords->size(); ++i) {
    Ring hole;
    if (!parse_ring(coords->at(i), hole, error)) {
      return geometry_error(fmt::format("hole {} {}", i - 1, error));
    }
    out.polygon.holes.push_back(std::move(hole));
  }

  const auto check = validate(out.polygon);
  out.status = check.status;
  out.error = check.error;
  return out;
}

}  // namespace

ParsedPolygon parse_geojson(const std::string& text) {
  try {
    const auto doc = nlohmann::json::parse(text);
    if (!doc.is_object()) {
      return geometry_error("document is not a JSON object");
    }
    const std::string type = doc.value("type", std::string{});
    if (type == "Feature" || (type.empty() && doc.contains("geometry"))) {
      const auto geometry = doc.find("geometry");
      if (geometry == doc.end() || geometry->is_null()) {
        return geometry_error("feature has no geometry");
      }
      return parse_polygon_geometry(*geometry);
    }
    return parse_polygon_geometry(doc);
  } catch (const nlohmann::json::exception& e) {
    return geometry_error(fmt::format("malformed GeoJSON: {}", e.what()));
  }
}

ParsedPolygon load_geojson(const std::filesystem::path& path) {
  std::ifstream in(path);
  if (!in) {
    return ParsedPolygon{.status = Status::InvalidInput, .error = fmt::format("cannot open {}", path.string())};
  }
  std::stringstream buffer;
  buffer << in.rdbuf();
  return parse_geojson(buffer.str());
}

}  // namespace agrorisk::geo
