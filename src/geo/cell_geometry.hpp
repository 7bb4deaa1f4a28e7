#pragma once

#include "geo/geometry.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace cellwatch::geo {

// Static antenna metadata for one cell. `max_distance_km` is the facing range
// for this cell's region and differs between provinces.
struct CellGeometry {
  std::string cell_id;
  std::string site_id;
  double latitude = 0.0;
  double longitude = 0.0;
  double azimuth_deg = 0.0;
  double max_distance_km = 0.0;

  LatLon Position() const {
    return {.latitude = latitude, .longitude = longitude};
  }

  bool operator==(const CellGeometry& other) const = default;
};

// Geometry rows plus a cell_id -> row index. Rows keep their input order,
// which is the order neighbor lists are reported in.
class GeometryTable {
public:
  GeometryTable() = default;

  // Builds the table after validation. Returns false and sets `error` for
  // malformed rows (azimuth outside [0,360), non-finite or out-of-range
  // coordinates, non-positive max distance, empty or duplicate ids).
  static bool Build(std::vector<CellGeometry> rows, GeometryTable& table, std::string& error);

  const std::vector<CellGeometry>& Rows() const {
    return rows_;
  }

  std::size_t Size() const {
    return rows_.size();
  }

  const CellGeometry* Find(std::string_view cell_id) const;

  std::optional<std::size_t> IndexOf(std::string_view cell_id) const;

private:
  std::vector<CellGeometry> rows_;
  std::unordered_map<std::string, std::size_t> index_;
};

// Row-level validation used by GeometryTable::Build and the CSV loader.
bool ValidateCellGeometry(const CellGeometry& cell, std::string& error);

} // namespace cellwatch::geo
