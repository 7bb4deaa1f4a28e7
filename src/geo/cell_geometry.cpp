#include "geo/cell_geometry.hpp"

#include <cmath>
#include <utility>

namespace cellwatch::geo {

bool ValidateCellGeometry(const CellGeometry& cell, std::string& error) {
  if (cell.cell_id.empty()) {
    error = "cell_id must not be empty";
    return false;
  }

  const std::string context = "cell '" + cell.cell_id + "': ";
  if (cell.site_id.empty()) {
    error = context + "site_id must not be empty";
    return false;
  }
  if (!std::isfinite(cell.latitude) || cell.latitude < -90.0 || cell.latitude > 90.0) {
    error = context + "latitude must be within [-90, 90]";
    return false;
  }
  if (!std::isfinite(cell.longitude) || cell.longitude < -180.0 || cell.longitude > 180.0) {
    error = context + "longitude must be within [-180, 180]";
    return false;
  }
  if (!std::isfinite(cell.azimuth_deg) || cell.azimuth_deg < 0.0 || cell.azimuth_deg >= 360.0) {
    error = context + "azimuth must be within [0, 360)";
    return false;
  }
  if (!std::isfinite(cell.max_distance_km) || cell.max_distance_km <= 0.0) {
    error = context + "max_distance_km must be > 0";
    return false;
  }
  return true;
}

bool GeometryTable::Build(std::vector<CellGeometry> rows, GeometryTable& table,
                          std::string& error) {
  std::unordered_map<std::string, std::size_t> index;
  index.reserve(rows.size());
  for (std::size_t i = 0; i < rows.size(); ++i) {
    if (!ValidateCellGeometry(rows[i], error)) {
      return false;
    }
    if (!index.emplace(rows[i].cell_id, i).second) {
      error = "duplicate geometry row for cell '" + rows[i].cell_id + "'";
      return false;
    }
  }

  table.rows_ = std::move(rows);
  table.index_ = std::move(index);
  return true;
}

const CellGeometry* GeometryTable::Find(std::string_view cell_id) const {
  const auto index = IndexOf(cell_id);
  if (!index.has_value()) {
    return nullptr;
  }
  return &rows_[*index];
}

std::optional<std::size_t> GeometryTable::IndexOf(std::string_view cell_id) const {
  const auto it = index_.find(std::string(cell_id));
  if (it == index_.end()) {
    return std::nullopt;
  }
  return it->second;
}

} // namespace cellwatch::geo
