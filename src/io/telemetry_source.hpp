#pragma once

#include "geo/cell_geometry.hpp"
#include "traffic/observation.hpp"

#include <string>
#include <vector>

namespace cellwatch::io {

// Injected provider of analysis inputs.
//
// The pipeline never opens files or database sessions itself; it asks a
// source for already-cleaned traffic rows and raw geometry rows. Geometry is
// validated by the pipeline, so sources may return rows as stored.
class ITelemetrySource {
public:
  virtual ~ITelemetrySource() = default;

  // Short label for logs, e.g. "csv".
  virtual std::string Describe() const = 0;

  virtual bool LoadTraffic(std::vector<traffic::TrafficObservation>& rows,
                           std::string& error) = 0;

  virtual bool LoadGeometry(std::vector<geo::CellGeometry>& rows, std::string& error) = 0;
};

} // namespace cellwatch::io
