#include "common/analysis_fixtures.hpp"
#include "common/assertions.hpp"
#include "common/cli_dispatch.hpp"
#include "common/temp_dir.hpp"

#include <filesystem>
#include <string>

namespace fs = std::filesystem;

using namespace cellwatch::tests::common;

int main() {
  const fs::path temp_root = CreateUniqueTempDir("cellwatch-neighbors-smoke");
  const fs::path geometry = temp_root / "geometry.csv";
  WriteFileOrFail(geometry, ScenarioGeometryCsv());

  const DispatchOutput found =
      DispatchCaptured({"cellwatch", "neighbors", geometry.string(), "A1"});
  AssertExitCode(found.exit_code, 0, "neighbors for A1");
  AssertContains(found.out, "neighbor_cell,site_id,distance_km,bearing_deg\n");
  AssertContains(found.out, "A2,S2,2.000,90.000\n");
  AssertNotContains(found.out, "FAR");

  // A1 sits ~0 degrees off A2's boresight, so a narrow beam still matches.
  const DispatchOutput narrow = DispatchCaptured(
      {"cellwatch", "neighbors", geometry.string(), "A2", "--half-beamwidth", "5"});
  AssertExitCode(narrow.exit_code, 0, "neighbors with narrow beam");
  AssertContains(narrow.out, "A1,S1,");

  const DispatchOutput unknown =
      DispatchCaptured({"cellwatch", "neighbors", geometry.string(), "GHOST"});
  AssertExitCode(unknown.exit_code, 1, "unknown cell");
  AssertContains(unknown.err, "cell not found in geometry: GHOST");

  AssertExitCode(DispatchCaptured({"cellwatch", "neighbors", geometry.string()}).exit_code, 2,
                 "missing cell id");
  AssertExitCode(DispatchCaptured({"cellwatch", "neighbors", geometry.string(), "A1",
                                   "--half-beamwidth", "0"})
                     .exit_code,
                 2, "zero beamwidth");

  WriteFileOrFail(temp_root / "bad.csv",
                  "cell_id,site_id,latitude,longitude,azimuth,max_distance_km\n"
                  "A1,S1,0,0,360,5\n");
  const DispatchOutput bad =
      DispatchCaptured({"cellwatch", "neighbors", (temp_root / "bad.csv").string(), "A1"});
  AssertExitCode(bad.exit_code, 11, "invalid geometry");
  AssertContains(bad.err, "azimuth");

  RemovePathBestEffort(temp_root);
  return 0;
}
