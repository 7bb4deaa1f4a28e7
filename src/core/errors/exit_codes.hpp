#pragma once

namespace cellwatch::core::errors {

// Stable process-exit contract for batch schedulers and wrappers.
//
// 0/1/2 keep their conventional script meanings. The remaining values let a
// scheduler tell a bad analysis config apart from bad telemetry without
// scraping stderr text.
enum class ExitCode : int {
  kSuccess = 0,
  kFailure = 1,
  kUsage = 2,
  kConfigInvalid = 10,
  kInputInvalid = 11,
};

constexpr int ToInt(ExitCode code) {
  return static_cast<int>(code);
}

} // namespace cellwatch::core::errors
