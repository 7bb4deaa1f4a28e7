#include "traffic/observation.hpp"

namespace cellwatch::traffic {

const char* ToString(const TrafficLabel label) {
  switch (label) {
  case TrafficLabel::kStable:
    return "STABLE";
  case TrafficLabel::kIncrease:
    return "INCREASE";
  case TrafficLabel::kDegradation:
    return "DEGRADATION";
  }
  return "STABLE";
}

} // namespace cellwatch::traffic
