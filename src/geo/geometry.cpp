#include "geo/geometry.hpp"

#include <algorithm>
#include <cmath>
#include <numbers>

namespace cellwatch::geo {

namespace {

double ToRadians(const double degrees) {
  return degrees * std::numbers::pi / 180.0;
}

double ToDegrees(const double radians) {
  return radians * 180.0 / std::numbers::pi;
}

} // namespace

double NormalizeDegrees(const double degrees) {
  double normalized = std::fmod(degrees, 360.0);
  if (normalized < 0.0) {
    normalized += 360.0;
  }
  // fmod(-1e-17 + 360) rounds to exactly 360.0.
  if (normalized >= 360.0) {
    normalized = 0.0;
  }
  return normalized;
}

double Bearing(const double lat1, const double lon1, const double lat2, const double lon2) {
  const double phi1 = ToRadians(lat1);
  const double phi2 = ToRadians(lat2);
  const double delta_lambda = ToRadians(lon2 - lon1);

  const double y = std::sin(delta_lambda) * std::cos(phi2);
  const double x =
      std::cos(phi1) * std::sin(phi2) - std::sin(phi1) * std::cos(phi2) * std::cos(delta_lambda);

  return NormalizeDegrees(ToDegrees(std::atan2(y, x)) + 360.0);
}

bool WithinCoverage(const double bearing_deg, const double azimuth_deg,
                    const double half_beamwidth_deg) {
  if (half_beamwidth_deg >= 180.0) {
    return true;
  }

  const double bearing = NormalizeDegrees(bearing_deg);
  const double lower = NormalizeDegrees(azimuth_deg - half_beamwidth_deg);
  const double upper = NormalizeDegrees(azimuth_deg + half_beamwidth_deg);

  if (lower <= upper) {
    return bearing >= lower && bearing <= upper;
  }
  return bearing >= lower || bearing <= upper;
}

double GreatCircleDistanceKm(const LatLon& p1, const LatLon& p2) {
  const double phi1 = ToRadians(p1.latitude);
  const double phi2 = ToRadians(p2.latitude);
  const double delta_phi = phi2 - phi1;
  const double delta_lambda = ToRadians(p2.longitude - p1.longitude);

  const double sin_half_phi = std::sin(delta_phi / 2.0);
  const double sin_half_lambda = std::sin(delta_lambda / 2.0);
  const double a = sin_half_phi * sin_half_phi +
                   std::cos(phi1) * std::cos(phi2) * sin_half_lambda * sin_half_lambda;
  const double c = 2.0 * std::asin(std::sqrt(std::clamp(a, 0.0, 1.0)));
  return kEarthRadiusKm * c;
}

} // namespace cellwatch::geo
