#pragma once

namespace cellwatch::geo {

// Mean Earth radius used for great-circle distance.
inline constexpr double kEarthRadiusKm = 6371.009;

// Default half-beamwidth of a sector antenna: a 120 degree coverage cone.
inline constexpr double kDefaultHalfBeamwidthDeg = 60.0;

struct LatLon {
  double latitude = 0.0;
  double longitude = 0.0;
};

// Initial compass bearing (forward azimuth) from point 1 to point 2 along the
// great circle. Inputs in decimal degrees; result normalized into [0, 360).
double Bearing(double lat1, double lon1, double lat2, double lon2);

// True when `bearing_deg` lies inside [azimuth - half_beamwidth,
// azimuth + half_beamwidth] on the compass circle. Both bounds are inclusive.
// When the interval crosses north the accepted set is [lower, 360) U [0, upper].
bool WithinCoverage(double bearing_deg, double azimuth_deg,
                    double half_beamwidth_deg = kDefaultHalfBeamwidthDeg);

// Haversine distance in kilometers.
double GreatCircleDistanceKm(const LatLon& p1, const LatLon& p2);

// Normalizes any finite angle into [0, 360).
double NormalizeDegrees(double degrees);

} // namespace cellwatch::geo
