#include <track_radar/geo_math.hpp>

#include <algorithm>
#include <cmath>

namespace track_radar
{
namespace
{

constexpr double kDegToRad = M_PI / 180.0;
constexpr double kDegenerateArcM = 1e-6;

// Wraps an angle into (-pi, pi].
double wrapAngle(double angle)
{
  angle = std::fmod(angle + M_PI, 2.0 * M_PI);
  if (angle <= 0.0) {
    angle += 2.0 * M_PI;
  }
  return angle - M_PI;
}

}  // namespace

double distance(const GeoPoint & a, const GeoPoint & b)
{
  const double lat1 = a.latitude * kDegToRad;
  const double lat2 = b.latitude * kDegToRad;
  const double dLat = lat2 - lat1;
  const double dLon = (b.longitude - a.longitude) * kDegToRad;

  const double sinLat = std::sin(dLat / 2.0);
  const double sinLon = std::sin(dLon / 2.0);
  const double h = sinLat * sinLat + std::cos(lat1) * std::cos(lat2) * sinLon * sinLon;

  // Rounding can push h marginally outside [0, 1] for antipodal points.
  const double clamped = std::clamp(h, 0.0, 1.0);
  return 2.0 * kEarthRadiusM * std::atan2(std::sqrt(clamped), std::sqrt(1.0 - clamped));
}

double initialBearing(const GeoPoint & from, const GeoPoint & to)
{
  const double lat1 = from.latitude * kDegToRad;
  const double lat2 = to.latitude * kDegToRad;
  const double dLon = (to.longitude - from.longitude) * kDegToRad;

  const double y = std::sin(dLon) * std::cos(lat2);
  const double x = std::cos(lat1) * std::sin(lat2) - std::sin(lat1) * std::cos(lat2) * std::cos(dLon);
  return std::atan2(y, x);
}

double distanceToSegment(const GeoPoint & p, const GeoPoint & a, const GeoPoint & b)
{
  const double distAP = distance(a, p);
  if (distance(a, b) < kDegenerateArcM) {
    return distAP;
  }

  const double bearingAB = initialBearing(a, b);
  const double bearingAP = initialBearing(a, p);
  if (std::abs(wrapAngle(bearingAP - bearingAB)) > M_PI / 2.0) {
    return distAP;
  }

  const double bearingBA = initialBearing(b, a);
  const double bearingBP = initialBearing(b, p);
  if (std::abs(wrapAngle(bearingBP - bearingBA)) > M_PI / 2.0) {
    return distance(b, p);
  }

  const double angularAP = distAP / kEarthRadiusM;
  const double sinCrossTrack = std::sin(angularAP) * std::sin(bearingAP - bearingAB);
  const double crossTrack = std::abs(std::asin(std::clamp(sinCrossTrack, -1.0, 1.0))) * kEarthRadiusM;

  // Rounding near the arc ends must not report more than an endpoint distance.
  return std::min({crossTrack, distAP, distance(b, p)});
}

}  // namespace track_radar
