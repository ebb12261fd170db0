#pragma once

#include <track_radar/geo_types.hpp>

namespace track_radar
{

/// Mean Earth radius used by every spherical computation in this package.
constexpr double kEarthRadiusM = 6371000.0;

/**
 * @brief Great-circle (haversine) distance in meters.
 */
double distance(const GeoPoint & a, const GeoPoint & b);

/**
 * @brief Initial bearing from `from` towards `to`, radians clockwise from north.
 */
double initialBearing(const GeoPoint & from, const GeoPoint & to);

/**
 * @brief Minimum distance in meters from `p` to the great-circle arc between `a` and `b`.
 *
 * The cross-track distance is used when the projection of `p` lands on the arc.
 * Otherwise the result is the distance to the nearer endpoint. A degenerate arc
 * (a and b coincide) collapses to distance(p, a).
 */
double distanceToSegment(const GeoPoint & p, const GeoPoint & a, const GeoPoint & b);

}  // namespace track_radar
