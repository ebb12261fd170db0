#pragma once

#include <chrono>
#include <cstdint>
#include <vector>

namespace track_radar
{

using Clock = std::chrono::steady_clock;

/// Latitude/longitude in degrees. Compared only through distance functions.
struct GeoPoint
{
  double latitude{0.0};
  double longitude{0.0};
};

/// One accepted fix, stamped with monotonic time.
struct TimedPoint
{
  GeoPoint point;
  Clock::time_point timestamp;
};

/// One polyline leg of the route.
struct RouteSegment
{
  std::vector<GeoPoint> points;
};

/// Ordered route legs. Shared read-only for the lifetime of a session.
struct Route
{
  std::vector<RouteSegment> segments;

  std::size_t totalPoints() const
  {
    std::size_t total = 0;
    for (const auto & segment : segments) {
      total += segment.points.size();
    }
    return total;
  }
};

enum class AlarmKind : uint8_t
{
  OffTrack,
  SignalLost,
  PositiveAcknowledgement
};

const char * toString(AlarmKind kind);

}  // namespace track_radar
