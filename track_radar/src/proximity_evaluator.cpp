#include <track_radar/proximity_evaluator.hpp>

#include <track_radar/geo_math.hpp>

#include <algorithm>

namespace track_radar
{

ProximityResult ProximityEvaluator::evaluate(
  const GeoPoint & fix, const double accuracyM, const Route & route,
  const double onTrackThresholdM) const
{
  ProximityResult result;
  double minDistance = std::numeric_limits<double>::max();

  for (std::size_t t = 0; t < route.segments.size(); ++t) {
    const auto & points = route.segments[t].points;
    for (std::size_t s = points.size(); s-- > 1;) {
      const double adjusted =
        std::max(0.0, distanceToSegment(fix, points[s - 1], points[s]) - accuracyM);

      if (adjusted < minDistance) {
        minDistance = adjusted;
        result.segmentIndex = t;
        result.pointIndex = s;
      }

      if (adjusted <= onTrackThresholdM) {
        result.onTrack = true;
        result.segmentIndex = t;
        result.pointIndex = s;
        result.signedDistance = -minDistance;
        return result;
      }
    }
  }

  result.onTrack = false;
  result.signedDistance = minDistance;
  return result;
}

}  // namespace track_radar
