#pragma once

#include <track_radar/geo_types.hpp>

#include <cstddef>
#include <limits>

namespace track_radar
{

/**
 * @struct ProximityResult
 * @brief Outcome of scanning a fix against the whole route.
 *
 * signedDistance is negative (or zero) when on track and positive when off
 * track. segmentIndex/pointIndex locate the arc p[pointIndex - 1] .. p[pointIndex]
 * that matched (on track) or was closest (off track). Both are npos when the
 * route holds no arc at all.
 */
struct ProximityResult
{
  static constexpr std::size_t npos = std::numeric_limits<std::size_t>::max();

  bool onTrack{false};
  double signedDistance{std::numeric_limits<double>::max()};
  std::size_t segmentIndex{npos};
  std::size_t pointIndex{npos};
};

class ProximityEvaluator
{
public:
  /**
   * @brief Classifies a fix against the route.
   *
   * Each arc contributes max(0, distanceToSegment - accuracy). The scan walks
   * route segments in order and each segment from its last point backwards,
   * and stops at the first arc within onTrackThresholdM.
   */
  ProximityResult evaluate(
    const GeoPoint & fix, double accuracyM, const Route & route,
    double onTrackThresholdM) const;
};

}  // namespace track_radar
