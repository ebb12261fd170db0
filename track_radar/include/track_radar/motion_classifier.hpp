#pragma once

#include <track_radar/fix_history.hpp>
#include <track_radar/geo_types.hpp>

namespace track_radar
{

/// Average walking speed in m/s. Anything faster counts as moving.
constexpr double kWalkingSpeedMps = 1.5;

class MotionClassifier
{
public:
  explicit MotionClassifier(double speedThresholdMps = kWalkingSpeedMps);

  /**
   * @brief Decides whether the subject moved since the last recorded fix, then records newFix.
   *
   * An empty history classifies as not moving.
   */
  bool classify(FixHistory & history, const TimedPoint & newFix) const;

  double speedThresholdMps() const { return speedThresholdMps_; }

private:
  double speedThresholdMps_;
};

}  // namespace track_radar
