#include <track_radar/motion_classifier.hpp>

#include <track_radar/geo_math.hpp>

#include <chrono>

namespace track_radar
{

MotionClassifier::MotionClassifier(const double speedThresholdMps)
: speedThresholdMps_(speedThresholdMps)
{
}

bool MotionClassifier::classify(FixHistory & history, const TimedPoint & newFix) const
{
  bool moving = false;
  if (!history.empty()) {
    const auto & lastFix = history.last();
    const double elapsedS =
      std::chrono::duration<double>(newFix.timestamp - lastFix.timestamp).count();
    moving = distance(newFix.point, lastFix.point) > speedThresholdMps_ * elapsedS;
  }

  history.push(newFix);
  return moving;
}

}  // namespace track_radar
