#pragma once

#include <track_radar/alarm_dispatcher.hpp>
#include <track_radar/fix_history.hpp>
#include <track_radar/geo_types.hpp>
#include <track_radar/motion_classifier.hpp>
#include <track_radar/proximity_evaluator.hpp>

#include <chrono>
#include <optional>

namespace track_radar
{

struct OffTrackSettings
{
  double onTrackThresholdM{50.0};
  std::chrono::milliseconds minAlarmInterval{std::chrono::seconds(10)};
};

/**
 * @struct PolicyOutcome
 * @brief Everything the policy decided for one fix.
 */
struct PolicyOutcome
{
  ProximityResult proximity;
  bool moving{false};
  std::optional<AlarmKind> alarm;

  double signedDistance() const { return proximity.signedDistance; }
};

/**
 * @class OffTrackPolicy
 * @brief Decides, per accepted fix, whether to raise OffTrack or PositiveAcknowledgement.
 *
 *   on track,  moving -> stationary : PositiveAcknowledgement
 *   on track,  otherwise            : silent
 *   off track, stationary           : silent (position drift, not a deviation)
 *   off track, moving               : OffTrack, at most once per minAlarmInterval
 *
 * Fed strictly one fix at a time from the ingestion path; not thread-safe.
 */
class OffTrackPolicy
{
public:
  explicit OffTrackPolicy(AlarmSink & alarms);

  PolicyOutcome process(
    const TimedPoint & fix, double accuracyM, const Route & route,
    const OffTrackSettings & settings);

  bool wasMoving() const { return wasMoving_; }
  std::optional<Clock::time_point> lastAlarmAt() const { return lastAlarmAt_; }
  const FixHistory & history() const { return history_; }

private:
  AlarmSink & alarms_;
  ProximityEvaluator evaluator_;
  MotionClassifier classifier_;
  FixHistory history_;

  std::optional<Clock::time_point> lastAlarmAt_;
  bool wasMoving_{false};
};

}  // namespace track_radar
