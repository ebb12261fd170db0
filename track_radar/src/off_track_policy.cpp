#include <track_radar/off_track_policy.hpp>

namespace track_radar
{

OffTrackPolicy::OffTrackPolicy(AlarmSink & alarms)
: alarms_(alarms)
{
}

PolicyOutcome OffTrackPolicy::process(
  const TimedPoint & fix, const double accuracyM, const Route & route,
  const OffTrackSettings & settings)
{
  PolicyOutcome outcome;
  outcome.proximity = evaluator_.evaluate(fix.point, accuracyM, route, settings.onTrackThresholdM);
  outcome.moving = classifier_.classify(history_, fix);

  const bool wasMoving = wasMoving_;
  wasMoving_ = outcome.moving;

  if (outcome.proximity.onTrack) {
    if (wasMoving && !outcome.moving) {
      outcome.alarm = AlarmKind::PositiveAcknowledgement;
      alarms_.fire(AlarmKind::PositiveAcknowledgement);
    }
    return outcome;
  }

  // Stopped off the route: more likely drift than a real deviation.
  if (!outcome.moving) {
    return outcome;
  }

  if (lastAlarmAt_.has_value() && (fix.timestamp - *lastAlarmAt_) < settings.minAlarmInterval) {
    return outcome;
  }

  // No attempt to guess whether a nearby parallel leg is reachable; the user sees
  // the terrain, we do not.
  lastAlarmAt_ = fix.timestamp;
  outcome.alarm = AlarmKind::OffTrack;
  alarms_.fire(AlarmKind::OffTrack);
  return outcome;
}

}  // namespace track_radar
