#pragma once

#include <track_radar/alarm_dispatcher.hpp>

#include <chrono>

namespace track_radar
{

/**
 * @struct RadarConfig
 * @brief Runtime-tunable settings of one tracking session.
 *
 * The engine keeps the active value as an immutable snapshot; hosts replace it
 * as a whole through RadarEngine::updateConfig().
 */
struct RadarConfig
{
  /// Maximum adjusted distance (meters) at which a fix still counts as on track.
  double onTrackThresholdM{50.0};
  /// Minimum spacing between two off-track alarms.
  std::chrono::milliseconds offTrackAlarmInterval{std::chrono::seconds(10)};
  /// Silence needed before the first no-signal alarm.
  std::chrono::milliseconds noSignalFirstTimeout{std::chrono::seconds(30)};
  /// Minimum spacing between repeated no-signal alarms.
  std::chrono::milliseconds noSignalAgainInterval{std::chrono::seconds(60)};
  AlarmToggles toggles;
};

/// Throws std::invalid_argument describing the first offending field.
void validate(const RadarConfig & config);

}  // namespace track_radar
