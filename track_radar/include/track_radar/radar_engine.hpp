/**
 * @file radar_engine.hpp
 * @brief One tracking session: route deviation plus signal watchdog.
 *
 * The engine owns every piece of mutable session state (off-track throttle,
 * motion history, watchdog counters, statistics). Nothing is global; a host
 * creates one engine when the session starts and disposes it at the end.
 *
 * Threading: ingestFix() is called from the fix path, one fix at a time.
 * Watchdog checks run on whatever thread the injected timer fires on, which
 * may overlap a fix. hasSignal(), info() and updateConfig() may be called
 * from any thread.
 */

#pragma once

#include <track_radar/alarm_dispatcher.hpp>
#include <track_radar/atomic_cell.hpp>
#include <track_radar/fix_statistics.hpp>
#include <track_radar/geo_types.hpp>
#include <track_radar/logger.hpp>
#include <track_radar/off_track_policy.hpp>
#include <track_radar/one_shot_timer.hpp>
#include <track_radar/radar_config.hpp>
#include <track_radar/signal_watchdog.hpp>

#include <cstdint>
#include <memory>
#include <string>

namespace track_radar
{

/// Answer to an info request from a UI or operator.
struct StatusReport
{
  bool hasSignal{false};
  double signedDistance{0.0};
  double accuracyM{0.0};
  uint64_t updates{0};
  uint64_t skipped{0};
};

/// One-line summary for an info reply; "off_route" when no leg matched yet.
std::string describe(const StatusReport & report);

class RadarEngine
{
public:
  /**
   * @brief Starts a session. The watchdog is armed immediately.
   *
   * Throws std::invalid_argument for a null route or an invalid config.
   */
  RadarEngine(
    std::shared_ptr<const Route> route, const RadarConfig & config, AlarmSink & alarms,
    Logger logger, TimerFactory timerFactory,
    SignalWatchdog::ClockSource clock = &Clock::now);
  ~RadarEngine();

  RadarEngine(const RadarEngine &) = delete;
  RadarEngine & operator=(const RadarEngine &) = delete;

  /**
   * @brief Evaluates one fix and returns its signed distance to the route.
   *
   * Negative or zero means on track, positive means off track. If a previous
   * fix is still being evaluated, only the watchdog is refreshed and the last
   * known distance is returned.
   */
  double ingestFix(const TimedPoint & fix, double accuracyM);

  bool hasSignal() const;
  StatusReport info() const;

  /// Replaces the active config; the watchdog sees it on its next check.
  void updateConfig(const RadarConfig & config);
  RadarConfig config() const;

  const Route & route() const { return *route_; }
  const FixStatistics & statistics() const { return statistics_; }

  /// Stops the watchdog and waits for an in-flight check. Idempotent.
  void dispose();

private:
  void ensureActive(const char * operation) const;
  void logOutcome(const TimedPoint & fix, const PolicyOutcome & outcome, double elapsedMs) const;

  std::shared_ptr<const Route> route_;
  SharedCell<const RadarConfig> config_;
  Logger logger_;
  FixStatistics statistics_;
  OffTrackPolicy policy_;
  AtomicCell<bool> disposed_{false};
  std::unique_ptr<SignalWatchdog> watchdog_;
};

}  // namespace track_radar
