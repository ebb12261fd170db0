/**
 * @file signal_watchdog.hpp
 * @brief Detection of position-source loss and recovery.
 *
 * The watchdog has two states:
 *
 *   Present (noSignalCount == 0) ──(no fix for firstTimeout)──> Absent(1)
 *   Absent(n) ──(still no fix after againInterval)──> Absent(n + 1)
 *   Absent(n) ──(update)──> Present
 *
 * Every transition into Absent raises SignalLost. Leaving Absent raises
 * PositiveAcknowledgement unless the caller asks to stay quiet (an off-track
 * alarm is about to sound for the same fix).
 *
 * The decision for each wake-up is the pure function computeNextDeadline(); the
 * SignalWatchdog class only wires it to a OneShotTimer. A single-shot deadline
 * is reprogrammed after every check instead of running a fixed period: a fix
 * can land at any moment, and a fixed period would detect the loss up to one
 * period late.
 */

#pragma once

#include <track_radar/alarm_dispatcher.hpp>
#include <track_radar/atomic_cell.hpp>
#include <track_radar/geo_types.hpp>
#include <track_radar/logger.hpp>
#include <track_radar/one_shot_timer.hpp>

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>

namespace track_radar
{

/// Delay before retrying after a check failed unexpectedly.
constexpr std::chrono::seconds kWatchdogFallbackDelay{10};

struct WatchdogState
{
  /// 0 means signal present; n > 0 means n consecutive no-signal alarms.
  uint32_t noSignalCount{0};
  Clock::time_point lastFixAt;
  Clock::time_point lastNoSignalAlarmAt;

  bool hasSignal() const { return noSignalCount == 0; }
};

struct WatchdogTimeouts
{
  std::chrono::milliseconds firstTimeout{std::chrono::seconds(30)};
  std::chrono::milliseconds againInterval{std::chrono::seconds(60)};

  /// Upper bound for any check delay; bounds detection latency when timeouts change.
  std::chrono::nanoseconds checkInterval() const
  {
    return std::min(firstTimeout, againInterval);
  }
};

struct WatchdogDecision
{
  WatchdogState state;
  std::chrono::nanoseconds delay{0};
  bool raiseSignalLost{false};
  /// Time since the reference event the check compared against.
  std::chrono::nanoseconds elapsed{0};
};

/**
 * @brief Evaluates one watchdog wake-up.
 *
 * In Present the reference is lastFixAt against firstTimeout; in Absent it is
 * lastNoSignalAlarmAt against againInterval. When the timeout has passed, the
 * returned state has the counter incremented and lastNoSignalAlarmAt = now, and
 * the next check comes after checkInterval(). Otherwise the delay is the time
 * left, capped at checkInterval().
 */
WatchdogDecision computeNextDeadline(
  const WatchdogState & state, Clock::time_point now, const WatchdogTimeouts & timeouts);

/**
 * @class SignalWatchdog
 * @brief Self-rescheduling no-signal detector.
 *
 * update() runs on the fix path, check() on the timer callback. They share
 * only AtomicCell fields and never wait on each other.
 */
class SignalWatchdog
{
public:
  using DurationSource = std::function<std::chrono::milliseconds()>;
  using ClockSource = std::function<Clock::time_point()>;

  /**
   * @brief Starts in Absent(1) and arms the first check after checkInterval().
   *
   * The start counts as overdue for a repeat, so without a fix the first check
   * already raises SignalLost.
   *
   * The timeouts are re-read through their accessors on every check.
   */
  SignalWatchdog(
    AlarmSink & alarms, Logger logger, DurationSource firstTimeout,
    DurationSource againInterval, TimerFactory timerFactory,
    ClockSource clock = &Clock::now);
  ~SignalWatchdog();

  SignalWatchdog(const SignalWatchdog &) = delete;
  SignalWatchdog & operator=(const SignalWatchdog &) = delete;

  /// Records an accepted fix. Throws std::logic_error after dispose().
  void update(bool canAlarm);

  bool hasSignal() const;
  uint32_t noSignalCount() const;
  WatchdogState snapshot() const;

  /// Stops the timer and waits for an in-flight check. Idempotent.
  void dispose();
  bool disposed() const;

private:
  void check();
  WatchdogTimeouts currentTimeouts() const;

  AlarmSink & alarms_;
  Logger logger_;
  DurationSource firstTimeout_;
  DurationSource againInterval_;
  ClockSource clock_;

  /// Counter and fix generation share one word so a check can tell that a fix
  /// landed after its snapshot even when the counter was 0 both times.
  struct SignalCounter
  {
    uint32_t noSignalCount{0};
    uint32_t fixGeneration{0};
  };

  AtomicCell<SignalCounter> counter_;
  AtomicCell<Clock::time_point> lastFixAt_;
  AtomicCell<Clock::time_point> lastNoSignalAlarmAt_;
  AtomicCell<bool> disposed_;

  std::unique_ptr<OneShotTimer> timer_;
};

}  // namespace track_radar
