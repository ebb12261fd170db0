#include <track_radar/signal_watchdog.hpp>

#include <exception>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace track_radar
{
namespace
{

double toSeconds(const std::chrono::nanoseconds duration)
{
  return std::chrono::duration<double>(duration).count();
}

}  // namespace

WatchdogDecision computeNextDeadline(
  const WatchdogState & state, const Clock::time_point now, const WatchdogTimeouts & timeouts)
{
  const std::chrono::nanoseconds interval = timeouts.checkInterval();

  WatchdogDecision decision;
  decision.state = state;

  std::chrono::nanoseconds alarmAfter;
  if (state.hasSignal()) {
    decision.elapsed = now - state.lastFixAt;
    alarmAfter = timeouts.firstTimeout;
  } else {
    decision.elapsed = now - state.lastNoSignalAlarmAt;
    alarmAfter = timeouts.againInterval;
  }

  decision.delay = alarmAfter - decision.elapsed;
  if (decision.delay <= std::chrono::nanoseconds::zero()) {
    decision.state.noSignalCount = state.noSignalCount + 1;
    decision.state.lastNoSignalAlarmAt = now;
    decision.raiseSignalLost = true;
    decision.delay = interval;
  } else if (decision.delay > interval) {
    decision.delay = interval;
  }

  return decision;
}

SignalWatchdog::SignalWatchdog(
  AlarmSink & alarms, Logger logger, DurationSource firstTimeout,
  DurationSource againInterval, TimerFactory timerFactory, ClockSource clock)
: alarms_(alarms)
, logger_(std::move(logger))
, firstTimeout_(std::move(firstTimeout))
, againInterval_(std::move(againInterval))
, clock_(std::move(clock))
, counter_(SignalCounter{1, 0})
, disposed_(false)
{
  if (!firstTimeout_ || !againInterval_ || !clock_ || !timerFactory) {
    throw std::invalid_argument("SignalWatchdog requires timeouts, clock and timer factory");
  }

  // No fix yet: start in Absent with the repeat already due, so a receiver that
  // never delivers is reported at the first check.
  const auto timeouts = currentTimeouts();
  const auto now = clock_();
  lastFixAt_.store(now);
  lastNoSignalAlarmAt_.store(now - timeouts.againInterval);

  timer_ = timerFactory([this]() {check();});
  timer_->schedule(timeouts.checkInterval());
}

SignalWatchdog::~SignalWatchdog()
{
  dispose();
}

void SignalWatchdog::update(const bool canAlarm)
{
  if (disposed_.load()) {
    throw std::logic_error("SignalWatchdog::update called after dispose");
  }

  lastFixAt_.store(clock_());
  SignalCounter previous = counter_.load();
  while (!counter_.compareExchange(previous, SignalCounter{0, previous.fixGeneration + 1})) {
    // A check raised in between; previous now holds its counter.
  }
  if (previous.noSignalCount != 0) {
    logger_.verbose("GPS signal acquired");
    if (canAlarm) {
      alarms_.fire(AlarmKind::PositiveAcknowledgement);
    }
  }
}

bool SignalWatchdog::hasSignal() const
{
  return counter_.load().noSignalCount == 0;
}

uint32_t SignalWatchdog::noSignalCount() const
{
  return counter_.load().noSignalCount;
}

WatchdogState SignalWatchdog::snapshot() const
{
  WatchdogState state;
  state.noSignalCount = counter_.load().noSignalCount;
  state.lastFixAt = lastFixAt_.load();
  state.lastNoSignalAlarmAt = lastNoSignalAlarmAt_.load();
  return state;
}

void SignalWatchdog::dispose()
{
  disposed_.store(true);
  if (timer_) {
    timer_->dispose();
  }
}

bool SignalWatchdog::disposed() const
{
  return disposed_.load();
}

WatchdogTimeouts SignalWatchdog::currentTimeouts() const
{
  WatchdogTimeouts timeouts;
  timeouts.firstTimeout = firstTimeout_();
  timeouts.againInterval = againInterval_();
  return timeouts;
}

void SignalWatchdog::check()
{
  try {
    const auto timeouts = currentTimeouts();
    const auto now = clock_();
    // The counter is read before the timestamps; update() writes them the other way round.
    SignalCounter observed = counter_.load();
    WatchdogState state;
    state.noSignalCount = observed.noSignalCount;
    state.lastFixAt = lastFixAt_.load();
    state.lastNoSignalAlarmAt = lastNoSignalAlarmAt_.load();
    const auto decision = computeNextDeadline(state, now, timeouts);

    std::ostringstream oss;
    oss << "Signal check: " << (state.hasSignal() ? "present" : "absent")
        << " alarm_after="
        << toSeconds(state.hasSignal() ? timeouts.firstTimeout : timeouts.againInterval)
        << "s passed=" << toSeconds(decision.elapsed)
        << "s next_check=" << toSeconds(decision.delay) << "s";
    logger_.verbose(oss.str());

    if (decision.raiseSignalLost) {
      // A fix that lands between the read and here bumps the generation; it wins
      // and the alarm is dropped.
      const SignalCounter raised{decision.state.noSignalCount, observed.fixGeneration};
      if (counter_.compareExchange(observed, raised)) {
        lastNoSignalAlarmAt_.store(decision.state.lastNoSignalAlarmAt);
        logger_.warn(
          "GPS signal lost (consecutive=" + std::to_string(decision.state.noSignalCount) + ")");
        alarms_.fire(AlarmKind::SignalLost);
      } else {
        logger_.verbose("Fix arrived during signal check, no-signal alarm dropped");
      }
    }

    timer_->schedule(decision.delay);
  } catch (const std::exception & e) {
    logger_.error(std::string("Signal check failed: ") + e.what());
    timer_->schedule(kWatchdogFallbackDelay);
  } catch (...) {
    logger_.error("Signal check failed: unknown error");
    timer_->schedule(kWatchdogFallbackDelay);
  }
}

}  // namespace track_radar
