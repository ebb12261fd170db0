#pragma once

#include <chrono>
#include <functional>
#include <memory>

namespace track_radar
{

/**
 * @class OneShotTimer
 * @brief Single-deadline scheduler primitive.
 *
 * schedule() replaces any pending deadline; the callback fires at most once per
 * schedule(). Rescheduling from inside the callback is how periodic behaviour is
 * built, so the next deadline can be recomputed on every run.
 */
class OneShotTimer
{
public:
  using Callback = std::function<void ()>;

  virtual ~OneShotTimer() = default;

  /// Arms the timer `delay` from now. Ignored once disposed.
  virtual void schedule(std::chrono::nanoseconds delay) = 0;

  /**
   * @brief Cancels the pending deadline and waits for an in-flight callback to finish.
   *
   * Safe to call more than once. No callback starts after it returns.
   */
  virtual void dispose() = 0;
};

/// Creates the timer a SignalWatchdog drives; the host decides what backs it.
using TimerFactory = std::function<std::unique_ptr<OneShotTimer>(OneShotTimer::Callback)>;

}  // namespace track_radar
