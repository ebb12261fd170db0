#pragma once

#include <track_radar/atomic_cell.hpp>
#include <track_radar/geo_types.hpp>

#include <memory>

namespace track_radar
{

/// Narrow alarm interface consumed by the policy and the watchdog.
class AlarmSink
{
public:
  virtual ~AlarmSink() = default;
  /// Must not block; may be called from the fix path and the watchdog timer alike.
  virtual void fire(AlarmKind kind) = 0;
};

/// Host-side renderer for alarms (audio player, vibrator, topic, ...).
class AlarmOutput
{
public:
  virtual ~AlarmOutput() = default;
  virtual void play(AlarmKind kind) = 0;
  virtual void vibrate() = 0;
};

struct AlarmToggles
{
  bool offTrackAudio{true};
  bool signalLostAudio{true};
  bool signalAcquiredAudio{true};
  bool vibration{false};

  bool audioEnabled(AlarmKind kind) const;
};

/**
 * @class AlarmDispatcher
 * @brief AlarmSink that routes alarms to the current output according to the toggles.
 *
 * reset() swaps the whole binding at once, so a fire() racing with a
 * preference reload sees either the old or the new binding, never a mix.
 */
class AlarmDispatcher : public AlarmSink
{
public:
  AlarmDispatcher() = default;

  void reset(std::shared_ptr<AlarmOutput> output, AlarmToggles toggles);
  void fire(AlarmKind kind) override;

  AlarmToggles toggles() const;

private:
  struct Binding
  {
    std::shared_ptr<AlarmOutput> output;
    AlarmToggles toggles;
  };

  SharedCell<const Binding> binding_;
};

}  // namespace track_radar
