#include <track_radar/alarm_dispatcher.hpp>

#include <utility>

namespace track_radar
{

const char * toString(const AlarmKind kind)
{
  switch (kind) {
    case AlarmKind::OffTrack:
      return "off_track";
    case AlarmKind::SignalLost:
      return "signal_lost";
    case AlarmKind::PositiveAcknowledgement:
      return "positive_ack";
    default:
      return "unknown";
  }
}

bool AlarmToggles::audioEnabled(const AlarmKind kind) const
{
  switch (kind) {
    case AlarmKind::OffTrack:
      return offTrackAudio;
    case AlarmKind::SignalLost:
      return signalLostAudio;
    case AlarmKind::PositiveAcknowledgement:
      return signalAcquiredAudio;
    default:
      return false;
  }
}

void AlarmDispatcher::reset(std::shared_ptr<AlarmOutput> output, const AlarmToggles toggles)
{
  binding_.store(std::make_shared<Binding>(Binding{std::move(output), toggles}));
}

void AlarmDispatcher::fire(const AlarmKind kind)
{
  const auto binding = binding_.load();
  if (!binding || !binding->output) {
    return;
  }

  if (binding->toggles.audioEnabled(kind)) {
    binding->output->play(kind);
  }
  if (binding->toggles.vibration) {
    binding->output->vibrate();
  }
}

AlarmToggles AlarmDispatcher::toggles() const
{
  const auto binding = binding_.load();
  return binding ? binding->toggles : AlarmToggles{};
}

}  // namespace track_radar
