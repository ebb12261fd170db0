#include <track_radar/radar_config.hpp>

#include <cmath>
#include <sstream>
#include <stdexcept>

namespace track_radar
{

void validate(const RadarConfig & config)
{
  std::ostringstream oss;

  if (!std::isfinite(config.onTrackThresholdM) || config.onTrackThresholdM < 0.0) {
    oss << "on_track_threshold=" << config.onTrackThresholdM << "m must be >= 0";
    throw std::invalid_argument(oss.str());
  }

  if (config.offTrackAlarmInterval.count() < 0) {
    oss << "off_track_alarm_interval=" << config.offTrackAlarmInterval.count()
        << "ms must be >= 0";
    throw std::invalid_argument(oss.str());
  }

  if (config.noSignalFirstTimeout.count() <= 0) {
    oss << "no_signal_first_timeout=" << config.noSignalFirstTimeout.count()
        << "ms must be > 0";
    throw std::invalid_argument(oss.str());
  }

  if (config.noSignalAgainInterval.count() <= 0) {
    oss << "no_signal_again_interval=" << config.noSignalAgainInterval.count()
        << "ms must be > 0";
    throw std::invalid_argument(oss.str());
  }
}

}  // namespace track_radar
