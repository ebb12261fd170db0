#include <track_radar/radar_engine.hpp>

#include <chrono>
#include <iomanip>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace track_radar
{
namespace
{

std::ostream & operator<<(std::ostream & os, const GeoPoint & point)
{
  return os << point.latitude << "," << point.longitude;
}

std::shared_ptr<const RadarConfig> makeConfig(const RadarConfig & config)
{
  validate(config);
  return std::make_shared<RadarConfig>(config);
}

}  // namespace

std::string describe(const StatusReport & report)
{
  if (!report.hasSignal) {
    return "no_signal";
  }

  std::ostringstream oss;
  oss << std::fixed << std::setprecision(1);
  if (report.signedDistance == std::numeric_limits<double>::max()) {
    oss << "off_route";
  } else {
    oss << "signed_distance=" << report.signedDistance << "m";
  }
  oss << " accuracy=" << report.accuracyM << "m";
  return oss.str();
}

RadarEngine::RadarEngine(
  std::shared_ptr<const Route> route, const RadarConfig & config, AlarmSink & alarms,
  Logger logger, TimerFactory timerFactory, SignalWatchdog::ClockSource clock)
: route_(std::move(route))
, config_(makeConfig(config))
, logger_(std::move(logger))
, policy_(alarms)
{
  if (!route_) {
    throw std::invalid_argument("RadarEngine requires a route");
  }

  std::ostringstream oss;
  oss << "Route loaded: " << route_->segments.size() << " segments, "
      << route_->totalPoints() << " points";
  logger_.verbose(oss.str());

  watchdog_ = std::make_unique<SignalWatchdog>(
    alarms, logger_,
    [this]() {return config_.load()->noSignalFirstTimeout;},
    [this]() {return config_.load()->noSignalAgainInterval;},
    std::move(timerFactory), std::move(clock));

  logger_.info("Radar engine started");
}

RadarEngine::~RadarEngine()
{
  dispose();
}

double RadarEngine::ingestFix(const TimedPoint & fix, const double accuracyM)
{
  ensureActive("ingestFix");

  if (!statistics_.tryBeginUpdate()) {
    // The running evaluation will report the proper acquired/lost state.
    watchdog_->update(false);
    return statistics_.signedDistance();
  }

  const auto config = config_.load();
  OffTrackSettings settings;
  settings.onTrackThresholdM = config->onTrackThresholdM;
  settings.minAlarmInterval = config->offTrackAlarmInterval;

  double dist = 0.0;
  try {
    const auto started = std::chrono::steady_clock::now();
    const auto outcome = policy_.process(fix, accuracyM, *route_, settings);
    const double elapsedMs = std::chrono::duration<double, std::milli>(
      std::chrono::steady_clock::now() - started).count();
    dist = outcome.signedDistance();
    logOutcome(fix, outcome, elapsedMs);
  } catch (...) {
    watchdog_->update(false);
    statistics_.completeUpdate(statistics_.signedDistance(), accuracyM);
    throw;
  }

  // Signal-acquired stays quiet when this very fix is off the route.
  watchdog_->update(dist <= 0.0);
  statistics_.completeUpdate(dist, accuracyM);
  return dist;
}

bool RadarEngine::hasSignal() const
{
  ensureActive("hasSignal");
  return watchdog_->hasSignal();
}

StatusReport RadarEngine::info() const
{
  ensureActive("info");
  StatusReport report;
  report.hasSignal = watchdog_->hasSignal();
  report.signedDistance = statistics_.signedDistance();
  report.accuracyM = statistics_.accuracy();
  report.updates = statistics_.updates();
  report.skipped = statistics_.skipped();
  return report;
}

void RadarEngine::updateConfig(const RadarConfig & config)
{
  ensureActive("updateConfig");
  config_.store(makeConfig(config));

  std::ostringstream oss;
  oss << "Config updated (on_track=" << config.onTrackThresholdM
      << "m, off_track_interval=" << config.offTrackAlarmInterval.count()
      << "ms, no_signal_first=" << config.noSignalFirstTimeout.count()
      << "ms, no_signal_again=" << config.noSignalAgainInterval.count() << "ms)";
  logger_.verbose(oss.str());
}

RadarConfig RadarEngine::config() const
{
  return *config_.load();
}

void RadarEngine::dispose()
{
  const bool wasDisposed = disposed_.exchange(true);
  if (watchdog_) {
    watchdog_->dispose();
  }
  if (!wasDisposed) {
    logger_.info("Radar engine disposed (" + statistics_.toString() + ")");
  }
}

void RadarEngine::ensureActive(const char * operation) const
{
  if (disposed_.load()) {
    throw std::logic_error(std::string("RadarEngine::") + operation + " called after dispose");
  }
}

void RadarEngine::logOutcome(
  const TimedPoint & fix, const PolicyOutcome & outcome, const double elapsedMs) const
{
  const auto & proximity = outcome.proximity;
  std::ostringstream oss;
  oss << std::fixed << std::setprecision(1)
      << (proximity.onTrack ? "On" : "Off") << " [" << proximity.segmentIndex << ":"
      << proximity.pointIndex << "] " << proximity.signedDistance << "m";

  if (proximity.segmentIndex != ProximityResult::npos) {
    const auto & points = route_->segments[proximity.segmentIndex].points;
    oss << std::setprecision(6) << " (" << points[proximity.pointIndex - 1] << " -- "
        << points[proximity.pointIndex] << ")";
  }

  oss << std::setprecision(6) << " fix " << fix.point << std::setprecision(2)
      << " moving=" << (outcome.moving ? "true" : "false") << " in " << elapsedMs << "ms";
  if (outcome.alarm.has_value()) {
    oss << " alarm=" << toString(*outcome.alarm);
  }
  logger_.verbose(oss.str());
}

}  // namespace track_radar
