#include <track_radar/track_radar_node.hpp>

#include <lifecycle_msgs/msg/state.hpp>
#include <lifecycle_msgs/msg/transition.hpp>
#include <rclcpp_components/register_node_macro.hpp>
#include <track_radar/ros_one_shot_timer.hpp>

#include <chrono>
#include <cmath>
#include <cstdint>
#include <stdexcept>
#include <utility>

namespace track_radar
{
namespace
{

constexpr char kNodeName[] = "track_radar";

std::chrono::milliseconds secondsToMillis(const double seconds)
{
  return std::chrono::milliseconds(static_cast<int64_t>(std::llround(seconds * 1000.0)));
}

/// Publishes alarms for the device-side player; audio itself is not rendered here.
class TopicAlarmOutput : public AlarmOutput
{
public:
  TopicAlarmOutput(
    rclcpp_lifecycle::LifecyclePublisher<std_msgs::msg::String>::SharedPtr alarmPub,
    rclcpp_lifecycle::LifecyclePublisher<std_msgs::msg::Empty>::SharedPtr vibrationPub)
  : alarmPub_(std::move(alarmPub))
  , vibrationPub_(std::move(vibrationPub))
  {
  }

  void play(const AlarmKind kind) override
  {
    if (!alarmPub_->is_activated()) {
      return;
    }
    std_msgs::msg::String msg;
    msg.data = toString(kind);
    alarmPub_->publish(msg);
  }

  void vibrate() override
  {
    if (!vibrationPub_->is_activated()) {
      return;
    }
    vibrationPub_->publish(std_msgs::msg::Empty());
  }

private:
  rclcpp_lifecycle::LifecyclePublisher<std_msgs::msg::String>::SharedPtr alarmPub_;
  rclcpp_lifecycle::LifecyclePublisher<std_msgs::msg::Empty>::SharedPtr vibrationPub_;
};

Logger makeLogger(const rclcpp::Logger & rosLogger)
{
  return Logger(
    [rosLogger](const LogLevel level, const std::string & message)
    {
      switch (level) {
        case LogLevel::Verbose:
          RCLCPP_DEBUG(rosLogger, "%s", message.c_str());
          break;
        case LogLevel::Info:
          RCLCPP_INFO(rosLogger, "%s", message.c_str());
          break;
        case LogLevel::Warning:
          RCLCPP_WARN(rosLogger, "%s", message.c_str());
          break;
        case LogLevel::Error:
          RCLCPP_ERROR(rosLogger, "%s", message.c_str());
          break;
      }
    });
}

}  // namespace

TrackRadarNode::TrackRadarNode(const rclcpp::NodeOptions & options)
: rclcpp_lifecycle::LifecycleNode(kNodeName, options)
{
  autoStart_ = this->declare_parameter<bool>("auto_start", true);
  fixTopic_ = this->declare_parameter<std::string>("fix_topic", "fix");
  defaultAccuracyM_ = this->declare_parameter<double>("default_accuracy_m", 5.0);

  // Off-track params
  this->declare_parameter<double>("off_track.distance_m", 50.0);
  this->declare_parameter<double>("off_track.alarm_interval_s", 10.0);

  // No-signal params
  this->declare_parameter<double>("no_signal.first_timeout_s", 30.0);
  this->declare_parameter<double>("no_signal.again_interval_s", 60.0);

  // Alarm output toggles
  this->declare_parameter<bool>("alarms.off_track_audio", true);
  this->declare_parameter<bool>("alarms.signal_lost_audio", true);
  this->declare_parameter<bool>("alarms.signal_acquired_audio", true);
  this->declare_parameter<bool>("alarms.vibration", false);

  // Route: segment_count legs, each a flat [lat0, lon0, lat1, lon1, ...] array
  this->declare_parameter<int>("route.segment_count", 0);

  // Watchdog checks get their own MutuallyExclusive group. Everything else stays
  // in the default group, so fixes, info requests, parameter updates and
  // lifecycle transitions never overlap each other, only a check.
  watchdogCbGroup_ = this->create_callback_group(rclcpp::CallbackGroupType::MutuallyExclusive);

  paramCallbackHandle_ = this->add_on_set_parameters_callback(
    std::bind(&TrackRadarNode::onParametersChanged, this, std::placeholders::_1));

  if (autoStart_) {
    startupTimer_ = this->create_wall_timer(
      std::chrono::milliseconds(200),
      [this]() {
        startupTimer_->cancel();
        RCLCPP_INFO(get_logger(), "Auto-start: triggering configure");
        auto configResult = this->trigger_transition(
          lifecycle_msgs::msg::Transition::TRANSITION_CONFIGURE);
        if (configResult.id() != lifecycle_msgs::msg::State::PRIMARY_STATE_INACTIVE) {
          RCLCPP_ERROR(get_logger(), "Auto-configure failed (state=%s)",
            configResult.label().c_str());
          return;
        }
        auto activateResult = this->trigger_transition(
          lifecycle_msgs::msg::Transition::TRANSITION_ACTIVATE);
        if (activateResult.id() != lifecycle_msgs::msg::State::PRIMARY_STATE_ACTIVE) {
          RCLCPP_ERROR(get_logger(), "Auto-activate failed (state=%s)",
            activateResult.label().c_str());
          return;
        }
        RCLCPP_INFO(get_logger(), "Auto-start complete: ACTIVE");
      });
  }
}

TrackRadarNode::~TrackRadarNode()
{
  stopEngine();
}

TrackRadarNode::CallbackReturn TrackRadarNode::on_configure(
  const rclcpp_lifecycle::State &)
{
  try {
    route_ = loadRoute();
    const auto config = loadConfig();
    validate(config);
    std::scoped_lock lock(mutex_);
    config_ = config;
  } catch (const std::exception & e) {
    RCLCPP_ERROR(get_logger(), "Invalid track_radar configuration: %s", e.what());
    return CallbackReturn::FAILURE;
  }

  if (route_->segments.empty()) {
    RCLCPP_WARN(get_logger(), "Route is empty; every fix will be reported off track");
  }

  // Publishers
  distancePub_ = this->create_publisher<std_msgs::msg::Float64>(
    "signed_distance", rclcpp::QoS(10).reliable());
  alarmPub_ = this->create_publisher<std_msgs::msg::String>(
    "alarm", rclcpp::QoS(10).reliable());
  vibrationPub_ = this->create_publisher<std_msgs::msg::Empty>(
    "vibration", rclcpp::QoS(10).reliable());

  alarmOutput_ = std::make_shared<TopicAlarmOutput>(alarmPub_, vibrationPub_);

  fixSub_ = this->create_subscription<sensor_msgs::msg::NavSatFix>(
    fixTopic_, rclcpp::SensorDataQoS(),
    std::bind(&TrackRadarNode::onFix, this, std::placeholders::_1));

  infoService_ = this->create_service<std_srvs::srv::Trigger>(
    "info",
    std::bind(
      &TrackRadarNode::onInfoRequest, this, std::placeholders::_1,
      std::placeholders::_2));

  RCLCPP_INFO(
    get_logger(),
    "Configured track_radar (segments=%zu, points=%zu, on_track=%.1fm, fix_topic=%s)",
    route_->segments.size(), route_->totalPoints(), config_.onTrackThresholdM,
    fixTopic_.c_str());
  return CallbackReturn::SUCCESS;
}

TrackRadarNode::CallbackReturn TrackRadarNode::on_activate(
  const rclcpp_lifecycle::State &)
{
  if (!route_ || !distancePub_ || !alarmPub_ || !vibrationPub_) {
    return CallbackReturn::FAILURE;
  }

  distancePub_->on_activate();
  alarmPub_->on_activate();
  vibrationPub_->on_activate();

  try {
    std::scoped_lock lock(mutex_);
    alarms_.reset(alarmOutput_, config_.toggles);
    engine_ = std::make_unique<RadarEngine>(
      route_, config_, alarms_, makeLogger(get_logger()),
      RosOneShotTimer::factory(*this, watchdogCbGroup_));
  } catch (const std::exception & e) {
    RCLCPP_ERROR(get_logger(), "Failed to start radar session: %s", e.what());
    return CallbackReturn::FAILURE;
  }

  RCLCPP_INFO(get_logger(), "Activated track_radar");
  return CallbackReturn::SUCCESS;
}

TrackRadarNode::CallbackReturn TrackRadarNode::on_deactivate(
  const rclcpp_lifecycle::State &)
{
  stopEngine();
  if (distancePub_) {
    distancePub_->on_deactivate();
  }
  if (alarmPub_) {
    alarmPub_->on_deactivate();
  }
  if (vibrationPub_) {
    vibrationPub_->on_deactivate();
  }
  RCLCPP_INFO(get_logger(), "Deactivated track_radar");
  return CallbackReturn::SUCCESS;
}

TrackRadarNode::CallbackReturn TrackRadarNode::on_cleanup(
  const rclcpp_lifecycle::State &)
{
  stopEngine();
  alarms_.reset(nullptr, AlarmToggles{});
  fixSub_.reset();
  infoService_.reset();
  distancePub_.reset();
  alarmPub_.reset();
  vibrationPub_.reset();
  alarmOutput_.reset();
  route_.reset();

  RCLCPP_INFO(get_logger(), "Cleaned up track_radar");
  return CallbackReturn::SUCCESS;
}

TrackRadarNode::CallbackReturn TrackRadarNode::on_shutdown(
  const rclcpp_lifecycle::State &)
{
  (void)on_cleanup(this->get_current_state());
  return CallbackReturn::SUCCESS;
}

TrackRadarNode::CallbackReturn TrackRadarNode::on_error(
  const rclcpp_lifecycle::State &)
{
  stopEngine();
  if (distancePub_ && distancePub_->is_activated()) {
    distancePub_->on_deactivate();
  }
  if (alarmPub_ && alarmPub_->is_activated()) {
    alarmPub_->on_deactivate();
  }
  if (vibrationPub_ && vibrationPub_->is_activated()) {
    vibrationPub_->on_deactivate();
  }
  return CallbackReturn::SUCCESS;
}

void TrackRadarNode::stopEngine()
{
  std::unique_ptr<RadarEngine> engine;
  {
    std::scoped_lock lock(mutex_);
    engine = std::move(engine_);
  }
  if (engine) {
    // Blocks until an in-flight watchdog check has returned.
    engine->dispose();
  }
}

void TrackRadarNode::onFix(const sensor_msgs::msg::NavSatFix::SharedPtr msg)
{
  if (!engine_) {
    return;
  }

  if (msg->status.status < sensor_msgs::msg::NavSatStatus::STATUS_FIX) {
    RCLCPP_DEBUG(get_logger(), "Ignoring fix without position (status=%d)", msg->status.status);
    return;
  }
  if (!std::isfinite(msg->latitude) || !std::isfinite(msg->longitude)) {
    RCLCPP_DEBUG(get_logger(), "Ignoring fix with non-finite coordinates");
    return;
  }

  double accuracyM = 0.0;
  {
    std::scoped_lock lock(mutex_);
    accuracyM = defaultAccuracyM_;
  }
  if (msg->position_covariance_type != sensor_msgs::msg::NavSatFix::COVARIANCE_TYPE_UNKNOWN &&
    msg->position_covariance[0] >= 0.0)
  {
    accuracyM = std::sqrt(msg->position_covariance[0]);
  }

  TimedPoint fix;
  fix.point.latitude = msg->latitude;
  fix.point.longitude = msg->longitude;
  fix.timestamp = Clock::now();

  double signedDistance = 0.0;
  try {
    signedDistance = engine_->ingestFix(fix, accuracyM);
  } catch (const std::exception & e) {
    RCLCPP_ERROR(get_logger(), "Fix evaluation failed: %s", e.what());
    return;
  }

  if (distancePub_ && distancePub_->is_activated()) {
    std_msgs::msg::Float64 distanceMsg;
    distanceMsg.data = signedDistance;
    distancePub_->publish(distanceMsg);
  }
}

void TrackRadarNode::onInfoRequest(
  const std::shared_ptr<std_srvs::srv::Trigger::Request>,
  std::shared_ptr<std_srvs::srv::Trigger::Response> response)
{
  RCLCPP_DEBUG(get_logger(), "Received info request");
  if (!engine_) {
    response->success = false;
    response->message = "inactive";
    return;
  }

  const auto report = engine_->info();
  response->success = report.hasSignal;
  response->message = describe(report);
}

rcl_interfaces::msg::SetParametersResult TrackRadarNode::onParametersChanged(
  const std::vector<rclcpp::Parameter> & parameters)
{
  rcl_interfaces::msg::SetParametersResult result;
  result.successful = true;

  std::scoped_lock lock(mutex_);
  RadarConfig candidate = config_;
  double accuracyM = defaultAccuracyM_;

  for (const auto & param : parameters) {
    const auto & name = param.get_name();
    if (name == "off_track.distance_m") {
      candidate.onTrackThresholdM = param.as_double();
    } else if (name == "off_track.alarm_interval_s") {
      candidate.offTrackAlarmInterval = secondsToMillis(param.as_double());
    } else if (name == "no_signal.first_timeout_s") {
      candidate.noSignalFirstTimeout = secondsToMillis(param.as_double());
    } else if (name == "no_signal.again_interval_s") {
      candidate.noSignalAgainInterval = secondsToMillis(param.as_double());
    } else if (name == "alarms.off_track_audio") {
      candidate.toggles.offTrackAudio = param.as_bool();
    } else if (name == "alarms.signal_lost_audio") {
      candidate.toggles.signalLostAudio = param.as_bool();
    } else if (name == "alarms.signal_acquired_audio") {
      candidate.toggles.signalAcquiredAudio = param.as_bool();
    } else if (name == "alarms.vibration") {
      candidate.toggles.vibration = param.as_bool();
    } else if (name == "default_accuracy_m") {
      accuracyM = param.as_double();
    }
  }

  if (!std::isfinite(accuracyM) || accuracyM < 0.0) {
    result.successful = false;
    result.reason = "default_accuracy_m must be >= 0";
    return result;
  }

  try {
    validate(candidate);
  } catch (const std::invalid_argument & e) {
    result.successful = false;
    result.reason = e.what();
    return result;
  }

  config_ = candidate;
  defaultAccuracyM_ = accuracyM;
  if (engine_) {
    engine_->updateConfig(candidate);
    alarms_.reset(alarmOutput_, candidate.toggles);
    RCLCPP_DEBUG(get_logger(), "Pushed updated parameters into the radar session");
  }
  return result;
}

std::shared_ptr<const Route> TrackRadarNode::loadRoute()
{
  const auto segmentCount = this->get_parameter("route.segment_count").as_int();
  if (segmentCount < 0) {
    throw std::invalid_argument("route.segment_count must be >= 0");
  }

  auto route = std::make_shared<Route>();
  route->segments.reserve(static_cast<std::size_t>(segmentCount));

  for (int64_t i = 0; i < segmentCount; ++i) {
    const std::string name = "route.segment_" + std::to_string(i);
    if (!this->has_parameter(name)) {
      this->declare_parameter<std::vector<double>>(name, std::vector<double>{});
    }
    const auto flat = this->get_parameter(name).as_double_array();
    if (flat.size() % 2 != 0) {
      throw std::invalid_argument(name + " must hold lat/lon pairs");
    }

    RouteSegment segment;
    segment.points.reserve(flat.size() / 2);
    for (std::size_t k = 0; k < flat.size(); k += 2) {
      GeoPoint point;
      point.latitude = flat[k];
      point.longitude = flat[k + 1];
      if (std::abs(point.latitude) > 90.0 || std::abs(point.longitude) > 180.0) {
        throw std::invalid_argument(name + " holds an out-of-range coordinate");
      }
      segment.points.push_back(point);
    }
    route->segments.push_back(std::move(segment));
  }

  return route;
}

RadarConfig TrackRadarNode::loadConfig() const
{
  RadarConfig config;
  config.onTrackThresholdM = this->get_parameter("off_track.distance_m").as_double();
  config.offTrackAlarmInterval =
    secondsToMillis(this->get_parameter("off_track.alarm_interval_s").as_double());
  config.noSignalFirstTimeout =
    secondsToMillis(this->get_parameter("no_signal.first_timeout_s").as_double());
  config.noSignalAgainInterval =
    secondsToMillis(this->get_parameter("no_signal.again_interval_s").as_double());
  config.toggles.offTrackAudio = this->get_parameter("alarms.off_track_audio").as_bool();
  config.toggles.signalLostAudio = this->get_parameter("alarms.signal_lost_audio").as_bool();
  config.toggles.signalAcquiredAudio =
    this->get_parameter("alarms.signal_acquired_audio").as_bool();
  config.toggles.vibration = this->get_parameter("alarms.vibration").as_bool();
  return config;
}

}  // namespace track_radar

RCLCPP_COMPONENTS_REGISTER_NODE(track_radar::TrackRadarNode)
