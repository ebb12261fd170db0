/**
 * @file track_radar_node.hpp
 * @brief ROS2 lifecycle host for the RadarEngine.
 *
 * Pipeline position: consumes `fix` (sensor_msgs/NavSatFix) from the GNSS
 * driver; publishes `signed_distance`, `alarm` and `vibration` for whatever
 * renders alarms on the device, and answers `info` requests.
 *
 * Lifecycle:
 *   on_configure: reads the route and settings from parameters, creates ROS interfaces
 *   on_activate:  starts a RadarEngine session (watchdog armed from here on)
 *   on_deactivate: disposes the session; no watchdog callback survives it
 *
 * Parameters are re-validated and pushed into the running engine whenever
 * they change.
 *
 * Threading: spin on a MultiThreadedExecutor. Fix, service, parameter and
 * lifecycle callbacks share the default MutuallyExclusive group; the watchdog
 * timer has a MutuallyExclusive group of its own so a no-signal check runs
 * while a fix is being processed.
 */

#pragma once

#include <track_radar/alarm_dispatcher.hpp>
#include <track_radar/geo_types.hpp>
#include <track_radar/radar_config.hpp>
#include <track_radar/radar_engine.hpp>

#include <rclcpp/rclcpp.hpp>
#include <rclcpp_lifecycle/lifecycle_node.hpp>
#include <rclcpp_lifecycle/lifecycle_publisher.hpp>
#include <sensor_msgs/msg/nav_sat_fix.hpp>
#include <std_msgs/msg/empty.hpp>
#include <std_msgs/msg/float64.hpp>
#include <std_msgs/msg/string.hpp>
#include <std_srvs/srv/trigger.hpp>

#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace track_radar
{

class TrackRadarNode : public rclcpp_lifecycle::LifecycleNode
{
public:
  explicit TrackRadarNode(const rclcpp::NodeOptions & options);
  ~TrackRadarNode() override;

private:
  using CallbackReturn = rclcpp_lifecycle::node_interfaces::LifecycleNodeInterface::CallbackReturn;

  CallbackReturn on_configure(const rclcpp_lifecycle::State & state) override;
  CallbackReturn on_activate(const rclcpp_lifecycle::State & state) override;
  CallbackReturn on_deactivate(const rclcpp_lifecycle::State & state) override;
  CallbackReturn on_cleanup(const rclcpp_lifecycle::State & state) override;
  CallbackReturn on_shutdown(const rclcpp_lifecycle::State & state) override;
  CallbackReturn on_error(const rclcpp_lifecycle::State & state) override;

  void onFix(const sensor_msgs::msg::NavSatFix::SharedPtr msg);
  void onInfoRequest(
    const std::shared_ptr<std_srvs::srv::Trigger::Request> request,
    std::shared_ptr<std_srvs::srv::Trigger::Response> response);

  rcl_interfaces::msg::SetParametersResult onParametersChanged(
    const std::vector<rclcpp::Parameter> & parameters);

  /// Reads route.segment_count / route.segment_<i>; throws std::invalid_argument.
  std::shared_ptr<const Route> loadRoute();
  RadarConfig loadConfig() const;

  void stopEngine();

  mutable std::mutex mutex_;
  RadarConfig config_;
  double defaultAccuracyM_{5.0};
  std::string fixTopic_{"fix"};

  bool autoStart_{true};
  rclcpp::TimerBase::SharedPtr startupTimer_;
  rclcpp::CallbackGroup::SharedPtr watchdogCbGroup_;

  std::shared_ptr<const Route> route_;
  std::shared_ptr<AlarmOutput> alarmOutput_;
  AlarmDispatcher alarms_;
  std::unique_ptr<RadarEngine> engine_;

  rclcpp::Subscription<sensor_msgs::msg::NavSatFix>::SharedPtr fixSub_;
  rclcpp_lifecycle::LifecyclePublisher<std_msgs::msg::Float64>::SharedPtr distancePub_;
  rclcpp_lifecycle::LifecyclePublisher<std_msgs::msg::String>::SharedPtr alarmPub_;
  rclcpp_lifecycle::LifecyclePublisher<std_msgs::msg::Empty>::SharedPtr vibrationPub_;
  rclcpp::Service<std_srvs::srv::Trigger>::SharedPtr infoService_;

  rclcpp::node_interfaces::OnSetParametersCallbackHandle::SharedPtr paramCallbackHandle_;
};

}  // namespace track_radar
