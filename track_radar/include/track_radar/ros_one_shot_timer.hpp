/**
 * @file ros_one_shot_timer.hpp
 * @brief OneShotTimer on top of an rclcpp wall timer.
 *
 * rclcpp timers are periodic and their period is fixed at creation, so every
 * schedule() creates a fresh wall timer and the callback cancels it on the
 * first fire. The timer lives in a caller-supplied callback group; give it a
 * MutuallyExclusive group of its own and spin a MultiThreadedExecutor so a
 * watchdog check never waits behind fix processing.
 */

#pragma once

#include <track_radar/one_shot_timer.hpp>

#include <rclcpp/rclcpp.hpp>

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <thread>

namespace track_radar
{

class RosOneShotTimer : public OneShotTimer
{
public:
  RosOneShotTimer(
    rclcpp::node_interfaces::NodeBaseInterface::SharedPtr nodeBase,
    rclcpp::node_interfaces::NodeTimersInterface::SharedPtr nodeTimers,
    rclcpp::CallbackGroup::SharedPtr group, Callback callback);
  ~RosOneShotTimer() override;

  RosOneShotTimer(const RosOneShotTimer &) = delete;
  RosOneShotTimer & operator=(const RosOneShotTimer &) = delete;

  void schedule(std::chrono::nanoseconds delay) override;

  /**
   * @brief Cancels the wall timer and waits until a running callback has returned.
   *
   * Throws std::logic_error when called from inside the callback, which would
   * otherwise wait on itself.
   */
  void dispose() override;

  /// TimerFactory that places every timer in `group` of the given node.
  template<typename NodeT>
  static TimerFactory factory(NodeT & node, rclcpp::CallbackGroup::SharedPtr group)
  {
    auto nodeBase = node.get_node_base_interface();
    auto nodeTimers = node.get_node_timers_interface();
    return [nodeBase, nodeTimers, group](Callback callback) {
             return std::unique_ptr<OneShotTimer>(
               std::make_unique<RosOneShotTimer>(nodeBase, nodeTimers, group, std::move(callback)));
           };
  }

private:
  void onFire(uint64_t generation);

  rclcpp::node_interfaces::NodeBaseInterface::SharedPtr nodeBase_;
  rclcpp::node_interfaces::NodeTimersInterface::SharedPtr nodeTimers_;
  rclcpp::CallbackGroup::SharedPtr group_;
  Callback callback_;

  std::mutex mutex_;
  std::condition_variable idle_;
  rclcpp::TimerBase::SharedPtr timer_;
  // Bumped by every schedule(); a fire from a superseded timer is ignored.
  uint64_t generation_{0};
  bool inFlight_{false};
  std::thread::id callbackThread_;
  bool disposed_{false};
};

}  // namespace track_radar
