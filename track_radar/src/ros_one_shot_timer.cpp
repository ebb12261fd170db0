#include <track_radar/ros_one_shot_timer.hpp>

#include <rclcpp/create_timer.hpp>

#include <algorithm>
#include <stdexcept>
#include <utility>

namespace track_radar
{

RosOneShotTimer::RosOneShotTimer(
  rclcpp::node_interfaces::NodeBaseInterface::SharedPtr nodeBase,
  rclcpp::node_interfaces::NodeTimersInterface::SharedPtr nodeTimers,
  rclcpp::CallbackGroup::SharedPtr group, Callback callback)
: nodeBase_(std::move(nodeBase))
, nodeTimers_(std::move(nodeTimers))
, group_(std::move(group))
, callback_(std::move(callback))
{
  if (!nodeBase_ || !nodeTimers_ || !callback_) {
    throw std::invalid_argument("RosOneShotTimer requires node interfaces and a callback");
  }
}

RosOneShotTimer::~RosOneShotTimer()
{
  std::unique_lock lock(mutex_);
  disposed_ = true;
  if (timer_) {
    timer_->cancel();
    timer_.reset();
  }
  if (!(inFlight_ && callbackThread_ == std::this_thread::get_id())) {
    idle_.wait(lock, [this]() {return !inFlight_;});
  }
}

void RosOneShotTimer::schedule(const std::chrono::nanoseconds delay)
{
  std::scoped_lock lock(mutex_);
  if (disposed_) {
    return;
  }
  if (timer_) {
    timer_->cancel();
  }

  const uint64_t generation = ++generation_;
  timer_ = rclcpp::create_wall_timer(
    std::max(delay, std::chrono::nanoseconds(1)),
    [this, generation]() {onFire(generation);},
    group_, nodeBase_.get(), nodeTimers_.get());
}

void RosOneShotTimer::dispose()
{
  std::unique_lock lock(mutex_);
  if (inFlight_ && callbackThread_ == std::this_thread::get_id()) {
    throw std::logic_error("RosOneShotTimer::dispose called from its own callback");
  }

  disposed_ = true;
  if (timer_) {
    timer_->cancel();
    timer_.reset();
  }
  idle_.wait(lock, [this]() {return !inFlight_;});
}

void RosOneShotTimer::onFire(const uint64_t generation)
{
  {
    std::scoped_lock lock(mutex_);
    if (disposed_ || generation != generation_) {
      return;
    }
    // One shot: the wall timer would otherwise fire again after another period.
    timer_->cancel();
    inFlight_ = true;
    callbackThread_ = std::this_thread::get_id();
  }

  const auto finish = [this]() {
      {
        std::scoped_lock lock(mutex_);
        inFlight_ = false;
        callbackThread_ = std::thread::id();
      }
      idle_.notify_all();
    };

  try {
    callback_();
  } catch (...) {
    finish();
    throw;
  }
  finish();
}

}  // namespace track_radar
