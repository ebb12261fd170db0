/**
 * @file atomic_cell.hpp
 * @brief Lock-free holders for state shared between the fix path and the watchdog timer.
 *
 * Both execution contexts touch the same fields and neither may wait on the
 * other, so every shared field goes through one of these cells instead of a
 * mutex:
 *   - AtomicCell<T>: trivially copyable values (timestamps, counters, flags).
 *   - SharedCell<T>: immutable snapshots published by pointer swap
 *     (configuration, alarm output bindings).
 */

#pragma once

#include <atomic>
#include <memory>
#include <type_traits>
#include <utility>

namespace track_radar
{

template<typename T>
class AtomicCell
{
  static_assert(
    std::is_trivially_copyable<T>::value,
    "AtomicCell requires a trivially copyable type");

public:
  AtomicCell()
  : value_(T{})
  {
  }

  explicit AtomicCell(T initial)
  : value_(initial)
  {
  }

  AtomicCell(const AtomicCell &) = delete;
  AtomicCell & operator=(const AtomicCell &) = delete;

  T load() const
  {
    return value_.load(std::memory_order_acquire);
  }

  void store(T value)
  {
    value_.store(value, std::memory_order_release);
  }

  /// Stores `value` and returns the previous content.
  T exchange(T value)
  {
    return value_.exchange(value, std::memory_order_acq_rel);
  }

  /// On failure `expected` receives the current content.
  bool compareExchange(T & expected, T desired)
  {
    return value_.compare_exchange_strong(
      expected, desired, std::memory_order_acq_rel, std::memory_order_acquire);
  }

  /// Applies `fn` atomically via a compare-exchange loop and returns the stored result.
  template<typename Fn>
  T update(Fn fn)
  {
    T current = value_.load(std::memory_order_acquire);
    T next = fn(current);
    while (!value_.compare_exchange_weak(
        current, next, std::memory_order_acq_rel, std::memory_order_acquire))
    {
      next = fn(current);
    }
    return next;
  }

  bool isLockFree() const
  {
    return value_.is_lock_free();
  }

private:
  std::atomic<T> value_;
};

template<typename T>
class SharedCell
{
public:
  SharedCell() = default;

  explicit SharedCell(std::shared_ptr<T> initial)
  : value_(std::move(initial))
  {
  }

  SharedCell(const SharedCell &) = delete;
  SharedCell & operator=(const SharedCell &) = delete;

  std::shared_ptr<T> load() const
  {
    return std::atomic_load(&value_);
  }

  void store(std::shared_ptr<T> value)
  {
    std::atomic_store(&value_, std::move(value));
  }

  std::shared_ptr<T> exchange(std::shared_ptr<T> value)
  {
    return std::atomic_exchange(&value_, std::move(value));
  }

private:
  std::shared_ptr<T> value_;
};

}  // namespace track_radar
