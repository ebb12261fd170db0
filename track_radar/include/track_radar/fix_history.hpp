#pragma once

#include <track_radar/geo_types.hpp>

#include <cstddef>
#include <deque>

namespace track_radar
{

/// Three fixes is wide enough to smooth GPS jitter, narrow enough to notice a sudden stop.
constexpr std::size_t kDefaultFixHistoryCapacity = 3;

/**
 * @class FixHistory
 * @brief Fixed-capacity rolling window of recent fixes, oldest evicted first.
 *
 * Only touched from the fix-ingestion path, so it carries no synchronization.
 */
class FixHistory
{
public:
  explicit FixHistory(std::size_t capacity = kDefaultFixHistoryCapacity);

  void push(const TimedPoint & fix);
  void clear();

  bool empty() const;
  std::size_t size() const;
  std::size_t capacity() const;

  /// Most recently pushed fix. Throws std::out_of_range when empty.
  const TimedPoint & last() const;
  /// Oldest retained fix. Throws std::out_of_range when empty.
  const TimedPoint & first() const;

private:
  std::size_t capacity_;
  std::deque<TimedPoint> entries_;
};

}  // namespace track_radar
