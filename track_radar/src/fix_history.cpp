#include <track_radar/fix_history.hpp>

#include <stdexcept>

namespace track_radar
{

FixHistory::FixHistory(const std::size_t capacity)
: capacity_(capacity == 0 ? 1 : capacity)
{
}

void FixHistory::push(const TimedPoint & fix)
{
  entries_.push_back(fix);
  while (entries_.size() > capacity_) {
    entries_.pop_front();
  }
}

void FixHistory::clear()
{
  entries_.clear();
}

bool FixHistory::empty() const
{
  return entries_.empty();
}

std::size_t FixHistory::size() const
{
  return entries_.size();
}

std::size_t FixHistory::capacity() const
{
  return capacity_;
}

const TimedPoint & FixHistory::last() const
{
  if (entries_.empty()) {
    throw std::out_of_range("fix history is empty");
  }
  return entries_.back();
}

const TimedPoint & FixHistory::first() const
{
  if (entries_.empty()) {
    throw std::out_of_range("fix history is empty");
  }
  return entries_.front();
}

}  // namespace track_radar
