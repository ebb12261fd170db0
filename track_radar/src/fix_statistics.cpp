#include <track_radar/fix_statistics.hpp>

#include <sstream>

namespace track_radar
{

bool FixStatistics::tryBeginUpdate()
{
  bool expected = false;
  if (updating_.compareExchange(expected, true)) {
    return true;
  }
  skipped_.update([](uint64_t value) {return value + 1;});
  return false;
}

void FixStatistics::completeUpdate(const double signedDistance, const double accuracyM)
{
  signedDistance_.store(signedDistance);
  accuracy_.store(accuracyM);
  updates_.update([](uint64_t value) {return value + 1;});
  updating_.store(false);
}

void FixStatistics::reset()
{
  signedDistance_.store(std::numeric_limits<double>::max());
  accuracy_.store(0.0);
  updates_.store(0);
  skipped_.store(0);
  updating_.store(false);
}

std::string FixStatistics::toString() const
{
  std::ostringstream oss;
  oss << "updates=" << updates() << " skipped=" << skipped()
      << " last_distance=" << signedDistance() << "m accuracy=" << accuracy() << "m";
  return oss.str();
}

}  // namespace track_radar
