#include <gtest/gtest.h>

#include <track_radar/fix_history.hpp>

#include <chrono>
#include <stdexcept>

namespace
{

track_radar::TimedPoint fixAt(const int seconds)
{
  track_radar::TimedPoint fix;
  fix.point = {0.0, seconds * 0.001};
  fix.timestamp = track_radar::Clock::time_point{} + std::chrono::seconds(seconds);
  return fix;
}

}  // namespace

TEST(FixHistoryTest, EmptyHistoryThrowsOnAccess)
{
  track_radar::FixHistory history;
  EXPECT_TRUE(history.empty());
  EXPECT_EQ(history.capacity(), track_radar::kDefaultFixHistoryCapacity);
  EXPECT_THROW(history.last(), std::out_of_range);
  EXPECT_THROW(history.first(), std::out_of_range);
}

// The fourth push evicts the oldest fix; order is preserved.
TEST(FixHistoryTest, EvictsOldestBeyondCapacity)
{
  track_radar::FixHistory history;
  for (int i = 1; i <= 4; ++i) {
    history.push(fixAt(i));
  }

  EXPECT_EQ(history.size(), 3u);
  EXPECT_EQ(history.first().timestamp, fixAt(2).timestamp);
  EXPECT_EQ(history.last().timestamp, fixAt(4).timestamp);
}

TEST(FixHistoryTest, ZeroCapacityKeepsOneFix)
{
  track_radar::FixHistory history(0);
  history.push(fixAt(1));
  history.push(fixAt(2));

  EXPECT_EQ(history.capacity(), 1u);
  EXPECT_EQ(history.size(), 1u);
  EXPECT_EQ(history.last().timestamp, fixAt(2).timestamp);
}

TEST(FixHistoryTest, ClearEmptiesHistory)
{
  track_radar::FixHistory history;
  history.push(fixAt(1));
  history.clear();
  EXPECT_TRUE(history.empty());
}
