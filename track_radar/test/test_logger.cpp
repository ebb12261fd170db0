#include <gtest/gtest.h>

#include <track_radar/logger.hpp>

#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

// A default-constructed logger has no sink and discards everything.
TEST(LoggerTest, WithoutSinkIsSilent)
{
  track_radar::Logger logger;
  EXPECT_NO_THROW(logger.error("nowhere to go"));
}

TEST(LoggerTest, ForwardsLevelAndMessage)
{
  std::vector<std::pair<track_radar::LogLevel, std::string>> lines;
  track_radar::Logger logger(
    [&](const track_radar::LogLevel level, const std::string & message) {
      lines.emplace_back(level, message);
    });

  logger.verbose("a");
  logger.warn("b");

  ASSERT_EQ(lines.size(), 2u);
  EXPECT_EQ(lines[0].first, track_radar::LogLevel::Verbose);
  EXPECT_EQ(lines[0].second, "a");
  EXPECT_EQ(lines[1].first, track_radar::LogLevel::Warning);
}

// Sink failures stay inside the logger, whatever type is thrown.
TEST(LoggerTest, ThrowingSinkIsContained)
{
  track_radar::Logger stdThrower(
    [](track_radar::LogLevel, const std::string &) {
      throw std::runtime_error("log backend down");
    });
  EXPECT_NO_THROW(stdThrower.info("x"));

  int calls = 0;
  track_radar::Logger intThrower(
    [&calls](track_radar::LogLevel, const std::string &) {
      ++calls;
      throw 42;
    });
  EXPECT_NO_THROW(intThrower.info("x"));
  EXPECT_NO_THROW(intThrower.error("y"));
  EXPECT_EQ(calls, 2);
}

TEST(LoggerTest, LevelNames)
{
  EXPECT_STREQ(track_radar::toString(track_radar::LogLevel::Verbose), "VERBOSE");
  EXPECT_STREQ(track_radar::toString(track_radar::LogLevel::Info), "INFO");
  EXPECT_STREQ(track_radar::toString(track_radar::LogLevel::Warning), "WARN");
  EXPECT_STREQ(track_radar::toString(track_radar::LogLevel::Error), "ERROR");
}
