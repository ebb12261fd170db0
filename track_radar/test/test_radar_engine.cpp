/**
 * @file test_radar_engine.cpp
 * @brief Session-level tests for RadarEngine.
 *
 * These exercise the wiring between route matching, the off-track policy,
 * the watchdog and statistics. Fix timestamps and the watchdog clock both
 * come from one ManualScheduler so the two stay consistent.
 */

#include <gtest/gtest.h>

#include <track_radar/radar_engine.hpp>

#include "radar_test_utils.hpp"

#include <chrono>
#include <functional>
#include <limits>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>

using namespace std::chrono_literals;

namespace
{

using track_radar::AlarmKind;
using track_radar_test::east;
using track_radar_test::north;

const track_radar::GeoPoint kOrigin{0.0, 0.0};

std::shared_ptr<const track_radar::Route> equatorRoute()
{
  auto route = std::make_shared<track_radar::Route>();
  track_radar::RouteSegment segment;
  segment.points = {kOrigin, east(kOrigin, 2500.0), east(kOrigin, 5000.0)};
  route->segments.push_back(segment);
  return route;
}

/// Records alarms and hands each one to an optional hook while it is being fired.
class HookedAlarmSink : public track_radar_test::RecordingAlarmSink
{
public:
  void fire(const AlarmKind kind) override
  {
    RecordingAlarmSink::fire(kind);
    if (hook) {
      hook(kind);
    }
  }

  std::function<void(AlarmKind)> hook;
};

class RadarEngineTest : public ::testing::Test
{
protected:
  std::unique_ptr<track_radar::RadarEngine> makeEngine(
    std::shared_ptr<const track_radar::Route> route = equatorRoute())
  {
    return std::make_unique<track_radar::RadarEngine>(
      std::move(route), config, sink, log.logger(), scheduler.factory(), scheduler.clock());
  }

  track_radar::TimedPoint now(const track_radar::GeoPoint & point) const
  {
    return track_radar::TimedPoint{point, scheduler.now()};
  }

  track_radar::RadarConfig config;
  track_radar_test::ManualScheduler scheduler;
  track_radar_test::RecordingAlarmSink sink;
  track_radar_test::CapturingLog log;
};

}  // namespace

// The first on-track fix reports a non-positive distance and announces the signal.
TEST_F(RadarEngineTest, OnTrackFixAcknowledgesSignal)
{
  auto engine = makeEngine();
  EXPECT_FALSE(engine->hasSignal());

  const double dist = engine->ingestFix(now(north(east(kOrigin, 1000.0), 10.0)), 5.0);

  EXPECT_LE(dist, 0.0);
  EXPECT_TRUE(engine->hasSignal());
  EXPECT_EQ(sink.count(AlarmKind::PositiveAcknowledgement), 1u);

  const auto report = engine->info();
  EXPECT_TRUE(report.hasSignal);
  EXPECT_DOUBLE_EQ(report.signedDistance, dist);
  EXPECT_DOUBLE_EQ(report.accuracyM, 5.0);
  EXPECT_EQ(report.updates, 1u);
  EXPECT_EQ(report.skipped, 0u);
}

// Reacquiring the signal while off the route does not play the acknowledgement.
TEST_F(RadarEngineTest, OffTrackFixAcquiresSilently)
{
  auto engine = makeEngine();
  const double dist = engine->ingestFix(now(north(kOrigin, 500.0)), 5.0);

  EXPECT_NEAR(dist, 495.0, 0.5);
  EXPECT_TRUE(engine->hasSignal());
  EXPECT_EQ(sink.total(), 0u);
}

// Walking away from the route raises an off-track alarm.
TEST_F(RadarEngineTest, MovingOffTrackAlarms)
{
  auto engine = makeEngine();
  const auto start = north(kOrigin, 500.0);

  engine->ingestFix(now(start), 5.0);
  scheduler.advance(2s);
  engine->ingestFix(now(east(start, 20.0)), 5.0);

  EXPECT_EQ(sink.count(AlarmKind::OffTrack), 1u);
}

// Silence longer than the first timeout raises SignalLost; the next fix acknowledges.
TEST_F(RadarEngineTest, SilenceRaisesSignalLost)
{
  auto engine = makeEngine();
  engine->ingestFix(now(kOrigin), 5.0);
  sink.clear();

  scheduler.advance(config.noSignalFirstTimeout + 1s);
  EXPECT_EQ(sink.count(AlarmKind::SignalLost), 1u);
  EXPECT_FALSE(engine->info().hasSignal);

  engine->ingestFix(now(kOrigin), 5.0);
  EXPECT_EQ(sink.count(AlarmKind::PositiveAcknowledgement), 1u);
}

// A receiver that never delivers is reported at the first check, not after againInterval.
TEST_F(RadarEngineTest, NoFixEverRaisesAtFirstTimeout)
{
  auto engine = makeEngine();

  scheduler.advance(config.noSignalFirstTimeout - 1s);
  EXPECT_EQ(sink.total(), 0u);

  scheduler.advance(1s);
  EXPECT_EQ(sink.count(AlarmKind::SignalLost), 1u);
  EXPECT_FALSE(engine->hasSignal());
}

// A fix delivered from inside an alarm callback only refreshes the watchdog
// and gets the last completed distance back.
TEST_F(RadarEngineTest, ReentrantFixDuringOffTrackAlarm)
{
  HookedAlarmSink hooked;
  auto engine = std::make_unique<track_radar::RadarEngine>(
    equatorRoute(), config, hooked, log.logger(), scheduler.factory(), scheduler.clock());

  const auto start = north(kOrigin, 500.0);
  const double firstDist = engine->ingestFix(now(start), 5.0);
  EXPECT_NEAR(firstDist, 495.0, 0.5);

  scheduler.advance(config.noSignalFirstTimeout + 1s);
  ASSERT_EQ(hooked.count(AlarmKind::SignalLost), 1u);
  ASSERT_FALSE(engine->hasSignal());

  double nestedDist = 0.0;
  int nestedCalls = 0;
  hooked.hook = [&](const AlarmKind kind) {
      if (kind == AlarmKind::OffTrack && nestedCalls == 0) {
        ++nestedCalls;
        nestedDist = engine->ingestFix(now(east(start, 210.0)), 5.0);
      }
    };

  scheduler.advance(1s);
  const double outerDist = engine->ingestFix(now(east(start, 200.0)), 5.0);

  EXPECT_EQ(nestedCalls, 1);
  EXPECT_DOUBLE_EQ(nestedDist, firstDist);
  EXPECT_GT(outerDist, 0.0);
  EXPECT_EQ(hooked.count(AlarmKind::OffTrack), 1u);
  EXPECT_EQ(hooked.count(AlarmKind::PositiveAcknowledgement), 0u);
  EXPECT_TRUE(engine->hasSignal());

  const auto report = engine->info();
  EXPECT_EQ(report.updates, 2u);
  EXPECT_EQ(report.skipped, 1u);
  EXPECT_DOUBLE_EQ(report.signedDistance, outerDist);
}

// An empty route can never be matched; fixes stay silent.
TEST_F(RadarEngineTest, EmptyRouteIsAlwaysOffTrack)
{
  auto engine = makeEngine(std::make_shared<track_radar::Route>());
  const double dist = engine->ingestFix(now(kOrigin), 5.0);

  EXPECT_EQ(dist, std::numeric_limits<double>::max());
  EXPECT_EQ(sink.total(), 0u);
}

TEST_F(RadarEngineTest, RejectsNullRouteAndInvalidConfig)
{
  EXPECT_THROW(makeEngine(nullptr), std::invalid_argument);

  config.noSignalFirstTimeout = 0ms;
  EXPECT_THROW(makeEngine(), std::invalid_argument);
}

// A rejected config leaves the active one in place.
TEST_F(RadarEngineTest, UpdateConfigValidates)
{
  auto engine = makeEngine();
  const auto fix = now(north(kOrigin, 500.0));
  EXPECT_GT(engine->ingestFix(fix, 0.0), 0.0);

  auto invalid = config;
  invalid.onTrackThresholdM = -1.0;
  EXPECT_THROW(engine->updateConfig(invalid), std::invalid_argument);
  EXPECT_DOUBLE_EQ(engine->config().onTrackThresholdM, config.onTrackThresholdM);

  auto wider = config;
  wider.onTrackThresholdM = 600.0;
  engine->updateConfig(wider);
  EXPECT_LE(engine->ingestFix(fix, 0.0), 0.0);
}

// New watchdog timeouts apply from the next check on.
TEST_F(RadarEngineTest, ConfigChangeReachesWatchdog)
{
  auto engine = makeEngine();
  engine->ingestFix(now(kOrigin), 5.0);

  auto faster = config;
  faster.noSignalFirstTimeout = 5s;
  faster.noSignalAgainInterval = 5s;
  engine->updateConfig(faster);

  scheduler.advance(config.noSignalFirstTimeout);
  EXPECT_EQ(sink.count(AlarmKind::SignalLost), 1u);
  EXPECT_EQ(scheduler.lastDelay(), 5s);
}

// After dispose the session rejects every call except dispose itself.
TEST_F(RadarEngineTest, DisposeRejectsFurtherUse)
{
  auto engine = makeEngine();
  engine->dispose();
  EXPECT_NO_THROW(engine->dispose());

  EXPECT_TRUE(scheduler.timer()->disposed());
  EXPECT_THROW(engine->ingestFix(now(kOrigin), 5.0), std::logic_error);
  EXPECT_THROW(engine->info(), std::logic_error);
  EXPECT_THROW(engine->hasSignal(), std::logic_error);

  scheduler.advance(10min);
  EXPECT_EQ(sink.total(), 0u);
}

// A log sink that throws must not break the fix path.
TEST_F(RadarEngineTest, ThrowingLogSinkIsContained)
{
  track_radar::RadarEngine engine(
    equatorRoute(), config, sink,
    track_radar::Logger(
      [](track_radar::LogLevel, const std::string &) {
        throw std::runtime_error("log backend down");
      }),
    scheduler.factory(), scheduler.clock());

  EXPECT_LE(engine.ingestFix(now(kOrigin), 5.0), 0.0);
  EXPECT_EQ(engine.info().updates, 1u);
}

// Info replies stay readable for every state, including no matched leg.
TEST(DescribeStatusTest, FormatsEveryState)
{
  track_radar::StatusReport report;
  EXPECT_EQ(track_radar::describe(report), "no_signal");

  report.hasSignal = true;
  report.signedDistance = std::numeric_limits<double>::max();
  report.accuracyM = 4.0;
  EXPECT_EQ(track_radar::describe(report), "off_route accuracy=4.0m");

  report.signedDistance = -12.34;
  EXPECT_EQ(track_radar::describe(report), "signed_distance=-12.3m accuracy=4.0m");

  report.signedDistance = 1234567.0;
  EXPECT_EQ(track_radar::describe(report), "signed_distance=1234567.0m accuracy=4.0m");
}
