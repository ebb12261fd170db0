/**
 * @file test_geo_math.cpp
 * @brief Unit tests for the spherical distance helpers.
 *
 * The reference route runs along the equator from 0E to 1E, so meridian
 * offsets give exact expected cross-track distances.
 */

#include <gtest/gtest.h>

#include <track_radar/geo_math.hpp>

#include "radar_test_utils.hpp"

#include <algorithm>
#include <cmath>
#include <utility>
#include <vector>

namespace
{

const track_radar::GeoPoint kA{0.0, 0.0};
const track_radar::GeoPoint kB{0.0, 1.0};

}  // namespace

// One degree of latitude is R * pi / 180 meters on the package's sphere.
TEST(GeoMathTest, OneDegreeOfLatitude)
{
  const double d = track_radar::distance({10.0, 20.0}, {11.0, 20.0});
  EXPECT_NEAR(d, track_radar_test::metersPerDegree(), 0.01);
}

TEST(GeoMathTest, DistanceIsSymmetricAndZeroForSamePoint)
{
  const track_radar::GeoPoint p{47.3769, 8.5417};
  const track_radar::GeoPoint q{46.9480, 7.4474};

  EXPECT_DOUBLE_EQ(track_radar::distance(p, p), 0.0);
  EXPECT_DOUBLE_EQ(track_radar::distance(p, q), track_radar::distance(q, p));
}

// Antipodal points must not produce NaN from rounding in the haversine term.
TEST(GeoMathTest, AntipodalDistanceIsHalfCircumference)
{
  const double d = track_radar::distance({0.0, 0.0}, {0.0, 180.0});
  EXPECT_FALSE(std::isnan(d));
  EXPECT_NEAR(d, M_PI * track_radar::kEarthRadiusM, 1.0);
}

// A point beside the middle of the arc reports its perpendicular offset.
TEST(GeoMathTest, CrossTrackBesideArc)
{
  const auto p = track_radar_test::north({0.0, 0.5}, 111.0);
  EXPECT_NEAR(track_radar::distanceToSegment(p, kA, kB), 111.0, 0.1);

  // Side of the arc does not matter.
  const auto q = track_radar_test::north({0.0, 0.5}, -111.0);
  EXPECT_NEAR(track_radar::distanceToSegment(q, kA, kB), 111.0, 0.1);
}

// Before the start of the arc the result clamps to the start point.
TEST(GeoMathTest, ClampsToStartPoint)
{
  const track_radar::GeoPoint p{0.001, -0.01};
  EXPECT_DOUBLE_EQ(track_radar::distanceToSegment(p, kA, kB), track_radar::distance(kA, p));
}

// Past the end of the arc the result clamps to the end point.
TEST(GeoMathTest, ClampsToEndPoint)
{
  const track_radar::GeoPoint p{0.001, 1.01};
  EXPECT_DOUBLE_EQ(track_radar::distanceToSegment(p, kA, kB), track_radar::distance(kB, p));
}

TEST(GeoMathTest, DegenerateArcIsPointDistance)
{
  const track_radar::GeoPoint p{0.01, 0.01};
  EXPECT_DOUBLE_EQ(track_radar::distanceToSegment(p, kA, kA), track_radar::distance(kA, p));
}

// For points within a quarter circle of the arc, the arc distance is non-negative
// and never exceeds the nearer endpoint distance.
TEST(GeoMathTest, SegmentDistanceBoundedByEndpoints)
{
  const std::vector<track_radar::GeoPoint> samples{
    {0.0, 0.5}, {0.3, 0.2}, {-0.3, 0.9}, {0.2, -0.4}, {-0.1, 1.3}, {0.0, 1.0},
    {46.05, 7.1}, {45.9, 6.8}, {46.3, 7.5}};
  const std::vector<std::pair<track_radar::GeoPoint, track_radar::GeoPoint>> arcs{
    {kA, kB}, {{46.0, 7.0}, {46.1, 7.2}}};

  for (const auto & arc : arcs) {
    for (const auto & p : samples) {
      const double d = track_radar::distanceToSegment(p, arc.first, arc.second);
      const double nearest = std::min(
        track_radar::distance(arc.first, p), track_radar::distance(arc.second, p));
      EXPECT_GE(d, 0.0);
      EXPECT_LE(d, nearest);
    }
  }
}

TEST(GeoMathTest, InitialBearingCardinalDirections)
{
  EXPECT_NEAR(track_radar::initialBearing(kA, {1.0, 0.0}), 0.0, 1e-9);
  EXPECT_NEAR(track_radar::initialBearing(kA, kB), M_PI / 2.0, 1e-9);
}
