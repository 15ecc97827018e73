// Ticket: 0005_delivery_simulation

#include <gtest/gtest.h>

#include <cmath>
#include <vector>

#include "nbd-sim/src/Delivery/SuccessScorer.hpp"
#include "nbd-sim/src/Utils/InvalidParameter.hpp"

namespace nbd_sim
{
namespace test
{

TEST(SuccessScorer, EndOnTarget_FullDistanceScore)
{
  Coordinate const target{1.0, 1.0, 1.0};
  std::vector<Coordinate> const path{Coordinate{0.0, 0.0, 0.0},
                                     Coordinate{0.5, 0.5, 0.5},
                                     target};

  EXPECT_NEAR(SuccessScorer::score(path, target), 0.7 + 0.3 / 3.0, 1e-12);
}

TEST(SuccessScorer, NoProgress_OnlyPathEfficiency)
{
  Coordinate const target{1.0, 1.0, 1.0};
  std::vector<Coordinate> const path{Coordinate{0.0, 0.0, 0.0}};

  EXPECT_NEAR(SuccessScorer::score(path, target), 0.3, 1e-12);
}

TEST(SuccessScorer, HalfwayOnLongPath)
{
  Coordinate const target{2.0, 0.0, 0.0};
  std::vector<Coordinate> path(10, Coordinate{0.0, 0.0, 0.0});
  path.back() = Coordinate{1.0, 0.0, 0.0};

  EXPECT_NEAR(SuccessScorer::score(path, target), 0.7 * 0.5 + 0.03, 1e-12);
}

TEST(SuccessScorer, Overshoot_DistanceClamped)
{
  Coordinate const target{1.0, 0.0, 0.0};
  std::vector<Coordinate> const path{Coordinate{0.0, 0.0, 0.0},
                                     Coordinate{-5.0, 0.0, 0.0}};

  EXPECT_NEAR(SuccessScorer::score(path, target), 0.15, 1e-12);
}

TEST(SuccessScorer, ZeroTarget_NoNaN)
{
  Coordinate const origin{0.0, 0.0, 0.0};

  std::vector<Coordinate> const stayed{origin, origin};
  double const onTarget = SuccessScorer::score(stayed, origin);
  EXPECT_FALSE(std::isnan(onTarget));
  EXPECT_NEAR(onTarget, 0.7 + 0.15, 1e-12);

  std::vector<Coordinate> const drifted{origin, Coordinate{0.1, 0.0, 0.0}};
  double const offTarget = SuccessScorer::score(drifted, origin);
  EXPECT_FALSE(std::isnan(offTarget));
  EXPECT_NEAR(offTarget, 0.15, 1e-12);
}

TEST(SuccessScorer, NormalizedDistance_Guards)
{
  EXPECT_DOUBLE_EQ(SuccessScorer::normalizedDistance(0.5, 2.0), 0.25);
  EXPECT_DOUBLE_EQ(SuccessScorer::normalizedDistance(3.0, 2.0), 1.0);
  EXPECT_DOUBLE_EQ(SuccessScorer::normalizedDistance(0.0, 0.0), 0.0);
  EXPECT_DOUBLE_EQ(SuccessScorer::normalizedDistance(0.2, 0.0), 1.0);
}

TEST(SuccessScorer, Score_AlwaysInUnitInterval)
{
  Coordinate const target{0.4, -0.2, 0.9};
  std::vector<Coordinate> path{Coordinate{0.0, 0.0, 0.0}};
  for (int i = 1; i <= 20; ++i)
  {
    path.emplace_back(0.1 * i, std::sin(i), -0.05 * i);
    double const score = SuccessScorer::score(path, target);
    EXPECT_GE(score, 0.0);
    EXPECT_LE(score, 1.0);
  }
}

TEST(SuccessScorer, EmptyPath_Throws)
{
  std::vector<Coordinate> const path{};
  EXPECT_THROW(SuccessScorer::score(path, Coordinate{1.0, 1.0, 1.0}),
               InvalidParameter);
}

}  // namespace test
}  // namespace nbd_sim
