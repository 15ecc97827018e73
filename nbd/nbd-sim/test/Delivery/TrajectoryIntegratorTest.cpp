// Ticket: 0003_trajectory_integrator

#include <gtest/gtest.h>

#include <cmath>
#include <cstddef>
#include <limits>
#include <random>

#include "nbd-sim/src/Delivery/TrajectoryIntegrator.hpp"
#include "nbd-sim/src/Design/NanobotConfig.hpp"
#include "nbd-sim/src/Utils/InvalidParameter.hpp"

namespace nbd_sim
{
namespace test
{

namespace
{

/// Integrator with every noise source disabled, so a run is a straight line
TrajectoryIntegrator::Config noiseFreeConfig()
{
  TrajectoryIntegrator::Config config{};
  config.brownianStdDev = 0.0;
  config.cellularInteractionAmplitude = 0.0;
  return config;
}

/// Drift per step of a noise-free run
double noiseFreeStepLength(const NanobotConfig& nanobot)
{
  return 0.95 * TrajectoryIntegrator::baseVelocity(nanobot.getMechanism(),
                                                   nanobot.getEfficiency());
}

}  // namespace

// ========== Velocity Helpers ==========

TEST(TrajectoryIntegrator, MechanismVelocity_FixedPerMechanism)
{
  EXPECT_DOUBLE_EQ(TrajectoryIntegrator::mechanismVelocity(
                     DeliveryMechanism::PassiveDiffusion),
                   0.05);
  EXPECT_DOUBLE_EQ(TrajectoryIntegrator::mechanismVelocity(
                     DeliveryMechanism::ActiveTransport),
                   0.1);
  EXPECT_DOUBLE_EQ(TrajectoryIntegrator::mechanismVelocity(
                     DeliveryMechanism::GuidedPropulsion),
                   0.15);
}

TEST(TrajectoryIntegrator, BaseVelocity_ScaledByEfficiency)
{
  EXPECT_DOUBLE_EQ(
    TrajectoryIntegrator::baseVelocity(DeliveryMechanism::GuidedPropulsion, 0.5),
    0.075);
}

TEST(TrajectoryIntegrator, Direction_IsUnitVector)
{
  Vector3D const dir =
    TrajectoryIntegrator::direction(Coordinate{1.0, 1.0, 1.0},
                                    Coordinate{4.0, 5.0, 1.0});
  EXPECT_NEAR(dir.norm(), 1.0, 1e-12);
  EXPECT_NEAR(dir.x(), 0.6, 1e-12);
  EXPECT_NEAR(dir.y(), 0.8, 1e-12);
  EXPECT_DOUBLE_EQ(dir.z(), 0.0);
}

TEST(TrajectoryIntegrator, Direction_CoincidentPoints_ZeroVector)
{
  Coordinate const p{0.3, -0.2, 0.7};
  Vector3D const dir = TrajectoryIntegrator::direction(p, p);
  EXPECT_DOUBLE_EQ(dir.x(), 0.0);
  EXPECT_DOUBLE_EQ(dir.y(), 0.0);
  EXPECT_DOUBLE_EQ(dir.z(), 0.0);
  EXPECT_FALSE(std::isnan(dir.norm()));
}

// ========== Single Step ==========

TEST(TrajectoryIntegrator, Step_ComposesAllTerms)
{
  TrajectoryIntegrator const integrator{};
  Coordinate const current{0.1, 0.2, 0.3};
  Coordinate const target{1.0, 1.0, 1.0};
  double const vBase = 0.04;

  RandomEngine rng{7};
  TrajectoryStep const step = integrator.step(current, target, vBase, rng);

  RandomEngine reference{7};
  std::normal_distribution<double> noise{0.0, 0.01};
  double const bx = noise(reference);
  double const by = noise(reference);
  double const bz = noise(reference);

  EXPECT_DOUBLE_EQ(step.effect.fluidResistance, -0.05 * vBase);
  EXPECT_DOUBLE_EQ(step.velocity, 0.95 * vBase);
  EXPECT_DOUBLE_EQ(step.effect.brownianVector.x(), bx);
  EXPECT_DOUBLE_EQ(step.effect.brownianVector.y(), by);
  EXPECT_DOUBLE_EQ(step.effect.brownianVector.z(), bz);
  EXPECT_NEAR(step.effect.cellularInteraction, 0.02 * std::sin(0.6), 1e-15);

  Vector3D const dir = TrajectoryIntegrator::direction(current, target);
  Coordinate const expected =
    current + dir * (step.velocity + step.effect.cellularInteraction) +
    Vector3D{bx, by, bz};
  EXPECT_NEAR(step.position.x(), expected.x(), 1e-15);
  EXPECT_NEAR(step.position.y(), expected.y(), 1e-15);
  EXPECT_NEAR(step.position.z(), expected.z(), 1e-15);
}

TEST(TrajectoryIntegrator, Step_ZeroSigma_NoBrownianDraw)
{
  TrajectoryIntegrator const integrator{noiseFreeConfig()};
  RandomEngine rng{3};
  RandomEngine untouched{3};

  TrajectoryStep const step = integrator.step(
    Coordinate{0.0, 0.0, 0.0}, Coordinate{1.0, 0.0, 0.0}, 0.1, rng);

  EXPECT_DOUBLE_EQ(step.effect.brownianVector.norm(), 0.0);
  EXPECT_EQ(rng, untouched);
  EXPECT_NEAR(step.position.x(), 0.095, 1e-15);
}

// ========== Termination ==========

TEST(TrajectoryIntegrator, NoiseFree_ReachesTargetInExactSteps)
{
  NanobotConfig const nanobot{20.0, PayloadType::MRNA};
  TrajectoryIntegrator const integrator{noiseFreeConfig()};
  double const v = noiseFreeStepLength(nanobot);
  Coordinate const target{10.0 * v, 0.0, 0.0};

  RandomEngine rng{0};
  auto const result =
    integrator.run(Coordinate{0.0, 0.0, 0.0}, target, nanobot, rng);

  EXPECT_EQ(result.state, TrajectoryIntegrator::State::Reached);
  EXPECT_TRUE(result.targetReached());
  EXPECT_EQ(result.steps.size(), 10U);
  ASSERT_EQ(result.path.size(), 11U);
  EXPECT_LT((result.path.back() - target).norm(), 1e-3);
}

TEST(TrajectoryIntegrator, StartOnTarget_ReachedWithoutSteps)
{
  NanobotConfig const nanobot{20.0, PayloadType::MRNA};
  TrajectoryIntegrator const integrator{};
  Coordinate const target{0.5, 0.5, 0.5};

  RandomEngine rng{0};
  auto const result = integrator.run(target, target, nanobot, rng);

  EXPECT_EQ(result.state, TrajectoryIntegrator::State::Reached);
  EXPECT_TRUE(result.steps.empty());
  ASSERT_EQ(result.path.size(), 1U);
  EXPECT_TRUE(result.path.front().isApprox(target));
}

TEST(TrajectoryIntegrator, UnreachableTarget_ExhaustsAtStepCap)
{
  NanobotConfig const nanobot{20.0, PayloadType::MRNA};
  TrajectoryIntegrator const integrator{};
  Coordinate const target{1000.0, 0.0, 0.0};

  RandomEngine rng{0};
  auto const result =
    integrator.run(Coordinate{0.0, 0.0, 0.0}, target, nanobot, rng);

  EXPECT_EQ(result.state, TrajectoryIntegrator::State::Exhausted);
  EXPECT_FALSE(result.targetReached());
  EXPECT_EQ(result.steps.size(), 1000U);
  EXPECT_EQ(result.path.size(), 1001U);
}

TEST(TrajectoryIntegrator, CustomStepCap_Honored)
{
  TrajectoryIntegrator::Config config{};
  config.maxSteps = 25;
  TrajectoryIntegrator const integrator{config};
  NanobotConfig const nanobot{80.0, PayloadType::Plasmids};

  RandomEngine rng{11};
  auto const result = integrator.run(
    Coordinate{0.0, 0.0, 0.0}, Coordinate{50.0, 50.0, 50.0}, nanobot, rng);

  EXPECT_EQ(result.state, TrajectoryIntegrator::State::Exhausted);
  EXPECT_EQ(result.steps.size(), 25U);
  EXPECT_EQ(result.path.size(), 26U);
}

TEST(TrajectoryIntegrator, ZeroEfficiency_StillTerminates)
{
  // exp(-(1e6 - 30)^2 / 800) underflows to zero
  NanobotConfig const nanobot{1e6, PayloadType::MRNA};
  ASSERT_DOUBLE_EQ(nanobot.getEfficiency(), 0.0);

  TrajectoryIntegrator const integrator{};
  RandomEngine rng{0};
  Coordinate const target{1.0, 1.0, 1.0};
  auto const result =
    integrator.run(Coordinate{0.0, 0.0, 0.0}, target, nanobot, rng);

  EXPECT_LE(result.steps.size(), 1000U);
  EXPECT_EQ(result.path.size(), result.steps.size() + 1);
  for (const auto& step : result.steps)
  {
    EXPECT_DOUBLE_EQ(step.velocity, 0.0);
  }
}

TEST(TrajectoryIntegrator, DefaultNoise_PathInvariantsHold)
{
  NanobotConfig const nanobot{20.0, PayloadType::MRNA};
  TrajectoryIntegrator const integrator{};
  Coordinate const target{1.0, 1.0, 1.0};

  RandomEngine rng{0};
  auto const result =
    integrator.run(Coordinate{0.0, 0.0, 0.0}, target, nanobot, rng);

  EXPECT_NE(result.state, TrajectoryIntegrator::State::Traveling);
  EXPECT_LE(result.steps.size(), 1000U);
  ASSERT_EQ(result.path.size(), result.steps.size() + 1);
  for (std::size_t i = 0; i < result.steps.size(); ++i)
  {
    EXPECT_TRUE(result.steps[i].position.isApprox(result.path[i + 1]));
  }
  if (result.targetReached())
  {
    EXPECT_LT((result.path.back() - target).norm(), 1e-3);
  }
  else
  {
    EXPECT_EQ(result.steps.size(), 1000U);
  }
}

// ========== Reproducibility ==========

TEST(TrajectoryIntegrator, SameSeed_BitIdenticalPaths)
{
  NanobotConfig const nanobot{20.0, PayloadType::MRNA};
  TrajectoryIntegrator const integrator{};
  Coordinate const target{1.0, 1.0, 1.0};

  RandomEngine rngA{42};
  RandomEngine rngB{42};
  auto const a = integrator.run(Coordinate{0.0, 0.0, 0.0}, target, nanobot, rngA);
  auto const b = integrator.run(Coordinate{0.0, 0.0, 0.0}, target, nanobot, rngB);

  ASSERT_EQ(a.path.size(), b.path.size());
  for (std::size_t i = 0; i < a.path.size(); ++i)
  {
    EXPECT_EQ(a.path[i].x(), b.path[i].x());
    EXPECT_EQ(a.path[i].y(), b.path[i].y());
    EXPECT_EQ(a.path[i].z(), b.path[i].z());
  }
  EXPECT_EQ(a.state, b.state);
}

TEST(TrajectoryIntegrator, DifferentSeeds_DifferentPaths)
{
  NanobotConfig const nanobot{20.0, PayloadType::MRNA};
  TrajectoryIntegrator const integrator{};
  Coordinate const target{1.0, 1.0, 1.0};

  RandomEngine rngA{1};
  RandomEngine rngB{2};
  auto const a = integrator.run(Coordinate{0.0, 0.0, 0.0}, target, nanobot, rngA);
  auto const b = integrator.run(Coordinate{0.0, 0.0, 0.0}, target, nanobot, rngB);

  ASSERT_GE(a.path.size(), 2U);
  ASSERT_GE(b.path.size(), 2U);
  EXPECT_NE(a.path[1].x(), b.path[1].x());
}

// ========== Configuration ==========

TEST(TrajectoryIntegrator, DefaultConfig_Values)
{
  TrajectoryIntegrator const integrator{};
  auto const& config = integrator.getConfig();
  EXPECT_EQ(config.maxSteps, 1000U);
  EXPECT_DOUBLE_EQ(config.arrivalThreshold, 1e-3);
  EXPECT_DOUBLE_EQ(config.brownianStdDev, 0.01);
  EXPECT_DOUBLE_EQ(config.fluidResistanceCoefficient, 0.05);
  EXPECT_DOUBLE_EQ(config.cellularInteractionAmplitude, 0.02);
}

TEST(TrajectoryIntegrator, InvalidConfig_Throws)
{
  TrajectoryIntegrator::Config badThreshold{};
  badThreshold.arrivalThreshold = 0.0;
  EXPECT_THROW(TrajectoryIntegrator{badThreshold}, InvalidParameter);

  TrajectoryIntegrator::Config badSigma{};
  badSigma.brownianStdDev = -0.01;
  EXPECT_THROW(TrajectoryIntegrator{badSigma}, InvalidParameter);

  TrajectoryIntegrator::Config infiniteSigma{};
  infiniteSigma.brownianStdDev = std::numeric_limits<double>::infinity();
  EXPECT_THROW(TrajectoryIntegrator{infiniteSigma}, InvalidParameter);

  TrajectoryIntegrator::Config badCoefficient{};
  badCoefficient.fluidResistanceCoefficient = std::nan("");
  EXPECT_THROW(TrajectoryIntegrator{badCoefficient}, InvalidParameter);
}

TEST(TrajectoryIntegrator, StepCapAboveLimit_Throws)
{
  TrajectoryIntegrator::Config overCap{};
  overCap.maxSteps = 5000;
  EXPECT_THROW(TrajectoryIntegrator{overCap}, InvalidParameter);

  TrajectoryIntegrator::Config hugeCap{};
  hugeCap.maxSteps = std::numeric_limits<std::size_t>::max();
  EXPECT_THROW(TrajectoryIntegrator{hugeCap}, InvalidParameter);

  TrajectoryIntegrator::Config zeroCap{};
  zeroCap.maxSteps = 0;
  EXPECT_THROW(TrajectoryIntegrator{zeroCap}, InvalidParameter);
}

TEST(TrajectoryIntegrator, StepCapAtLimit_Accepted)
{
  TrajectoryIntegrator::Config config{};
  config.maxSteps = TrajectoryIntegrator::kStepCap;
  EXPECT_NO_THROW(TrajectoryIntegrator{config});

  config.maxSteps = 1;
  EXPECT_NO_THROW(TrajectoryIntegrator{config});
}

TEST(TrajectoryIntegrator, NonFinitePositions_Throw)
{
  NanobotConfig const nanobot{20.0, PayloadType::MRNA};
  TrajectoryIntegrator const integrator{};
  double const nan = std::numeric_limits<double>::quiet_NaN();
  double const inf = std::numeric_limits<double>::infinity();
  Coordinate const origin{0.0, 0.0, 0.0};

  RandomEngine rng{0};
  EXPECT_THROW(
    integrator.run(origin, Coordinate{nan, 1.0, 1.0}, nanobot, rng),
    InvalidParameter);
  EXPECT_THROW(
    integrator.run(origin, Coordinate{1.0, inf, 1.0}, nanobot, rng),
    InvalidParameter);
  EXPECT_THROW(
    integrator.run(Coordinate{0.0, 0.0, -inf}, origin, nanobot, rng),
    InvalidParameter);
}

TEST(TrajectoryIntegrator, StateNames)
{
  EXPECT_EQ(toString(TrajectoryIntegrator::State::Traveling), "traveling");
  EXPECT_EQ(toString(TrajectoryIntegrator::State::Reached), "reached");
  EXPECT_EQ(toString(TrajectoryIntegrator::State::Exhausted), "exhausted");
}

}  // namespace test
}  // namespace nbd_sim
