// Ticket: 0003_trajectory_integrator

#include "nbd-sim/src/Delivery/TrajectoryIntegrator.hpp"

#include <cmath>
#include <string>

#include "nbd-sim/src/Design/NanobotConfig.hpp"
#include "nbd-sim/src/Utils/InvalidParameter.hpp"

namespace nbd_sim
{

TrajectoryIntegrator::TrajectoryIntegrator()
  : config_{}
{
}

TrajectoryIntegrator::TrajectoryIntegrator(const Config& config)
  : config_{config}
{
  if (config_.maxSteps == 0 || config_.maxSteps > kStepCap)
  {
    throw InvalidParameter{"Step cap must be in [1, " +
                           std::to_string(kStepCap) + "], got " +
                           std::to_string(config_.maxSteps)};
  }
  if (!(config_.arrivalThreshold > 0.0))
  {
    throw InvalidParameter{"Arrival threshold must be positive"};
  }
  if (!(config_.brownianStdDev >= 0.0) ||
      !std::isfinite(config_.brownianStdDev))
  {
    throw InvalidParameter{"Brownian standard deviation must be non-negative"};
  }
  if (!std::isfinite(config_.fluidResistanceCoefficient) ||
      !std::isfinite(config_.cellularInteractionAmplitude))
  {
    throw InvalidParameter{"Integrator coefficients must be finite"};
  }
}

TrajectoryIntegrator::Result TrajectoryIntegrator::run(
  const Coordinate& start,
  const Coordinate& target,
  const NanobotConfig& nanobot,
  RandomEngine& rng) const
{
  if (!start.allFinite() || !target.allFinite())
  {
    throw InvalidParameter{"Start and target positions must be finite"};
  }

  double const vBase =
    baseVelocity(nanobot.getMechanism(), nanobot.getEfficiency());

  Result result{};
  result.path.reserve(config_.maxSteps + 1);
  result.steps.reserve(config_.maxSteps);
  result.path.push_back(start);

  Coordinate current = start;

  // A start point already within the threshold needs no steps
  if (hasReached(current, target))
  {
    result.state = State::Reached;
    return result;
  }

  while (result.state == State::Traveling)
  {
    if (result.steps.size() >= config_.maxSteps)
    {
      result.state = State::Exhausted;
      break;
    }

    TrajectoryStep const next = step(current, target, vBase, rng);
    current = next.position;
    result.path.push_back(current);
    result.steps.push_back(next);

    if (hasReached(current, target))
    {
      result.state = State::Reached;
    }
  }

  return result;
}

TrajectoryStep TrajectoryIntegrator::step(const Coordinate& current,
                                          const Coordinate& target,
                                          double baseVelocity,
                                          RandomEngine& rng) const
{
  Vector3D const dir = direction(current, target);

  TrajectoryStep result{};
  result.effect.fluidResistance =
    -config_.fluidResistanceCoefficient * baseVelocity;
  result.velocity = baseVelocity + result.effect.fluidResistance;

  // std::normal_distribution requires sigma > 0; sigma == 0 means no noise
  if (config_.brownianStdDev > 0.0)
  {
    std::normal_distribution<double> noise{0.0, config_.brownianStdDev};
    double const bx = noise(rng);
    double const by = noise(rng);
    double const bz = noise(rng);
    result.effect.brownianVector = Vector3D{bx, by, bz};
  }

  result.effect.cellularInteraction =
    config_.cellularInteractionAmplitude * std::sin(current.sum());

  Vector3D const movement = dir * result.velocity +
                            result.effect.brownianVector +
                            dir * result.effect.cellularInteraction;
  result.position = current + movement;
  return result;
}

bool TrajectoryIntegrator::hasReached(const Coordinate& current,
                                      const Coordinate& target) const
{
  return current.distanceTo(target) < config_.arrivalThreshold;
}

double TrajectoryIntegrator::mechanismVelocity(DeliveryMechanism mechanism)
{
  switch (mechanism)
  {
    case DeliveryMechanism::PassiveDiffusion:
      return 0.05;
    case DeliveryMechanism::ActiveTransport:
      return 0.1;
    case DeliveryMechanism::GuidedPropulsion:
      return 0.15;
  }
  return 0.1;
}

double TrajectoryIntegrator::baseVelocity(DeliveryMechanism mechanism,
                                          double efficiency)
{
  return mechanismVelocity(mechanism) * efficiency;
}

Vector3D TrajectoryIntegrator::direction(const Coordinate& current,
                                         const Coordinate& target)
{
  return Vector3D{current.directionTo(target)};
}

std::string_view toString(TrajectoryIntegrator::State state)
{
  switch (state)
  {
    case TrajectoryIntegrator::State::Traveling:
      return "traveling";
    case TrajectoryIntegrator::State::Reached:
      return "reached";
    case TrajectoryIntegrator::State::Exhausted:
      return "exhausted";
  }
  return "traveling";
}

}  // namespace nbd_sim
