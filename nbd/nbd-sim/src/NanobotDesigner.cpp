// Ticket: 0005_delivery_simulation

#include "nbd-sim/src/NanobotDesigner.hpp"

#include <utility>

#include <spdlog/spdlog.h>

#include "nbd-sim/src/Delivery/SuccessScorer.hpp"
#include "nbd-sim/src/Delivery/TrajectoryAnalyzer.hpp"
#include "nbd-sim/src/Utils/InvalidParameter.hpp"

namespace nbd_sim
{

NanobotDesigner::NanobotDesigner()
  : integrator_{}
{
}

NanobotDesigner::NanobotDesigner(const TrajectoryIntegrator::Config& config)
  : integrator_{config}
{
}

NanobotConfig NanobotDesigner::designNanobot(double size,
                                             PayloadType payload) const
{
  NanobotConfig config{size, payload};
  spdlog::debug("Designed {} nm {} nanobot: mechanism={}, efficiency={:.4f}",
                size,
                toString(payload),
                toString(config.getMechanism()),
                config.getEfficiency());
  return config;
}

NanobotConfig NanobotDesigner::designNanobot(double size,
                                             std::string_view payloadName) const
{
  return designNanobot(size, parsePayloadType(payloadName));
}

DeliverySimulationResult NanobotDesigner::simulateDelivery(
  const NanobotConfig* nanobot,
  const Coordinate& target,
  RandomEngine& rng) const
{
  if (nanobot == nullptr)
  {
    throw InvalidParameter{"Invalid nanobot configuration"};
  }

  Coordinate const origin{0.0, 0.0, 0.0};
  TrajectoryIntegrator::Result trajectory =
    integrator_.run(origin, target, *nanobot, rng);

  DeliverySimulationResult result{};
  result.steps = trajectory.steps.size();
  result.targetReached = trajectory.targetReached();
  result.successRate = SuccessScorer::score(trajectory.path, target);
  result.trajectoryAnalysis =
    TrajectoryAnalyzer::analyze(trajectory.path, trajectory.steps);
  result.path = std::move(trajectory.path);
  result.stepRecords = std::move(trajectory.steps);

  if (!result.targetReached)
  {
    spdlog::debug("Delivery to {:.3f} not reached after {} steps (distance "
                  "{:.4f})",
                  target,
                  result.steps,
                  result.finalDistance(target));
  }
  spdlog::debug("Delivery finished: steps={}, reached={}, successRate={:.4f}",
                result.steps,
                result.targetReached,
                result.successRate);
  return result;
}

DeliverySimulationResult NanobotDesigner::simulateDelivery(
  const NanobotConfig* nanobot,
  const Coordinate& target,
  uint32_t seed) const
{
  RandomEngine rng{seed};
  return simulateDelivery(nanobot, target, rng);
}

}  // namespace nbd_sim
