// Ticket: 0005_delivery_simulation

#include "nbd-sim/src/Delivery/DeliverySimulationResult.hpp"

#include <cstdint>

namespace nbd_sim
{

std::vector<double> DeliverySimulationResult::velocities() const
{
  std::vector<double> result;
  result.reserve(stepRecords.size());
  for (const auto& step : stepRecords)
  {
    result.push_back(step.velocity);
  }
  return result;
}

std::vector<EnvironmentalEffect>
DeliverySimulationResult::environmentalEffects() const
{
  std::vector<EnvironmentalEffect> result;
  result.reserve(stepRecords.size());
  for (const auto& step : stepRecords)
  {
    result.push_back(step.effect);
  }
  return result;
}

double DeliverySimulationResult::finalDistance(const Coordinate& target) const
{
  if (path.empty())
  {
    return target.norm();
  }
  return path.back().distanceTo(target);
}

nbd_transfer::DeliverySummaryRecord DeliverySimulationResult::toRecord() const
{
  nbd_transfer::DeliverySummaryRecord record{};
  record.path.reserve(path.size());
  for (const auto& point : path)
  {
    record.path.push_back(point.toRecord());
  }
  record.steps = static_cast<uint32_t>(steps);
  record.success_rate = successRate;
  record.target_reached = targetReached ? 1U : 0U;
  record.trajectory_analysis = trajectoryAnalysis.toRecord();

  record.step_records.reserve(stepRecords.size());
  for (std::size_t i = 0; i < stepRecords.size(); ++i)
  {
    record.step_records.push_back(
      stepRecords[i].toRecord(static_cast<uint32_t>(i)));
  }
  return record;
}

}  // namespace nbd_sim
