// Ticket: 0005_delivery_simulation

#ifndef NBD_SIM_DELIVERY_DELIVERY_SIMULATION_RESULT_HPP
#define NBD_SIM_DELIVERY_DELIVERY_SIMULATION_RESULT_HPP

#include <cstddef>
#include <vector>

#include "nbd-sim/src/DataTypes/Coordinate.hpp"
#include "nbd-sim/src/Delivery/TrajectoryAnalyzer.hpp"
#include "nbd-sim/src/Delivery/TrajectoryStep.hpp"
#include "nbd-transfer/src/DeliverySummaryRecord.hpp"

namespace nbd_sim
{

/**
 * @brief Outcome of one delivery simulation
 *
 * path always contains the start point. steps counts integrator iterations,
 * so path.size() == steps + 1 and steps <= the integrator's step cap.
 * stepRecords holds the per-step velocity and environmental effect.
 *
 * @ticket 0005_delivery_simulation
 */
struct DeliverySimulationResult
{
  std::vector<Coordinate> path;
  std::size_t steps{0};
  double successRate{0.0};
  TrajectoryAnalyzer::Analysis trajectoryAnalysis{};
  bool targetReached{false};
  std::vector<TrajectoryStep> stepRecords;

  /// Drift speed of every step, in order
  [[nodiscard]] std::vector<double> velocities() const;

  /// Environmental effect of every step, in order
  [[nodiscard]] std::vector<EnvironmentalEffect> environmentalEffects() const;

  /// Distance from the last path point to @p target
  [[nodiscard]] double finalDistance(const Coordinate& target) const;

  [[nodiscard]] nbd_transfer::DeliverySummaryRecord toRecord() const;
};

}  // namespace nbd_sim

#endif  // NBD_SIM_DELIVERY_DELIVERY_SIMULATION_RESULT_HPP
