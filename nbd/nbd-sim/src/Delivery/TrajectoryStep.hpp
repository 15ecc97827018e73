// Ticket: 0003_trajectory_integrator

#ifndef NBD_SIM_DELIVERY_TRAJECTORY_STEP_HPP
#define NBD_SIM_DELIVERY_TRAJECTORY_STEP_HPP

#include <cstdint>

#include "nbd-sim/src/DataTypes/Coordinate.hpp"
#include "nbd-sim/src/DataTypes/Vector3D.hpp"
#include "nbd-transfer/src/TrajectoryStepRecord.hpp"

namespace nbd_sim
{

/**
 * @brief Environmental perturbation applied during one step
 */
struct EnvironmentalEffect
{
  Vector3D brownianVector{};       // Random thermal displacement
  double fluidResistance{0.0};     // Speed lost to drag (non-positive)
  double cellularInteraction{0.0}; // Signed pull along the target direction
};

/**
 * @brief One integrator iteration
 *
 * position is the location after the step was applied; velocity is the
 * scalar drift speed used for the step.
 */
struct TrajectoryStep
{
  Coordinate position{};
  double velocity{0.0};
  EnvironmentalEffect effect{};

  [[nodiscard]] nbd_transfer::TrajectoryStepRecord toRecord(
    uint32_t stepIndex) const
  {
    nbd_transfer::TrajectoryStepRecord record{};
    record.step_index = stepIndex;
    record.position = position.toRecord();
    record.velocity = velocity;
    record.brownian_vector = effect.brownianVector.toRecord();
    record.fluid_resistance = effect.fluidResistance;
    record.cellular_interaction = effect.cellularInteraction;
    return record;
  }
};

}  // namespace nbd_sim

#endif  // NBD_SIM_DELIVERY_TRAJECTORY_STEP_HPP
