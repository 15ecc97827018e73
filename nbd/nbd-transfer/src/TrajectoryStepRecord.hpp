// Ticket: 0003_trajectory_integrator

#ifndef NBD_TRANSFER_TRAJECTORY_STEP_RECORD_HPP
#define NBD_TRANSFER_TRAJECTORY_STEP_RECORD_HPP

#include <cstdint>

#include <boost/describe.hpp>

#include "nbd-transfer/src/CoordinateRecord.hpp"
#include "nbd-transfer/src/Vector3DRecord.hpp"

namespace nbd_transfer
{

/**
 * @brief One integrator iteration: resulting position, scalar speed and the
 * environmental perturbation applied during the step
 *
 * @see nbd_sim::TrajectoryStep
 * @ticket 0003_trajectory_integrator
 */
struct TrajectoryStepRecord
{
  uint32_t step_index{0};
  CoordinateRecord position;
  double velocity{0.0};
  Vector3DRecord brownian_vector;
  double fluid_resistance{0.0};
  double cellular_interaction{0.0};
};

BOOST_DESCRIBE_STRUCT(TrajectoryStepRecord,
                      (),
                      (step_index,
                       position,
                       velocity,
                       brownian_vector,
                       fluid_resistance,
                       cellular_interaction));

}  // namespace nbd_transfer

#endif  // NBD_TRANSFER_TRAJECTORY_STEP_RECORD_HPP
