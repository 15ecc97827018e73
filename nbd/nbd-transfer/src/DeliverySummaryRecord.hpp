// Ticket: 0005_delivery_simulation

#ifndef NBD_TRANSFER_DELIVERY_SUMMARY_RECORD_HPP
#define NBD_TRANSFER_DELIVERY_SUMMARY_RECORD_HPP

#include <cstdint>
#include <vector>

#include <boost/describe.hpp>

#include "nbd-transfer/src/CoordinateRecord.hpp"
#include "nbd-transfer/src/TrajectoryAnalysisRecord.hpp"
#include "nbd-transfer/src/TrajectoryStepRecord.hpp"

namespace nbd_transfer
{

/**
 * @brief Complete outcome of one delivery simulation
 *
 * path holds every position including the start point, so
 * path.size() == steps + 1. step_records holds one entry per step.
 *
 * @see nbd_sim::DeliverySimulationResult
 * @ticket 0005_delivery_simulation
 */
struct DeliverySummaryRecord
{
  std::vector<CoordinateRecord> path;
  uint32_t steps{0};
  double success_rate{0.0};
  uint32_t target_reached{0};  // 0 or 1
  TrajectoryAnalysisRecord trajectory_analysis;
  std::vector<TrajectoryStepRecord> step_records;
};

BOOST_DESCRIBE_STRUCT(DeliverySummaryRecord,
                      (),
                      (path,
                       steps,
                       success_rate,
                       target_reached,
                       trajectory_analysis,
                       step_records));

}  // namespace nbd_transfer

#endif  // NBD_TRANSFER_DELIVERY_SUMMARY_RECORD_HPP
