// Ticket: 0004_trajectory_analysis

#ifndef NBD_TRANSFER_TRAJECTORY_ANALYSIS_RECORD_HPP
#define NBD_TRANSFER_TRAJECTORY_ANALYSIS_RECORD_HPP

#include <boost/describe.hpp>

#include "nbd-transfer/src/EnvironmentalImpactRecord.hpp"

namespace nbd_transfer
{

/**
 * @brief Aggregate statistics of a delivery trajectory
 *
 * @see nbd_sim::TrajectoryAnalyzer
 * @ticket 0004_trajectory_analysis
 */
struct TrajectoryAnalysisRecord
{
  double total_distance{0.0};
  double average_velocity{0.0};
  double velocity_variance{0.0};
  double path_linearity{1.0};
  EnvironmentalImpactRecord environmental_impact;
};

BOOST_DESCRIBE_STRUCT(TrajectoryAnalysisRecord,
                      (),
                      (total_distance,
                       average_velocity,
                       velocity_variance,
                       path_linearity,
                       environmental_impact));

}  // namespace nbd_transfer

#endif  // NBD_TRANSFER_TRAJECTORY_ANALYSIS_RECORD_HPP
