// Ticket: 0004_trajectory_analysis

#ifndef NBD_TRANSFER_ENVIRONMENTAL_IMPACT_RECORD_HPP
#define NBD_TRANSFER_ENVIRONMENTAL_IMPACT_RECORD_HPP

#include <boost/describe.hpp>

namespace nbd_transfer
{

/**
 * @brief Mean environmental perturbation over a trajectory
 *
 * - brownian_intensity: Mean norm of the per-step Brownian displacement
 * - resistance_impact: Mean fluid resistance term (non-positive)
 * - cellular_interaction_strength: Mean cellular interaction term
 */
struct EnvironmentalImpactRecord
{
  double brownian_intensity{0.0};
  double resistance_impact{0.0};
  double cellular_interaction_strength{0.0};
};

BOOST_DESCRIBE_STRUCT(EnvironmentalImpactRecord,
                      (),
                      (brownian_intensity,
                       resistance_impact,
                       cellular_interaction_strength));

}  // namespace nbd_transfer

#endif  // NBD_TRANSFER_ENVIRONMENTAL_IMPACT_RECORD_HPP
