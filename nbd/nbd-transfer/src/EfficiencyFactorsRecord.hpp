// Ticket: 0001_efficiency_model

#ifndef NBD_TRANSFER_EFFICIENCY_FACTORS_RECORD_HPP
#define NBD_TRANSFER_EFFICIENCY_FACTORS_RECORD_HPP

#include <boost/describe.hpp>

namespace nbd_transfer
{

/**
 * @brief Flattened efficiency breakdown of a nanobot design
 *
 * Every factor that feeds the overall efficiency is kept as its own field
 * so efficiency charts and protocol text can show each contribution.
 *
 * Payload factors:
 * - payload_weight: Relative cargo mass penalty [0, 1]
 * - payload_stability: Cargo stability during transit [0, 1]
 * - payload_diffusion: Cargo diffusion coefficient factor [0, 1]
 *
 * Environmental factors are the fixed resistance constants of the carrier
 * medium; environmental_efficiency is their mean.
 *
 * @see nbd_sim::EfficiencyModel
 * @ticket 0001_efficiency_model
 */
struct EfficiencyFactorsRecord
{
  double overall_efficiency{0.0};
  double base_efficiency{0.0};
  double size_factor{0.0};
  double payload_weight{0.0};
  double payload_stability{0.0};
  double payload_diffusion{0.0};
  double payload_efficiency{0.0};
  double ph_sensitivity{0.0};
  double temperature_stability{0.0};
  double cellular_barriers{0.0};
  double degradation_resistance{0.0};
  double environmental_efficiency{0.0};
};

BOOST_DESCRIBE_STRUCT(EfficiencyFactorsRecord,
                      (),
                      (overall_efficiency,
                       base_efficiency,
                       size_factor,
                       payload_weight,
                       payload_stability,
                       payload_diffusion,
                       payload_efficiency,
                       ph_sensitivity,
                       temperature_stability,
                       cellular_barriers,
                       degradation_resistance,
                       environmental_efficiency));

}  // namespace nbd_transfer

#endif  // NBD_TRANSFER_EFFICIENCY_FACTORS_RECORD_HPP
