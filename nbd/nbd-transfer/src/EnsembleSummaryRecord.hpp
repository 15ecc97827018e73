// Ticket: 0006_delivery_ensemble

#ifndef NBD_TRANSFER_ENSEMBLE_SUMMARY_RECORD_HPP
#define NBD_TRANSFER_ENSEMBLE_SUMMARY_RECORD_HPP

#include <cstdint>

#include <boost/describe.hpp>

namespace nbd_transfer
{

/**
 * @brief Monte Carlo summary over repeated delivery simulations of one design
 *
 * @see nbd_sim::DeliveryEnsemble
 * @ticket 0006_delivery_ensemble
 */
struct EnsembleSummaryRecord
{
  double size_nm{0.0};
  uint32_t trials{0};
  double reached_fraction{0.0};
  double success_rate_mean{0.0};
  double success_rate_std_dev{0.0};
  double success_rate_min{0.0};
  double success_rate_max{0.0};
  double success_rate_median{0.0};
  double mean_steps{0.0};
  double mean_path_linearity{0.0};
};

BOOST_DESCRIBE_STRUCT(EnsembleSummaryRecord,
                      (),
                      (size_nm,
                       trials,
                       reached_fraction,
                       success_rate_mean,
                       success_rate_std_dev,
                       success_rate_min,
                       success_rate_max,
                       success_rate_median,
                       mean_steps,
                       mean_path_linearity));

}  // namespace nbd_transfer

#endif  // NBD_TRANSFER_ENSEMBLE_SUMMARY_RECORD_HPP
