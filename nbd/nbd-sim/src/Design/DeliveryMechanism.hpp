// Ticket: 0001_efficiency_model

#ifndef NBD_SIM_DESIGN_DELIVERY_MECHANISM_HPP
#define NBD_SIM_DESIGN_DELIVERY_MECHANISM_HPP

#include <cstdint>
#include <string_view>

namespace nbd_sim
{

/**
 * @brief Transport strategy of a nanobot, assigned by vehicle size
 */
enum class DeliveryMechanism : uint8_t
{
  PassiveDiffusion,
  ActiveTransport,
  GuidedPropulsion
};

/**
 * @brief Canonical text name ("passive_diffusion", "active_transport",
 * "guided_propulsion")
 */
std::string_view toString(DeliveryMechanism mechanism);

/**
 * @brief Size-threshold mechanism selection
 *
 * Thresholds partition the size axis into half-open intervals:
 *   size < 10 nm        -> PassiveDiffusion
 *   10 nm <= size < 50  -> ActiveTransport
 *   size >= 50 nm       -> GuidedPropulsion
 *
 * Total over the reals; size validation is the efficiency model's job.
 */
class MechanismSelector
{
public:
  static constexpr double kActiveTransportMinSize = 10.0;   // [nm]
  static constexpr double kGuidedPropulsionMinSize = 50.0;  // [nm]

  static DeliveryMechanism select(double size);
};

}  // namespace nbd_sim

#endif  // NBD_SIM_DESIGN_DELIVERY_MECHANISM_HPP
