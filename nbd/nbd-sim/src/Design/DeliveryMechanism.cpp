// Ticket: 0001_efficiency_model

#include "nbd-sim/src/Design/DeliveryMechanism.hpp"

namespace nbd_sim
{

std::string_view toString(DeliveryMechanism mechanism)
{
  switch (mechanism)
  {
    case DeliveryMechanism::PassiveDiffusion:
      return "passive_diffusion";
    case DeliveryMechanism::ActiveTransport:
      return "active_transport";
    case DeliveryMechanism::GuidedPropulsion:
      return "guided_propulsion";
  }
  return "active_transport";
}

DeliveryMechanism MechanismSelector::select(double size)
{
  if (size < kActiveTransportMinSize)
  {
    return DeliveryMechanism::PassiveDiffusion;
  }
  if (size < kGuidedPropulsionMinSize)
  {
    return DeliveryMechanism::ActiveTransport;
  }
  return DeliveryMechanism::GuidedPropulsion;
}

}  // namespace nbd_sim
