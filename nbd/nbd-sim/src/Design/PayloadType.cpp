// Ticket: 0001_efficiency_model

#include "nbd-sim/src/Design/PayloadType.hpp"

#include <spdlog/spdlog.h>

namespace nbd_sim
{

std::string_view toString(PayloadType payload)
{
  switch (payload)
  {
    case PayloadType::SmallMolecules:
      return "small_molecules";
    case PayloadType::MRNA:
      return "mRNA";
    case PayloadType::Proteins:
      return "proteins";
    case PayloadType::Plasmids:
      return "plasmids";
  }
  return "mRNA";
}

PayloadType parsePayloadType(std::string_view name)
{
  for (PayloadType const candidate : {PayloadType::SmallMolecules,
                                      PayloadType::MRNA,
                                      PayloadType::Proteins,
                                      PayloadType::Plasmids})
  {
    if (name == toString(candidate))
    {
      return candidate;
    }
  }

  spdlog::warn("Unrecognized payload type '{}', defaulting to mRNA", name);
  return PayloadType::MRNA;
}

}  // namespace nbd_sim
