// Ticket: 0001_efficiency_model

#ifndef NBD_SIM_DESIGN_PAYLOAD_TYPE_HPP
#define NBD_SIM_DESIGN_PAYLOAD_TYPE_HPP

#include <cstdint>
#include <string_view>

namespace nbd_sim
{

/**
 * @brief Category of cargo carried by a nanobot
 *
 * Drives the payload factors of the efficiency model and the surface
 * chemistry of the design.
 */
enum class PayloadType : uint8_t
{
  SmallMolecules,
  MRNA,
  Proteins,
  Plasmids
};

/**
 * @brief Canonical text name ("small_molecules", "mRNA", "proteins",
 * "plasmids")
 */
std::string_view toString(PayloadType payload);

/**
 * @brief Parse a payload name
 *
 * Unrecognized names fall back to PayloadType::MRNA and emit a warning.
 *
 * @param name Canonical payload name (case-sensitive)
 * @return Parsed payload type
 */
PayloadType parsePayloadType(std::string_view name);

}  // namespace nbd_sim

#endif  // NBD_SIM_DESIGN_PAYLOAD_TYPE_HPP
