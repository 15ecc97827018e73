// Ticket: 0002_design_specs

#ifndef NBD_TRANSFER_DESIGN_SPECS_RECORD_HPP
#define NBD_TRANSFER_DESIGN_SPECS_RECORD_HPP

#include <string>
#include <vector>

#include <boost/describe.hpp>

namespace nbd_transfer
{

/**
 * @brief Design and fabrication parameters consumed by the protocol generator
 *
 * Carries the design request (size, payload, mechanism) together with the
 * derived specifications so a lab protocol can be rendered from a single
 * record.
 *
 * @see nbd_sim::DesignSpecs
 * @ticket 0002_design_specs
 */
struct DesignSpecsRecord
{
  double size_nm{0.0};
  std::string payload;
  std::string delivery_mechanism;
  double efficiency{0.0};

  std::string surface_charge;
  std::string hydrophobicity;

  std::string coating_material;
  double coating_thickness_nm{0.0};
  std::string coating_degradation_rate;

  double temperature_min_c{0.0};
  double temperature_max_c{0.0};
  double ph_min{0.0};
  double ph_max{0.0};
  int shelf_life_days{0};
  double zeta_potential_mv{0.0};

  std::vector<std::string> manufacturing_steps;
};

BOOST_DESCRIBE_STRUCT(DesignSpecsRecord,
                      (),
                      (size_nm,
                       payload,
                       delivery_mechanism,
                       efficiency,
                       surface_charge,
                       hydrophobicity,
                       coating_material,
                       coating_thickness_nm,
                       coating_degradation_rate,
                       temperature_min_c,
                       temperature_max_c,
                       ph_min,
                       ph_max,
                       shelf_life_days,
                       zeta_potential_mv,
                       manufacturing_steps));

}  // namespace nbd_transfer

#endif  // NBD_TRANSFER_DESIGN_SPECS_RECORD_HPP
