// Ticket: 0002_design_specs

#include "nbd-sim/src/Design/NanobotConfig.hpp"

#include <string>

namespace nbd_sim
{

NanobotConfig::NanobotConfig(double size, PayloadType payload)
  : size_{size},
    payload_{payload},
    efficiency_{EfficiencyModel::compute(size, payload)},
    mechanism_{MechanismSelector::select(size)},
    designSpecs_{DesignSpecs::generate(size, payload)}
{
}

nbd_transfer::EfficiencyFactorsRecord NanobotConfig::toEfficiencyRecord() const
{
  return efficiency_.toRecord();
}

nbd_transfer::DesignSpecsRecord NanobotConfig::toDesignSpecsRecord() const
{
  nbd_transfer::DesignSpecsRecord record{};
  record.size_nm = size_;
  record.payload = std::string{toString(payload_)};
  record.delivery_mechanism = std::string{toString(mechanism_)};
  record.efficiency = efficiency_.overallEfficiency;

  record.surface_charge =
    std::string{toString(designSpecs_.surfaceChemistry.charge)};
  record.hydrophobicity =
    std::string{toString(designSpecs_.surfaceChemistry.hydrophobicity)};

  record.coating_material = designSpecs_.coating.material;
  record.coating_thickness_nm = designSpecs_.coating.thicknessNm;
  record.coating_degradation_rate = designSpecs_.coating.degradationRate;

  record.temperature_min_c = designSpecs_.stability.temperatureMinC;
  record.temperature_max_c = designSpecs_.stability.temperatureMaxC;
  record.ph_min = designSpecs_.stability.phMin;
  record.ph_max = designSpecs_.stability.phMax;
  record.shelf_life_days = designSpecs_.stability.shelfLifeDays;
  record.zeta_potential_mv = designSpecs_.stability.zetaPotentialMv;

  record.manufacturing_steps = designSpecs_.manufacturingSteps;
  return record;
}

}  // namespace nbd_sim
