// Ticket: 0002_design_specs

#ifndef NBD_SIM_DESIGN_NANOBOT_CONFIG_HPP
#define NBD_SIM_DESIGN_NANOBOT_CONFIG_HPP

#include "nbd-sim/src/Design/DeliveryMechanism.hpp"
#include "nbd-sim/src/Design/DesignSpecs.hpp"
#include "nbd-sim/src/Design/EfficiencyModel.hpp"
#include "nbd-sim/src/Design/PayloadType.hpp"
#include "nbd-transfer/src/DesignSpecsRecord.hpp"
#include "nbd-transfer/src/EfficiencyFactorsRecord.hpp"

namespace nbd_sim
{

/**
 * @brief Immutable nanobot design
 *
 * Built once per design request from (size, payload). Construction runs the
 * efficiency model, selects the delivery mechanism and derives the design
 * specification; no member changes afterwards.
 *
 * @ticket 0002_design_specs
 */
class NanobotConfig
{
public:
  /**
   * @brief Design a nanobot
   * @param size Nanobot diameter [nm]
   * @param payload Cargo category
   * @throws InvalidParameter if size <= 0
   */
  NanobotConfig(double size, PayloadType payload);

  double getSize() const
  {
    return size_;
  }

  PayloadType getPayload() const
  {
    return payload_;
  }

  /// Overall efficiency in [0, 0.9]
  double getEfficiency() const
  {
    return efficiency_.overallEfficiency;
  }

  const EfficiencyModel::Factors& getEfficiencyFactors() const
  {
    return efficiency_.factors;
  }

  DeliveryMechanism getMechanism() const
  {
    return mechanism_;
  }

  const DesignSpecs& getDesignSpecs() const
  {
    return designSpecs_;
  }

  [[nodiscard]] nbd_transfer::EfficiencyFactorsRecord toEfficiencyRecord()
    const;

  [[nodiscard]] nbd_transfer::DesignSpecsRecord toDesignSpecsRecord() const;

  NanobotConfig(const NanobotConfig&) = default;
  NanobotConfig& operator=(const NanobotConfig&) = default;
  NanobotConfig(NanobotConfig&&) noexcept = default;
  NanobotConfig& operator=(NanobotConfig&&) noexcept = default;
  ~NanobotConfig() = default;

private:
  double size_;
  PayloadType payload_;
  EfficiencyModel::Result efficiency_;
  DeliveryMechanism mechanism_;
  DesignSpecs designSpecs_;
};

}  // namespace nbd_sim

#endif  // NBD_SIM_DESIGN_NANOBOT_CONFIG_HPP
