// Ticket: 0005_delivery_simulation

#ifndef NBD_SIM_NANOBOT_DESIGNER_HPP
#define NBD_SIM_NANOBOT_DESIGNER_HPP

#include <cstdint>
#include <string_view>

#include "nbd-sim/src/DataTypes/Coordinate.hpp"
#include "nbd-sim/src/Delivery/DeliverySimulationResult.hpp"
#include "nbd-sim/src/Delivery/TrajectoryIntegrator.hpp"
#include "nbd-sim/src/Design/NanobotConfig.hpp"
#include "nbd-sim/src/Design/PayloadType.hpp"

namespace nbd_sim
{

/**
 * @brief Top-level entry point of the design-and-delivery engine
 *
 * Designs nanobots from (size, payload) and simulates their delivery from
 * the origin to a target position. Each call is self-contained: the designer
 * holds only its integrator configuration, so one instance may serve
 * concurrent callers as long as each passes its own RandomEngine.
 */
class NanobotDesigner
{
public:
  NanobotDesigner();

  /**
   * @brief Construct with custom integration parameters
   * @throws InvalidParameter if the configuration is invalid
   */
  explicit NanobotDesigner(const TrajectoryIntegrator::Config& config);

  /**
   * @brief Design a nanobot
   * @param size Nanobot diameter [nm]
   * @param payload Cargo category
   * @throws InvalidParameter if size <= 0
   */
  NanobotConfig designNanobot(double size, PayloadType payload) const;

  /**
   * @brief Design a nanobot from a payload name
   *
   * Unrecognized names are designed as mRNA carriers.
   *
   * @throws InvalidParameter if size <= 0
   */
  NanobotConfig designNanobot(double size, std::string_view payloadName) const;

  /**
   * @brief Simulate delivery from the origin to @p target
   *
   * @param nanobot Design to simulate (non-owning, must not be null)
   * @param target Target position
   * @param rng Random source for the Brownian term
   * @return Path, analytics and success rate
   * @throws InvalidParameter if nanobot is null or target is not finite
   */
  DeliverySimulationResult simulateDelivery(const NanobotConfig* nanobot,
                                            const Coordinate& target,
                                            RandomEngine& rng) const;

  /**
   * @brief Simulate delivery with a freshly seeded random source
   * @throws InvalidParameter if nanobot is null or target is not finite
   */
  DeliverySimulationResult simulateDelivery(const NanobotConfig* nanobot,
                                            const Coordinate& target,
                                            uint32_t seed) const;

  const TrajectoryIntegrator& getIntegrator() const
  {
    return integrator_;
  }

private:
  TrajectoryIntegrator integrator_;
};

}  // namespace nbd_sim

#endif  // NBD_SIM_NANOBOT_DESIGNER_HPP
