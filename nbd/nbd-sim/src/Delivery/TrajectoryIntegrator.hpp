// Ticket: 0003_trajectory_integrator

#ifndef NBD_SIM_DELIVERY_TRAJECTORY_INTEGRATOR_HPP
#define NBD_SIM_DELIVERY_TRAJECTORY_INTEGRATOR_HPP

#include <cstddef>
#include <cstdint>
#include <random>
#include <string_view>
#include <vector>

#include "nbd-sim/src/DataTypes/Coordinate.hpp"
#include "nbd-sim/src/Delivery/TrajectoryStep.hpp"
#include "nbd-sim/src/Design/DeliveryMechanism.hpp"

namespace nbd_sim
{

class NanobotConfig;

/// Random source used by the integrator. Injected by the caller so that a
/// fixed seed reproduces a trajectory bit-for-bit.
using RandomEngine = std::mt19937;

/**
 * @brief Stochastic step-wise integrator moving a nanobot toward a target
 *
 * Per-step update:
 * 1. direction  = normalize(target - current), zero vector when coincident
 * 2. resistance = -c_fluid * v_base
 * 3. velocity   = v_base + resistance
 * 4. brownian   = three independent draws from Normal(0, sigma)
 * 5. cellular   = A * sin(x + y + z) of the current position
 * 6. movement   = direction * velocity + brownian + cellular * direction
 * 7. current   += movement
 *
 * where v_base = mechanismVelocity(mechanism) * efficiency.
 *
 * State machine: Traveling -> Reached when the distance to the target drops
 * below arrivalThreshold, Traveling -> Exhausted when maxSteps steps have
 * been taken. The step cap is enforced unconditionally: the Brownian term can
 * keep the distance above the threshold forever.
 *
 * The integrator itself is stateless between runs and may be shared across
 * threads as long as each thread uses its own RandomEngine.
 *
 * @ticket 0003_trajectory_integrator
 */
class TrajectoryIntegrator
{
public:
  enum class State : uint8_t
  {
    Traveling,
    Reached,
    Exhausted
  };

  /// Largest step cap a Config may request
  static constexpr std::size_t kStepCap = 1000;

  /**
   * @brief Integration parameters
   */
  struct Config
  {
    std::size_t maxSteps{kStepCap};           ///< Step cap, 1..kStepCap
    double arrivalThreshold{1e-3};            ///< Distance counted as reached
    double brownianStdDev{0.01};              ///< Per-axis Brownian sigma
    double fluidResistanceCoefficient{0.05};  ///< Fraction of speed lost
    double cellularInteractionAmplitude{0.02};
  };

  /**
   * @brief Path and per-step records of one run
   *
   * path.front() is the start point; path.size() == steps.size() + 1.
   */
  struct Result
  {
    std::vector<Coordinate> path;
    std::vector<TrajectoryStep> steps;
    State state{State::Traveling};

    [[nodiscard]] bool targetReached() const
    {
      return state == State::Reached;
    }
  };

  TrajectoryIntegrator();

  /**
   * @throws InvalidParameter if a Config value is outside its domain:
   * maxSteps outside [1, kStepCap], non-positive arrival threshold, negative
   * or non-finite Brownian sigma, non-finite coefficients
   */
  explicit TrajectoryIntegrator(const Config& config);

  /**
   * @brief Integrate from start until the target is reached or the step cap
   * is hit
   *
   * @param start Initial position
   * @param target Target position
   * @param nanobot Design supplying mechanism and efficiency
   * @param rng Random source for the Brownian term
   * @return Path, step records and terminal state
   * @throws InvalidParameter if start or target has a non-finite component
   */
  Result run(const Coordinate& start,
             const Coordinate& target,
             const NanobotConfig& nanobot,
             RandomEngine& rng) const;

  /**
   * @brief Compute a single step from the current position
   *
   * Does not check arrival; run() does that after applying the step.
   *
   * @param current Position before the step
   * @param target Target position
   * @param baseVelocity Mechanism velocity scaled by efficiency
   * @param rng Random source for the Brownian term
   * @return Step record holding the new position
   */
  TrajectoryStep step(const Coordinate& current,
                      const Coordinate& target,
                      double baseVelocity,
                      RandomEngine& rng) const;

  [[nodiscard]] bool hasReached(const Coordinate& current,
                                const Coordinate& target) const;

  const Config& getConfig() const
  {
    return config_;
  }

  /// Unscaled drift speed of a delivery mechanism
  static double mechanismVelocity(DeliveryMechanism mechanism);

  /// mechanismVelocity(mechanism) * efficiency
  static double baseVelocity(DeliveryMechanism mechanism, double efficiency);

  /// Unit vector from current toward target, zero when they coincide
  static Vector3D direction(const Coordinate& current,
                            const Coordinate& target);

  TrajectoryIntegrator(const TrajectoryIntegrator&) = default;
  TrajectoryIntegrator& operator=(const TrajectoryIntegrator&) = default;
  TrajectoryIntegrator(TrajectoryIntegrator&&) noexcept = default;
  TrajectoryIntegrator& operator=(TrajectoryIntegrator&&) noexcept = default;
  ~TrajectoryIntegrator() = default;

private:
  Config config_;
};

std::string_view toString(TrajectoryIntegrator::State state);

}  // namespace nbd_sim

#endif  // NBD_SIM_DELIVERY_TRAJECTORY_INTEGRATOR_HPP
