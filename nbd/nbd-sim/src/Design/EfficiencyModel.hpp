// Ticket: 0001_efficiency_model

#ifndef NBD_SIM_DESIGN_EFFICIENCY_MODEL_HPP
#define NBD_SIM_DESIGN_EFFICIENCY_MODEL_HPP

#include <span>
#include <vector>

#include "nbd-sim/src/Design/PayloadType.hpp"
#include "nbd-transfer/src/EfficiencyFactorsRecord.hpp"

namespace nbd_sim
{

/**
 * @brief Delivery efficiency of a nanobot design
 *
 * The overall efficiency is a product of independent factors:
 *
 *   sizeFactor        = exp(-(size - 30)^2 / 800)
 *   payloadEfficiency = (1 - weight) * stability * diffusion
 *   envEfficiency     = mean(pH, temperature, barriers, degradation)
 *   overall           = 0.9 * sizeFactor * payloadEfficiency * envEfficiency
 *
 * The size factor is a Gaussian centered at 30 nm: mid-sized vehicles
 * balance diffusion speed against payload capacity. Every factor lies in
 * [0, 1], so overall efficiency lies in [0, 0.9].
 *
 * All methods are pure and thread-safe.
 *
 * @ticket 0001_efficiency_model
 */
class EfficiencyModel
{
public:
  static constexpr double kBaseEfficiency = 0.9;
  static constexpr double kOptimalSize = 30.0;    // [nm]
  static constexpr double kSizeSpread = 800.0;    // 2 * sigma^2 [nm^2]

  /**
   * @brief Per-payload factors
   */
  struct PayloadFactors
  {
    double weight{0.0};     // Relative cargo mass penalty
    double stability{0.0};  // Stability during transit
    double diffusion{0.0};  // Diffusion factor

    /**
     * @return (1 - weight) * stability * diffusion
     */
    [[nodiscard]] double efficiency() const
    {
      return (1.0 - weight) * stability * diffusion;
    }
  };

  /**
   * @brief Fixed resistance constants of the carrier medium
   */
  struct EnvironmentalFactors
  {
    double phSensitivity{0.95};
    double temperatureStability{0.9};
    double cellularBarriers{0.85};
    double degradationResistance{0.88};

    /**
     * @return Arithmetic mean of the four constants
     */
    [[nodiscard]] double efficiency() const
    {
      return (phSensitivity + temperatureStability + cellularBarriers +
              degradationResistance) /
             4.0;
    }
  };

  /**
   * @brief Factor breakdown retained for reporting
   */
  struct Factors
  {
    double baseEfficiency{kBaseEfficiency};
    double sizeFactor{0.0};
    PayloadFactors payloadFactors{};
    EnvironmentalFactors environmentalFactors{};
  };

  /**
   * @brief Overall efficiency together with its breakdown
   */
  struct Result
  {
    double overallEfficiency{0.0};
    Factors factors{};

    [[nodiscard]] nbd_transfer::EfficiencyFactorsRecord toRecord() const;
  };

  /**
   * @brief Compute the efficiency of a design
   *
   * @param size Nanobot diameter [nm]
   * @param payload Cargo category
   * @return Overall efficiency and factor breakdown
   * @throws InvalidParameter if size <= 0 (or NaN)
   */
  static Result compute(double size, PayloadType payload);

  /**
   * @brief Evaluate compute() over a range of sizes for a fixed payload
   *
   * @param sizes Nanobot diameters [nm], all positive
   * @param payload Cargo category
   * @return One result per size, in input order
   * @throws InvalidParameter if any size <= 0
   */
  static std::vector<Result> curve(std::span<const double> sizes,
                                   PayloadType payload);

  /**
   * @brief Gaussian size factor centered at kOptimalSize
   */
  static double sizeFactor(double size);

  /**
   * @brief Table lookup of the factors for a payload category
   */
  static PayloadFactors payloadFactors(PayloadType payload);
};

}  // namespace nbd_sim

#endif  // NBD_SIM_DESIGN_EFFICIENCY_MODEL_HPP
