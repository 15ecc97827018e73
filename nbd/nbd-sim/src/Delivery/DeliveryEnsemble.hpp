// Ticket: 0006_delivery_ensemble

#ifndef NBD_SIM_DELIVERY_DELIVERY_ENSEMBLE_HPP
#define NBD_SIM_DELIVERY_DELIVERY_ENSEMBLE_HPP

#include <cstddef>
#include <cstdint>
#include <memory>
#include <span>
#include <vector>

#include <spdlog/spdlog.h>

#include "nbd-sim/src/DataTypes/Coordinate.hpp"
#include "nbd-sim/src/Design/DeliveryMechanism.hpp"
#include "nbd-sim/src/Design/PayloadType.hpp"
#include "nbd-sim/src/NanobotDesigner.hpp"
#include "nbd-transfer/src/EnsembleSummaryRecord.hpp"

namespace nbd_sim
{

/**
 * @brief Monte Carlo evaluation of a nanobot design under repeated noise
 *
 * Runs independent delivery simulations of the same design, trial i seeded
 * with baseSeed + i, and summarizes the outcomes. Trials may be spread over
 * worker threads; each trial owns its RandomEngine and writes only its own
 * output slot, so the summary does not depend on the thread count.
 *
 * @ticket 0006_delivery_ensemble
 */
class DeliveryEnsemble
{
public:
  struct Config
  {
    std::size_t trials{100};   // Number of simulations per design
    uint32_t baseSeed{0};      // Seed of trial 0
    std::size_t threads{1};    // Worker threads (0 = hardware concurrency)
  };

  /**
   * @brief Order statistics of a sample
   */
  struct Statistics
  {
    double mean{0.0};
    double stdDev{0.0};  // Population standard deviation
    double min{0.0};
    double max{0.0};
    double median{0.0};

    static Statistics summarize(std::span<const double> values);
  };

  struct Summary
  {
    double size{0.0};  // Nanobot diameter of the evaluated design [nm]
    std::size_t trials{0};
    double reachedFraction{0.0};
    Statistics successRate{};
    double meanSteps{0.0};
    double meanPathLinearity{0.0};

    [[nodiscard]] nbd_transfer::EnsembleSummaryRecord toRecord() const;
  };

  /**
   * @brief One point of a size sweep
   */
  struct SweepPoint
  {
    double size{0.0};
    DeliveryMechanism mechanism{DeliveryMechanism::ActiveTransport};
    double efficiency{0.0};
    Summary summary{};
  };

  /**
   * @param designer Designer used for every trial (copied)
   * @param config Trial count, seed and threading
   * @param logger Logger for progress output, defaults to the spdlog default
   * logger
   * @throws InvalidParameter if config.trials == 0
   */
  DeliveryEnsemble(NanobotDesigner designer,
                   const Config& config,
                   std::shared_ptr<spdlog::logger> logger = nullptr);

  /**
   * @brief Run all trials for one design
   * @param nanobot Design to evaluate
   * @param target Target position
   */
  Summary run(const NanobotConfig& nanobot, const Coordinate& target) const;

  /**
   * @brief Design one nanobot per size and run the ensemble for each
   *
   * @param sizes Nanobot diameters [nm], all positive
   * @param payload Cargo category shared by every design
   * @param target Target position
   * @return One point per size, in input order
   * @throws InvalidParameter if any size <= 0
   */
  std::vector<SweepPoint> sweepSizes(std::span<const double> sizes,
                                     PayloadType payload,
                                     const Coordinate& target) const;

  const Config& getConfig() const
  {
    return config_;
  }

private:
  struct TrialOutcome
  {
    bool reached{false};
    double successRate{0.0};
    std::size_t steps{0};
    double pathLinearity{1.0};
  };

  TrialOutcome runTrial(const NanobotConfig& nanobot,
                        const Coordinate& target,
                        std::size_t trialIndex) const;

  std::size_t workerCount() const;

  NanobotDesigner designer_;
  Config config_;
  std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace nbd_sim

#endif  // NBD_SIM_DELIVERY_DELIVERY_ENSEMBLE_HPP
