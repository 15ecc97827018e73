// Ticket: 0006_delivery_ensemble

#include "nbd-sim/src/Delivery/DeliveryEnsemble.hpp"

#include <algorithm>
#include <cmath>
#include <exception>
#include <thread>
#include <utility>

#include "nbd-sim/src/Utils/InvalidParameter.hpp"

namespace nbd_sim
{

// ========== Statistics ==========

DeliveryEnsemble::Statistics DeliveryEnsemble::Statistics::summarize(
  std::span<const double> values)
{
  Statistics result{};
  if (values.empty())
  {
    return result;
  }

  std::vector<double> sorted{values.begin(), values.end()};
  std::sort(sorted.begin(), sorted.end());
  result.min = sorted.front();
  result.max = sorted.back();

  // Constant sample: exact mean, zero spread
  if (result.min == result.max)
  {
    result.mean = result.min;
    result.median = result.min;
    return result;
  }

  auto const n = static_cast<double>(values.size());
  double sum = 0.0;
  for (double const v : values)
  {
    sum += v;
  }
  result.mean = sum / n;

  double sumSq = 0.0;
  for (double const v : values)
  {
    double const d = v - result.mean;
    sumSq += d * d;
  }
  result.stdDev = std::sqrt(sumSq / n);

  std::size_t const mid = sorted.size() / 2;
  result.median = (sorted.size() % 2 == 0)
                    ? 0.5 * (sorted[mid - 1] + sorted[mid])
                    : sorted[mid];
  return result;
}

// ========== Summary ==========

nbd_transfer::EnsembleSummaryRecord DeliveryEnsemble::Summary::toRecord() const
{
  nbd_transfer::EnsembleSummaryRecord record{};
  record.size_nm = size;
  record.trials = static_cast<uint32_t>(trials);
  record.reached_fraction = reachedFraction;
  record.success_rate_mean = successRate.mean;
  record.success_rate_std_dev = successRate.stdDev;
  record.success_rate_min = successRate.min;
  record.success_rate_max = successRate.max;
  record.success_rate_median = successRate.median;
  record.mean_steps = meanSteps;
  record.mean_path_linearity = meanPathLinearity;
  return record;
}

// ========== DeliveryEnsemble ==========

DeliveryEnsemble::DeliveryEnsemble(NanobotDesigner designer,
                                   const Config& config,
                                   std::shared_ptr<spdlog::logger> logger)
  : designer_{std::move(designer)},
    config_{config},
    logger_{logger ? std::move(logger) : spdlog::default_logger()}
{
  if (config_.trials == 0)
  {
    throw InvalidParameter{"Ensemble requires at least one trial"};
  }
}

DeliveryEnsemble::Summary DeliveryEnsemble::run(const NanobotConfig& nanobot,
                                                const Coordinate& target) const
{
  std::vector<TrialOutcome> outcomes(config_.trials);
  std::size_t const workers = workerCount();

  logger_->debug("Running {} delivery trials for {} nm {} on {} worker(s)",
                 config_.trials,
                 nanobot.getSize(),
                 toString(nanobot.getPayload()),
                 workers);

  if (workers <= 1)
  {
    for (std::size_t i = 0; i < outcomes.size(); ++i)
    {
      outcomes[i] = runTrial(nanobot, target, i);
    }
  }
  else
  {
    std::vector<std::exception_ptr> errors(workers);
    {
      std::vector<std::jthread> pool;
      pool.reserve(workers);
      for (std::size_t w = 0; w < workers; ++w)
      {
        pool.emplace_back(
          [&, w]()
          {
            try
            {
              for (std::size_t i = w; i < outcomes.size(); i += workers)
              {
                outcomes[i] = runTrial(nanobot, target, i);
              }
            }
            catch (...)
            {
              errors[w] = std::current_exception();
            }
          });
      }
    }  // jthreads join here

    for (const auto& error : errors)
    {
      if (error)
      {
        std::rethrow_exception(error);
      }
    }
  }

  Summary summary{};
  summary.size = nanobot.getSize();
  summary.trials = outcomes.size();

  std::vector<double> successRates;
  successRates.reserve(outcomes.size());
  std::size_t reached = 0;
  double stepSum = 0.0;
  double linearitySum = 0.0;
  for (const auto& outcome : outcomes)
  {
    successRates.push_back(outcome.successRate);
    reached += outcome.reached ? 1U : 0U;
    stepSum += static_cast<double>(outcome.steps);
    linearitySum += outcome.pathLinearity;
  }

  auto const n = static_cast<double>(outcomes.size());
  summary.reachedFraction = static_cast<double>(reached) / n;
  summary.successRate = Statistics::summarize(successRates);
  summary.meanSteps = stepSum / n;
  summary.meanPathLinearity = linearitySum / n;

  logger_->debug("Ensemble done: reached {:.1f}%, mean success {:.4f}",
                 100.0 * summary.reachedFraction,
                 summary.successRate.mean);
  return summary;
}

std::vector<DeliveryEnsemble::SweepPoint> DeliveryEnsemble::sweepSizes(
  std::span<const double> sizes,
  PayloadType payload,
  const Coordinate& target) const
{
  std::vector<SweepPoint> points;
  points.reserve(sizes.size());
  for (double const size : sizes)
  {
    NanobotConfig const nanobot = designer_.designNanobot(size, payload);

    SweepPoint point{};
    point.size = size;
    point.mechanism = nanobot.getMechanism();
    point.efficiency = nanobot.getEfficiency();
    point.summary = run(nanobot, target);
    points.push_back(point);
  }
  return points;
}

DeliveryEnsemble::TrialOutcome DeliveryEnsemble::runTrial(
  const NanobotConfig& nanobot,
  const Coordinate& target,
  std::size_t trialIndex) const
{
  RandomEngine rng{config_.baseSeed + static_cast<uint32_t>(trialIndex)};
  DeliverySimulationResult const result =
    designer_.simulateDelivery(&nanobot, target, rng);

  TrialOutcome outcome{};
  outcome.reached = result.targetReached;
  outcome.successRate = result.successRate;
  outcome.steps = result.steps;
  outcome.pathLinearity = result.trajectoryAnalysis.pathLinearity;
  return outcome;
}

std::size_t DeliveryEnsemble::workerCount() const
{
  std::size_t workers = config_.threads;
  if (workers == 0)
  {
    workers = std::max<std::size_t>(1, std::thread::hardware_concurrency());
  }
  return std::min(workers, config_.trials);
}

}  // namespace nbd_sim
