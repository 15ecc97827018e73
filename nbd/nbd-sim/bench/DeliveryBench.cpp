// Ticket: 0006_delivery_ensemble

#include <benchmark/benchmark.h>

#include <cstdint>
#include <vector>

#include <spdlog/spdlog.h>

#include "nbd-sim/src/DataTypes/Coordinate.hpp"
#include "nbd-sim/src/Delivery/DeliveryEnsemble.hpp"
#include "nbd-sim/src/Delivery/TrajectoryAnalyzer.hpp"
#include "nbd-sim/src/Delivery/TrajectoryIntegrator.hpp"
#include "nbd-sim/src/Design/EfficiencyModel.hpp"
#include "nbd-sim/src/NanobotDesigner.hpp"

using namespace nbd_sim;

// ============================================================================
// Efficiency Model
// ============================================================================

static void BM_EfficiencyModel_Curve(benchmark::State& state)
{
  std::vector<double> sizes;
  for (int64_t i = 1; i <= state.range(0); ++i)
  {
    sizes.push_back(static_cast<double>(i));
  }

  for (auto _ : state)
  {
    auto curve = EfficiencyModel::curve(sizes, PayloadType::MRNA);
    benchmark::DoNotOptimize(curve.data());
  }
  state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK(BM_EfficiencyModel_Curve)->Arg(100)->Arg(1000);

// ============================================================================
// Trajectory Integration
// ============================================================================

/**
 * @brief Full integrator run to an unreachable target, so every iteration
 * executes the whole step cap.
 *
 * range(0) is the nanobot size, selecting the delivery mechanism.
 */
static void BM_TrajectoryIntegrator_RunToCap(benchmark::State& state)
{
  NanobotConfig const nanobot{static_cast<double>(state.range(0)),
                              PayloadType::MRNA};
  TrajectoryIntegrator const integrator{};
  Coordinate const start{0.0, 0.0, 0.0};
  Coordinate const target{1000.0, 0.0, 0.0};
  RandomEngine rng{42};  // Fixed seed for deterministic benchmarks

  for (auto _ : state)
  {
    auto result = integrator.run(start, target, nanobot, rng);
    benchmark::DoNotOptimize(result.path.data());
  }
  state.SetItemsProcessed(
    state.iterations() *
    static_cast<int64_t>(integrator.getConfig().maxSteps));
}
BENCHMARK(BM_TrajectoryIntegrator_RunToCap)
  ->Arg(5)    // Passive diffusion
  ->Arg(30)   // Active transport
  ->Arg(80);  // Guided propulsion

static void BM_TrajectoryAnalyzer_Analyze(benchmark::State& state)
{
  NanobotConfig const nanobot{20.0, PayloadType::MRNA};
  TrajectoryIntegrator const integrator{};
  RandomEngine rng{42};
  auto const trajectory = integrator.run(Coordinate{0.0, 0.0, 0.0},
                                         Coordinate{1000.0, 0.0, 0.0},
                                         nanobot,
                                         rng);

  for (auto _ : state)
  {
    auto analysis = TrajectoryAnalyzer::analyze(trajectory.path,
                                                trajectory.steps);
    benchmark::DoNotOptimize(analysis);
  }
}
BENCHMARK(BM_TrajectoryAnalyzer_Analyze);

// ============================================================================
// Ensemble
// ============================================================================

/**
 * @brief Monte Carlo ensemble of 64 trials
 *
 * range(0) is the worker thread count.
 */
static void BM_DeliveryEnsemble_Run(benchmark::State& state)
{
  spdlog::set_level(spdlog::level::warn);

  DeliveryEnsemble::Config config{};
  config.trials = 64;
  config.baseSeed = 42;
  config.threads = static_cast<std::size_t>(state.range(0));
  DeliveryEnsemble const ensemble{NanobotDesigner{}, config};
  NanobotConfig const nanobot{20.0, PayloadType::MRNA};
  Coordinate const target{1.0, 1.0, 1.0};

  for (auto _ : state)
  {
    auto summary = ensemble.run(nanobot, target);
    benchmark::DoNotOptimize(summary);
  }
  state.SetItemsProcessed(state.iterations() *
                          static_cast<int64_t>(config.trials));
}
BENCHMARK(BM_DeliveryEnsemble_Run)
  ->Arg(1)
  ->Arg(2)
  ->Arg(4)
  ->Unit(benchmark::kMillisecond)
  ->UseRealTime();

BENCHMARK_MAIN();
