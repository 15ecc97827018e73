// Ticket: 0004_trajectory_analysis

#ifndef NBD_SIM_DELIVERY_TRAJECTORY_ANALYZER_HPP
#define NBD_SIM_DELIVERY_TRAJECTORY_ANALYZER_HPP

#include <span>

#include "nbd-sim/src/DataTypes/Coordinate.hpp"
#include "nbd-sim/src/Delivery/TrajectoryStep.hpp"
#include "nbd-transfer/src/EnvironmentalImpactRecord.hpp"
#include "nbd-transfer/src/TrajectoryAnalysisRecord.hpp"

namespace nbd_sim
{

/**
 * @brief Aggregate statistics of a delivery trajectory
 *
 * Provides static methods only; every method is pure and thread-safe.
 *
 * Degenerate inputs never produce NaN:
 * - fewer than two path points: distance 0, linearity 1
 * - zero travelled distance: linearity 1
 * - no step records: all-zero velocity statistics and environmental impact
 *
 * @ticket 0004_trajectory_analysis
 */
class TrajectoryAnalyzer
{
public:
  /**
   * @brief Mean environmental perturbation over all steps
   */
  struct EnvironmentalImpact
  {
    double brownianIntensity{0.0};            // mean |brownian|
    double resistanceImpact{0.0};             // mean fluid resistance
    double cellularInteractionStrength{0.0};  // mean cellular interaction

    [[nodiscard]] nbd_transfer::EnvironmentalImpactRecord toRecord() const;
  };

  struct Analysis
  {
    double totalDistance{0.0};     // Sum of segment lengths
    double averageVelocity{0.0};   // Mean per-step drift speed
    double velocityVariance{0.0};  // Population variance of drift speed
    double pathLinearity{1.0};     // Straight-line / travelled distance
    EnvironmentalImpact environmentalImpact{};

    [[nodiscard]] nbd_transfer::TrajectoryAnalysisRecord toRecord() const;
  };

  /**
   * @brief Analyze a trajectory from its path and parallel per-step data
   *
   * @param path Positions including the start point
   * @param velocities Drift speed of each step
   * @param effects Environmental effect of each step
   */
  static Analysis analyze(std::span<const Coordinate> path,
                          std::span<const double> velocities,
                          std::span<const EnvironmentalEffect> effects);

  /**
   * @brief Analyze a trajectory from its path and step records
   */
  static Analysis analyze(std::span<const Coordinate> path,
                          std::span<const TrajectoryStep> steps);

  static EnvironmentalImpact analyzeEnvironmentalImpact(
    std::span<const EnvironmentalEffect> effects);

  /// Sum of |path[i+1] - path[i]|
  static double totalDistance(std::span<const Coordinate> path);

  /// |path.back() - path.front()| / totalDistance, 1.0 when undefined
  static double pathLinearity(std::span<const Coordinate> path);
};

}  // namespace nbd_sim

#endif  // NBD_SIM_DELIVERY_TRAJECTORY_ANALYZER_HPP
