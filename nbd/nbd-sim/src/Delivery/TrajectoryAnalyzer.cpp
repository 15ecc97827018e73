// Ticket: 0004_trajectory_analysis

#include "nbd-sim/src/Delivery/TrajectoryAnalyzer.hpp"

#include <algorithm>
#include <cstddef>
#include <vector>

namespace nbd_sim
{

namespace
{

double mean(std::span<const double> values)
{
  if (values.empty())
  {
    return 0.0;
  }
  double sum = 0.0;
  for (double const v : values)
  {
    sum += v;
  }
  return sum / static_cast<double>(values.size());
}

double populationVariance(std::span<const double> values)
{
  if (values.empty())
  {
    return 0.0;
  }
  double const mu = mean(values);
  double sumSq = 0.0;
  for (double const v : values)
  {
    double const d = v - mu;
    sumSq += d * d;
  }
  return sumSq / static_cast<double>(values.size());
}

}  // namespace

// ========== Records ==========

nbd_transfer::EnvironmentalImpactRecord
TrajectoryAnalyzer::EnvironmentalImpact::toRecord() const
{
  nbd_transfer::EnvironmentalImpactRecord record{};
  record.brownian_intensity = brownianIntensity;
  record.resistance_impact = resistanceImpact;
  record.cellular_interaction_strength = cellularInteractionStrength;
  return record;
}

nbd_transfer::TrajectoryAnalysisRecord TrajectoryAnalyzer::Analysis::toRecord()
  const
{
  nbd_transfer::TrajectoryAnalysisRecord record{};
  record.total_distance = totalDistance;
  record.average_velocity = averageVelocity;
  record.velocity_variance = velocityVariance;
  record.path_linearity = pathLinearity;
  record.environmental_impact = environmentalImpact.toRecord();
  return record;
}

// ========== TrajectoryAnalyzer ==========

TrajectoryAnalyzer::Analysis TrajectoryAnalyzer::analyze(
  std::span<const Coordinate> path,
  std::span<const double> velocities,
  std::span<const EnvironmentalEffect> effects)
{
  Analysis result{};
  result.environmentalImpact = analyzeEnvironmentalImpact(effects);

  if (path.size() < 2)
  {
    return result;
  }

  result.totalDistance = totalDistance(path);
  result.averageVelocity = mean(velocities);
  result.velocityVariance = populationVariance(velocities);
  result.pathLinearity = pathLinearity(path);
  return result;
}

TrajectoryAnalyzer::Analysis TrajectoryAnalyzer::analyze(
  std::span<const Coordinate> path,
  std::span<const TrajectoryStep> steps)
{
  std::vector<double> velocities;
  std::vector<EnvironmentalEffect> effects;
  velocities.reserve(steps.size());
  effects.reserve(steps.size());
  for (const auto& step : steps)
  {
    velocities.push_back(step.velocity);
    effects.push_back(step.effect);
  }
  return analyze(path, velocities, effects);
}

TrajectoryAnalyzer::EnvironmentalImpact
TrajectoryAnalyzer::analyzeEnvironmentalImpact(
  std::span<const EnvironmentalEffect> effects)
{
  EnvironmentalImpact impact{};
  if (effects.empty())
  {
    return impact;
  }

  for (const auto& effect : effects)
  {
    impact.brownianIntensity += effect.brownianVector.norm();
    impact.resistanceImpact += effect.fluidResistance;
    impact.cellularInteractionStrength += effect.cellularInteraction;
  }

  auto const n = static_cast<double>(effects.size());
  impact.brownianIntensity /= n;
  impact.resistanceImpact /= n;
  impact.cellularInteractionStrength /= n;
  return impact;
}

double TrajectoryAnalyzer::totalDistance(std::span<const Coordinate> path)
{
  double distance = 0.0;
  for (std::size_t i = 1; i < path.size(); ++i)
  {
    distance += path[i - 1].distanceTo(path[i]);
  }
  return distance;
}

double TrajectoryAnalyzer::pathLinearity(std::span<const Coordinate> path)
{
  if (path.size() < 2)
  {
    return 1.0;
  }

  double const actual = totalDistance(path);
  if (actual <= 0.0)
  {
    return 1.0;
  }
  // Rounding can push a straight path a few ulps above 1
  return std::min(path.front().distanceTo(path.back()) / actual, 1.0);
}

}  // namespace nbd_sim
