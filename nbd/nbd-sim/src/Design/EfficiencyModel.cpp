// Ticket: 0001_efficiency_model

#include "nbd-sim/src/Design/EfficiencyModel.hpp"

#include <cmath>
#include <string>

#include "nbd-sim/src/Utils/InvalidParameter.hpp"

namespace nbd_sim
{

namespace
{

// weight, stability, diffusion
constexpr EfficiencyModel::PayloadFactors kSmallMolecules{0.1, 0.95, 0.9};
constexpr EfficiencyModel::PayloadFactors kMRNA{0.3, 0.7, 0.8};
constexpr EfficiencyModel::PayloadFactors kProteins{0.5, 0.8, 0.7};
constexpr EfficiencyModel::PayloadFactors kPlasmids{0.7, 0.6, 0.5};

}  // namespace

// ========== Result ==========

nbd_transfer::EfficiencyFactorsRecord EfficiencyModel::Result::toRecord() const
{
  nbd_transfer::EfficiencyFactorsRecord record{};
  record.overall_efficiency = overallEfficiency;
  record.base_efficiency = factors.baseEfficiency;
  record.size_factor = factors.sizeFactor;
  record.payload_weight = factors.payloadFactors.weight;
  record.payload_stability = factors.payloadFactors.stability;
  record.payload_diffusion = factors.payloadFactors.diffusion;
  record.payload_efficiency = factors.payloadFactors.efficiency();
  record.ph_sensitivity = factors.environmentalFactors.phSensitivity;
  record.temperature_stability =
    factors.environmentalFactors.temperatureStability;
  record.cellular_barriers = factors.environmentalFactors.cellularBarriers;
  record.degradation_resistance =
    factors.environmentalFactors.degradationResistance;
  record.environmental_efficiency = factors.environmentalFactors.efficiency();
  return record;
}

// ========== EfficiencyModel ==========

EfficiencyModel::Result EfficiencyModel::compute(double size,
                                                 PayloadType payload)
{
  // Negated comparison also rejects NaN
  if (!(size > 0.0))
  {
    throw InvalidParameter{"Nanobot size must be positive, got " +
                           std::to_string(size)};
  }

  Result result{};
  result.factors.baseEfficiency = kBaseEfficiency;
  result.factors.sizeFactor = sizeFactor(size);
  result.factors.payloadFactors = payloadFactors(payload);
  result.factors.environmentalFactors = EnvironmentalFactors{};

  result.overallEfficiency = result.factors.baseEfficiency *
                             result.factors.sizeFactor *
                             result.factors.payloadFactors.efficiency() *
                             result.factors.environmentalFactors.efficiency();
  return result;
}

std::vector<EfficiencyModel::Result> EfficiencyModel::curve(
  std::span<const double> sizes,
  PayloadType payload)
{
  std::vector<Result> results;
  results.reserve(sizes.size());
  for (double const size : sizes)
  {
    results.push_back(compute(size, payload));
  }
  return results;
}

double EfficiencyModel::sizeFactor(double size)
{
  double const offset = size - kOptimalSize;
  return std::exp(-(offset * offset) / kSizeSpread);
}

EfficiencyModel::PayloadFactors EfficiencyModel::payloadFactors(
  PayloadType payload)
{
  switch (payload)
  {
    case PayloadType::SmallMolecules:
      return kSmallMolecules;
    case PayloadType::MRNA:
      return kMRNA;
    case PayloadType::Proteins:
      return kProteins;
    case PayloadType::Plasmids:
      return kPlasmids;
  }
  return kMRNA;
}

}  // namespace nbd_sim
