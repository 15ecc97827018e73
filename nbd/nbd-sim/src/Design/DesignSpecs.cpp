// Ticket: 0002_design_specs

#include "nbd-sim/src/Design/DesignSpecs.hpp"

namespace nbd_sim
{

std::string_view toString(SurfaceCharge charge)
{
  switch (charge)
  {
    case SurfaceCharge::Neutral:
      return "neutral";
    case SurfaceCharge::Positive:
      return "positive";
    case SurfaceCharge::Variable:
      return "variable";
  }
  return "positive";
}

std::string_view toString(Hydrophobicity hydrophobicity)
{
  switch (hydrophobicity)
  {
    case Hydrophobicity::Low:
      return "low";
    case Hydrophobicity::Moderate:
      return "moderate";
  }
  return "low";
}

DesignSpecs::SurfaceChemistry DesignSpecs::surfaceChemistryFor(
  PayloadType payload)
{
  switch (payload)
  {
    case PayloadType::SmallMolecules:
      return {SurfaceCharge::Neutral, Hydrophobicity::Moderate};
    case PayloadType::MRNA:
      return {SurfaceCharge::Positive, Hydrophobicity::Low};
    case PayloadType::Proteins:
      return {SurfaceCharge::Variable, Hydrophobicity::Moderate};
    case PayloadType::Plasmids:
      return {SurfaceCharge::Positive, Hydrophobicity::Low};
  }
  return {SurfaceCharge::Positive, Hydrophobicity::Low};
}

DesignSpecs DesignSpecs::generate(double size, PayloadType payload)
{
  DesignSpecs specs{};
  specs.surfaceChemistry = surfaceChemistryFor(payload);
  specs.coating.thicknessNm = size * kCoatingThicknessRatio;
  specs.manufacturingSteps = {"Prepare biocompatible polymer solution",
                              "Add payload under controlled conditions",
                              "Perform nanoprecipitation",
                              "Apply surface coating",
                              "Purify using tangential flow filtration",
                              "Perform quality control"};
  return specs;
}

}  // namespace nbd_sim
