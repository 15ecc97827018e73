// Ticket: 0002_design_specs

#ifndef NBD_SIM_DESIGN_DESIGN_SPECS_HPP
#define NBD_SIM_DESIGN_DESIGN_SPECS_HPP

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "nbd-sim/src/Design/PayloadType.hpp"

namespace nbd_sim
{

enum class SurfaceCharge : uint8_t
{
  Neutral,
  Positive,
  Variable
};

enum class Hydrophobicity : uint8_t
{
  Low,
  Moderate
};

std::string_view toString(SurfaceCharge charge);
std::string_view toString(Hydrophobicity hydrophobicity);

/**
 * @brief Fabrication specification of a nanobot design
 *
 * Derived deterministically from size and payload. The engine never reads
 * these values back; they exist for the lab-protocol generator.
 *
 * @ticket 0002_design_specs
 */
struct DesignSpecs
{
  struct SurfaceChemistry
  {
    SurfaceCharge charge{SurfaceCharge::Positive};
    Hydrophobicity hydrophobicity{Hydrophobicity::Low};
  };

  struct Coating
  {
    std::string material{"PEG"};
    double thicknessNm{0.0};
    std::string degradationRate{"0.1nm/hour"};
  };

  struct StabilityParameters
  {
    double temperatureMinC{4.0};
    double temperatureMaxC{40.0};
    double phMin{6.5};
    double phMax{7.5};
    int shelfLifeDays{30};
    double zetaPotentialMv{-30.0};
  };

  SurfaceChemistry surfaceChemistry{};
  Coating coating{};
  StabilityParameters stability{};
  std::vector<std::string> manufacturingSteps;

  /// Coating thickness as a fraction of nanobot diameter
  static constexpr double kCoatingThicknessRatio = 0.1;

  /**
   * @brief Derive the specification for a design
   * @param size Nanobot diameter [nm], already validated positive
   * @param payload Cargo category
   */
  static DesignSpecs generate(double size, PayloadType payload);

  static SurfaceChemistry surfaceChemistryFor(PayloadType payload);
};

}  // namespace nbd_sim

#endif  // NBD_SIM_DESIGN_DESIGN_SPECS_HPP
