// Ticket: 0005_delivery_simulation

#include "nbd-sim/src/Delivery/SuccessScorer.hpp"

#include <algorithm>

#include "nbd-sim/src/Utils/InvalidParameter.hpp"

namespace nbd_sim
{

double SuccessScorer::score(std::span<const Coordinate> path,
                            const Coordinate& target)
{
  if (path.empty())
  {
    throw InvalidParameter{"Cannot score an empty delivery path"};
  }

  double const finalDistance = path.back().distanceTo(target);
  double const pathEfficiency = 1.0 / static_cast<double>(path.size());
  double const maxExpectedDistance = target.norm();

  double const distanceScore =
    1.0 - normalizedDistance(finalDistance, maxExpectedDistance);

  return kDistanceWeight * distanceScore +
         kPathEfficiencyWeight * pathEfficiency;
}

double SuccessScorer::normalizedDistance(double finalDistance,
                                         double maxExpectedDistance)
{
  if (maxExpectedDistance <= 0.0)
  {
    return finalDistance == 0.0 ? 0.0 : 1.0;
  }
  return std::min(finalDistance / maxExpectedDistance, 1.0);
}

}  // namespace nbd_sim
