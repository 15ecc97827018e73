// Ticket: 0005_delivery_simulation

#ifndef NBD_SIM_DELIVERY_SUCCESS_SCORER_HPP
#define NBD_SIM_DELIVERY_SUCCESS_SCORER_HPP

#include <span>

#include "nbd-sim/src/DataTypes/Coordinate.hpp"

namespace nbd_sim
{

/**
 * @brief Scalar delivery success probability of a trajectory
 *
 *   distanceScore = 1 - min(|path.back() - target| / |target|, 1)
 *   successRate   = 0.7 * distanceScore + 0.3 / path.size()
 *
 * |target| is the distance from the origin, where deliveries start. When the
 * target is the origin the ratio is replaced by 0 (final point on target) or
 * 1 (anywhere else).
 *
 * @ticket 0005_delivery_simulation
 */
class SuccessScorer
{
public:
  static constexpr double kDistanceWeight = 0.7;
  static constexpr double kPathEfficiencyWeight = 0.3;

  /**
   * @param path Positions including the start point
   * @param target Target position
   * @return Success rate in [0, 1]
   * @throws InvalidParameter if path is empty
   */
  static double score(std::span<const Coordinate> path,
                      const Coordinate& target);

  /// min(finalDistance / maxExpectedDistance, 1) with the zero-target guard
  static double normalizedDistance(double finalDistance,
                                   double maxExpectedDistance);
};

}  // namespace nbd_sim

#endif  // NBD_SIM_DELIVERY_SUCCESS_SCORER_HPP
