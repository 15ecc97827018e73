// Ticket: 0003_trajectory_integrator

#ifndef NBD_TRANSFER_COORDINATE_RECORD_HPP
#define NBD_TRANSFER_COORDINATE_RECORD_HPP

#include <limits>

#include <boost/describe.hpp>

namespace nbd_transfer
{

/**
 * @brief Transfer record for a 3D position
 *
 * Stores the x, y, z components of an nbd_sim::Coordinate as individual
 * scalar doubles so 3-D path plots can consume them without Eigen.
 */
struct CoordinateRecord
{
  double x{std::numeric_limits<double>::quiet_NaN()};
  double y{std::numeric_limits<double>::quiet_NaN()};
  double z{std::numeric_limits<double>::quiet_NaN()};
};

// Register with Boost.Describe for field reflection
BOOST_DESCRIBE_STRUCT(CoordinateRecord, (), (x, y, z));

}  // namespace nbd_transfer

#endif  // NBD_TRANSFER_COORDINATE_RECORD_HPP
