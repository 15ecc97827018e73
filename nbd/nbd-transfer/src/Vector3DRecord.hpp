// Ticket: 0003_trajectory_integrator

#ifndef NBD_TRANSFER_VECTOR3D_RECORD_HPP
#define NBD_TRANSFER_VECTOR3D_RECORD_HPP

#include <limits>

#include <boost/describe.hpp>

namespace nbd_transfer
{

/**
 * @brief Transfer record for a generic 3D vector
 *
 * Use this record for generic 3D vector data such as the Brownian
 * displacement of a trajectory step. For positions, use CoordinateRecord.
 */
struct Vector3DRecord
{
  double x{std::numeric_limits<double>::quiet_NaN()};
  double y{std::numeric_limits<double>::quiet_NaN()};
  double z{std::numeric_limits<double>::quiet_NaN()};
};

// Register with Boost.Describe for field reflection
BOOST_DESCRIBE_STRUCT(Vector3DRecord, (), (x, y, z));

}  // namespace nbd_transfer

#endif  // NBD_TRANSFER_VECTOR3D_RECORD_HPP
