// Ticket: 0003_trajectory_integrator

#ifndef NBD_SIM_VECTOR3D_HPP
#define NBD_SIM_VECTOR3D_HPP

#include "nbd-sim/src/DataTypes/Vec3DBase.hpp"
#include "nbd-sim/src/DataTypes/Vec3FormatterBase.hpp"
#include "nbd-transfer/src/Vector3DRecord.hpp"

namespace nbd_sim
{

/**
 * @brief Generic 3D vector type with transfer object support
 *
 * Used for directions and random displacements. For positions, prefer
 * Coordinate.
 *
 * Memory footprint: 24 bytes (same as Eigen::Vector3d)
 */
struct Vector3D final : detail::Vec3DBase<Vector3D>
{
  using Vec3DBase::Vec3DBase;
  using Vec3DBase::operator=;

  template <typename OtherDerived>
  // NOLINTNEXTLINE(google-explicit-constructor)
  Vector3D(const Eigen::MatrixBase<OtherDerived>& other) : Vec3DBase{other}
  {
  }

  // Transfer methods
  static Vector3D fromRecord(const nbd_transfer::Vector3DRecord& record)
  {
    return Vector3D{record.x, record.y, record.z};
  }

  [[nodiscard]] nbd_transfer::Vector3DRecord toRecord() const
  {
    nbd_transfer::Vector3DRecord record;
    record.x = x();
    record.y = y();
    record.z = z();
    return record;
  }
};

}  // namespace nbd_sim

template <>
struct fmt::formatter<nbd_sim::Vector3D>
  : nbd_sim::detail::Vec3FormatterBase<nbd_sim::Vector3D>
{
};

#endif  // NBD_SIM_VECTOR3D_HPP
