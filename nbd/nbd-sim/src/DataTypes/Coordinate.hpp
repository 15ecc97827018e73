// Ticket: 0003_trajectory_integrator

#ifndef NBD_SIM_COORDINATE_HPP
#define NBD_SIM_COORDINATE_HPP

#include "nbd-sim/src/DataTypes/Vec3DBase.hpp"
#include "nbd-sim/src/DataTypes/Vec3FormatterBase.hpp"
#include "nbd-transfer/src/CoordinateRecord.hpp"

namespace nbd_sim
{

/**
 * @brief 3D position in the delivery medium [nm-scaled simulation units]
 *
 * Thin wrapper around Vec3DBase providing:
 * - Full Eigen matrix operation compatibility
 * - fromRecord/toRecord for the presentation layer
 * - fmt/spdlog formatting support
 */
struct Coordinate final : detail::Vec3DBase<Coordinate>
{
  using Vec3DBase::Vec3DBase;
  using Vec3DBase::operator=;

  template <typename OtherDerived>
  // NOLINTNEXTLINE(google-explicit-constructor)
  Coordinate(const Eigen::MatrixBase<OtherDerived>& other) : Vec3DBase{other}
  {
  }

  // Transfer methods
  static Coordinate fromRecord(const nbd_transfer::CoordinateRecord& record)
  {
    return Coordinate{record.x, record.y, record.z};
  }

  [[nodiscard]] nbd_transfer::CoordinateRecord toRecord() const
  {
    nbd_transfer::CoordinateRecord record;
    record.x = x();
    record.y = y();
    record.z = z();
    return record;
  }
};

}  // namespace nbd_sim

template <>
struct fmt::formatter<nbd_sim::Coordinate>
  : nbd_sim::detail::Vec3FormatterBase<nbd_sim::Coordinate>
{
};

#endif  // NBD_SIM_COORDINATE_HPP
