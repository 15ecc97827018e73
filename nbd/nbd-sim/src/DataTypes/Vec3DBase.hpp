// Ticket: 0003_trajectory_integrator

#ifndef NBD_SIM_VEC3D_BASE_HPP
#define NBD_SIM_VEC3D_BASE_HPP

// NOLINTBEGIN(bugprone-crtp-constructor-accessibility)

#include <Eigen/Dense>

namespace nbd_sim::detail
{

/**
 * @brief CRTP base for the 3-component value types of the delivery model
 *
 * Stores the components in an Eigen::Vector3d so Coordinate and Vector3D mix
 * freely in Eigen expressions. Adds the point-to-point queries the
 * integrator, analyzer and scorer share, with the zero-length guard applied
 * in one place.
 *
 * @tparam Derived The derived type (CRTP pattern)
 */
template <typename Derived>
class Vec3DBase : public Eigen::Vector3d
{
public:
  Vec3DBase() : Eigen::Vector3d{Eigen::Vector3d::Zero()}
  {
  }

  Vec3DBase(double x, double y, double z) : Eigen::Vector3d{x, y, z}
  {
  }

  template <typename OtherDerived>
  // NOLINTNEXTLINE(google-explicit-constructor)
  Vec3DBase(const Eigen::MatrixBase<OtherDerived>& other)
    : Eigen::Vector3d{other}
  {
  }

  template <typename OtherDerived>
  Derived& operator=(const Eigen::MatrixBase<OtherDerived>& other)
  {
    Eigen::Vector3d::operator=(other);
    return static_cast<Derived&>(*this);
  }

  /// Euclidean distance to @p other
  template <typename OtherDerived>
  [[nodiscard]] double distanceTo(
    const Eigen::MatrixBase<OtherDerived>& other) const
  {
    return (other - *this).norm();
  }

  /**
   * @brief Unit vector pointing from this point toward @p other
   *
   * Returns the zero vector when the points coincide exactly, so callers
   * never divide by a zero length.
   */
  template <typename OtherDerived>
  [[nodiscard]] Eigen::Vector3d directionTo(
    const Eigen::MatrixBase<OtherDerived>& other) const
  {
    Eigen::Vector3d const delta = other - *this;
    double const length = delta.norm();
    if (length > 0.0)
    {
      return delta / length;
    }
    return Eigen::Vector3d::Zero();
  }
};

}  // namespace nbd_sim::detail

// NOLINTEND(bugprone-crtp-constructor-accessibility)

#endif  // NBD_SIM_VEC3D_BASE_HPP
