#ifndef IMPETUS_SIM_VEC3D_BASE_HPP
#define IMPETUS_SIM_VEC3D_BASE_HPP

// NOLINTBEGIN(bugprone-crtp-constructor-accessibility)

#include <Eigen/Dense>

namespace impetus_sim::detail
{

/**
 * @brief CRTP base for the simulation's 3D quantities
 *
 * Each quantity (position, force, torque) is its own type with the full
 * Eigen::Vector3d interface. Eigen expressions convert back to the
 * quantity type implicitly, so arithmetic reads naturally:
 *
 *   ForceVector f = direction * strength;
 *
 * Derived types declare themselves as:
 *
 *   struct Quantity final : Vec3DBase<Quantity> { ... };
 *
 * @tparam Derived The derived quantity type
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

  // NOLINTNEXTLINE(google-explicit-constructor)
  Vec3DBase(const Eigen::Vector3d& vec) : Eigen::Vector3d{vec}
  {
  }

  template <typename OtherDerived>
  // NOLINTNEXTLINE(google-explicit-constructor)
  Vec3DBase(const Eigen::MatrixBase<OtherDerived>& other)
    : Eigen::Vector3d{other}
  {
  }

  template <typename OtherDerived>
  Vec3DBase& operator=(const Eigen::MatrixBase<OtherDerived>& other)
  {
    this->Eigen::Vector3d::operator=(other);
    return *this;
  }

  /**
   * @brief Unit vector along this one, or the zero vector if this is zero
   *
   * Unlike Eigen's normalized(), a zero input never produces NaN.
   */
  Derived normalizedOrZero() const
  {
    double const length = this->norm();
    if (length == 0.0)
    {
      return Derived{0.0, 0.0, 0.0};
    }
    return Derived{*this / length};
  }
};

}  // namespace impetus_sim::detail

// NOLINTEND(bugprone-crtp-constructor-accessibility)

#endif  // IMPETUS_SIM_VEC3D_BASE_HPP
