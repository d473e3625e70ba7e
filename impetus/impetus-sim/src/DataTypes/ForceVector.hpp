#ifndef IMPETUS_SIM_FORCE_VECTOR_HPP
#define IMPETUS_SIM_FORCE_VECTOR_HPP

#include "impetus-sim/src/DataTypes/Vec3DBase.hpp"

namespace impetus_sim
{

/**
 * @brief 3D force vector type [N]
 *
 * Also carries linear impulses [N*s] when paired with ForceMode::Impulse.
 */
struct ForceVector final : detail::Vec3DBase<ForceVector>
{
  using Vec3DBase::Vec3DBase;
  using Vec3DBase::operator=;

  template <typename OtherDerived>
  // NOLINTNEXTLINE(google-explicit-constructor)
  ForceVector(const Eigen::MatrixBase<OtherDerived>& other) : Vec3DBase{other}
  {
  }
};

}  // namespace impetus_sim

#endif  // IMPETUS_SIM_FORCE_VECTOR_HPP
