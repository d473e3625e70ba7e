#ifndef IMPETUS_SIM_TORQUE_VECTOR_HPP
#define IMPETUS_SIM_TORQUE_VECTOR_HPP

#include "impetus-sim/src/DataTypes/Vec3DBase.hpp"

namespace impetus_sim
{

/**
 * @brief 3D torque vector type [N*m]
 *
 * Also carries angular impulses [N*m*s] when paired with ForceMode::Impulse.
 */
struct TorqueVector final : detail::Vec3DBase<TorqueVector>
{
  using Vec3DBase::Vec3DBase;
  using Vec3DBase::operator=;

  template <typename OtherDerived>
  // NOLINTNEXTLINE(google-explicit-constructor)
  TorqueVector(const Eigen::MatrixBase<OtherDerived>& other) : Vec3DBase{other}
  {
  }
};

}  // namespace impetus_sim

#endif  // IMPETUS_SIM_TORQUE_VECTOR_HPP
