#ifndef IMPETUS_SIM_COORDINATE_HPP
#define IMPETUS_SIM_COORDINATE_HPP

#include "impetus-sim/src/DataTypes/Vec3DBase.hpp"

namespace impetus_sim
{

/**
 * @brief 3D position or direction [m]
 *
 * Memory footprint: 24 bytes (same as Eigen::Vector3d)
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
};

}  // namespace impetus_sim

#endif  // IMPETUS_SIM_COORDINATE_HPP
