#ifndef IMPETUS_SIM_PHYSICS_FORCE_MODE_HPP
#define IMPETUS_SIM_PHYSICS_FORCE_MODE_HPP

#include <cstdint>

namespace impetus_sim
{

/**
 * @brief How a force request is applied to a rigid body
 *
 * - Force: accumulated and integrated over the next step [N] / [N*m]
 * - Impulse: instantaneous change of momentum [N*s] / [N*m*s]
 */
enum class ForceMode : std::uint8_t
{
  Force,
  Impulse
};

}  // namespace impetus_sim

#endif  // IMPETUS_SIM_PHYSICS_FORCE_MODE_HPP
