#ifndef IMPETUS_SIM_PHYSICS_ENVIRONMENT_ASSET_HPP
#define IMPETUS_SIM_PHYSICS_ENVIRONMENT_ASSET_HPP

#include "impetus-sim/src/Physics/RigidBody/AssetPhysical.hpp"

namespace impetus_sim
{

/**
 * @brief Stationary solid object with no rigid body dynamics.
 *
 * Environment objects are hit by ray queries (ground probes) and never move.
 *
 * Typical use cases:
 * - Terrain and ground surfaces
 * - Walls, ramps, and static obstacles
 */
class AssetEnvironment : public AssetPhysical
{
public:
  AssetEnvironment(uint32_t instanceId,
                   const ReferenceFrame& frame,
                   const BoxCollider& collider)
    : AssetPhysical{instanceId, frame, collider}
  {
  }
};

}  // namespace impetus_sim

#endif  // IMPETUS_SIM_PHYSICS_ENVIRONMENT_ASSET_HPP
