#ifndef IMPETUS_SIM_PHYSICS_TRIGGER_ASSET_HPP
#define IMPETUS_SIM_PHYSICS_TRIGGER_ASSET_HPP

#include "impetus-sim/src/Physics/RigidBody/AssetPhysical.hpp"

namespace impetus_sim
{

/**
 * @brief Stationary overlap volume.
 *
 * Detects overlap with dynamic bodies and reports it through trigger events
 * without any collision response. Trigger volumes are invisible to ray
 * queries.
 */
class AssetTrigger : public AssetPhysical
{
public:
  AssetTrigger(uint32_t instanceId,
               const ReferenceFrame& frame,
               const BoxCollider& collider)
    : AssetPhysical{instanceId, frame, collider}
  {
  }

  /**
   * @brief Volume shape; always present for a trigger
   */
  const BoxCollider& getVolume() const
  {
    return *collider_;
  }
};

}  // namespace impetus_sim

#endif  // IMPETUS_SIM_PHYSICS_TRIGGER_ASSET_HPP
