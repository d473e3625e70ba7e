#include "impetus-sim/src/Physics/RigidBody/AssetPhysical.hpp"

#include <utility>

namespace impetus_sim
{

AssetPhysical::AssetPhysical(uint32_t instanceId,
                             const ReferenceFrame& frame,
                             std::optional<BoxCollider> collider)
  : instanceId_{instanceId},
    referenceFrame_{frame},
    collider_{std::move(collider)}
{
}

const ReferenceFrame& AssetPhysical::getReferenceFrame() const
{
  return referenceFrame_;
}

const std::optional<BoxCollider>& AssetPhysical::getCollider() const
{
  return collider_;
}

bool AssetPhysical::hasCollider() const
{
  return collider_.has_value();
}

uint32_t AssetPhysical::getInstanceId() const
{
  return instanceId_;
}

}  // namespace impetus_sim
