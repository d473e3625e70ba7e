#ifndef IMPETUS_SIM_PHYSICS_PHYSICAL_ASSET_HPP
#define IMPETUS_SIM_PHYSICS_PHYSICAL_ASSET_HPP

#include <cstdint>
#include <optional>

#include "impetus-sim/src/Environment/ReferenceFrame.hpp"
#include "impetus-sim/src/Physics/RigidBody/BoxCollider.hpp"

namespace impetus_sim
{

/**
 * @brief Base class for objects placed in the world.
 *
 * Provides an instance id, a reference frame defining position and
 * orientation in world space, and an optional box collider.
 *
 * This class serves as the foundation for:
 * - AssetEnvironment: Stationary solid objects (ground, walls)
 * - AssetTrigger: Stationary overlap volumes without collision response
 * - AssetInertial: Dynamic objects with rigid body properties
 */
class AssetPhysical
{
public:
  AssetPhysical(uint32_t instanceId,
                const ReferenceFrame& frame,
                std::optional<BoxCollider> collider);

  virtual ~AssetPhysical() = default;

  AssetPhysical(const AssetPhysical&) = default;
  AssetPhysical& operator=(const AssetPhysical&) = default;
  AssetPhysical(AssetPhysical&&) noexcept = default;
  AssetPhysical& operator=(AssetPhysical&&) noexcept = default;

  /**
   * @brief Get the reference frame defining position and orientation.
   */
  const ReferenceFrame& getReferenceFrame() const;

  /**
   * @brief Get the collider, if this object has one.
   */
  const std::optional<BoxCollider>& getCollider() const;

  bool hasCollider() const;

  uint32_t getInstanceId() const;

protected:
  uint32_t instanceId_;

  // Reference frame defining position and orientation in world space
  ReferenceFrame referenceFrame_;

  std::optional<BoxCollider> collider_;
};

}  // namespace impetus_sim

#endif  // IMPETUS_SIM_PHYSICS_PHYSICAL_ASSET_HPP
