#ifndef IMPETUS_SIM_WORLD_MODEL_HPP
#define IMPETUS_SIM_WORLD_MODEL_HPP

#include <cstdint>
#include <deque>
#include <memory>
#include <optional>
#include <set>
#include <utility>
#include <vector>

#include "impetus-sim/src/DataTypes/Coordinate.hpp"
#include "impetus-sim/src/Environment/ReferenceFrame.hpp"
#include "impetus-sim/src/Environment/TriggerEvent.hpp"
#include "impetus-sim/src/Physics/Integration/Integrator.hpp"
#include "impetus-sim/src/Physics/RigidBody/AssetEnvironment.hpp"
#include "impetus-sim/src/Physics/RigidBody/AssetInertial.hpp"
#include "impetus-sim/src/Physics/RigidBody/AssetTrigger.hpp"
#include "impetus-sim/src/Physics/RigidBody/BoxCollider.hpp"

namespace impetus_sim
{

/**
 * @brief Result of a ray query
 */
struct RaycastHit
{
  uint32_t objectId{0};
  double distance{0.0};  // Along the normalized ray direction [m]
  Coordinate point;      // World-space hit point
};

/**
 * @brief Container and stepper for every object in the simulation
 *
 * Owns dynamic bodies (AssetInertial), static solids (AssetEnvironment) and
 * trigger volumes (AssetTrigger). Instance ids are unique across all three
 * kinds. Storage is node-stable: references returned by the spawn methods
 * remain valid for the lifetime of the world.
 *
 * One call to step(dt):
 * 1. Detects trigger/body overlaps and notifies listeners
 *    (Exit for ended overlaps, Enter for new ones, then Stay for every
 *    current overlap)
 * 2. Adds gravity and integrates every dynamic body with its accumulated
 *    force and torque
 * 3. Pushes dynamic bodies out of environment solids (world AABB test) and
 *    removes the velocity component into the surface
 * 4. Clears the force accumulators
 *
 * There is no body-body collision response.
 *
 * @note Not thread-safe, single-threaded simulation assumed.
 */
class WorldModel
{
public:
  /**
   * @brief Construct with a semi-implicit Euler integrator
   */
  WorldModel();

  /**
   * @brief Construct with a custom integrator
   * @throws std::invalid_argument if integrator is null
   */
  explicit WorldModel(std::unique_ptr<Integrator> integrator);

  ~WorldModel() = default;

  WorldModel(const WorldModel&) = delete;
  WorldModel& operator=(const WorldModel&) = delete;
  WorldModel(WorldModel&&) = delete;
  WorldModel& operator=(WorldModel&&) = delete;

  // ========== Spawning ==========

  /**
   * @brief Add a dynamic body
   * @param frame Initial position and orientation
   * @param mass Mass [kg]
   * @param collider Optional collision box; bodies without one never
   *        generate trigger events and are invisible to ray queries
   * @throws std::invalid_argument if mass <= 0
   */
  AssetInertial& spawnInertialObject(const ReferenceFrame& frame,
                                     double mass,
                                     std::optional<BoxCollider> collider);

  /**
   * @brief Add a static solid (ground, wall, ramp)
   */
  const AssetEnvironment& spawnEnvironmentObject(const ReferenceFrame& frame,
                                                 const BoxCollider& collider);

  /**
   * @brief Add a trigger volume
   */
  const AssetTrigger& spawnTriggerVolume(const ReferenceFrame& frame,
                                         const BoxCollider& volume);

  // ========== Lookup ==========

  AssetInertial* findInertial(uint32_t instanceId);
  const AssetInertial* findInertial(uint32_t instanceId) const;

  /**
   * @throws std::out_of_range if no dynamic body has this id
   */
  AssetInertial& getInertial(uint32_t instanceId);
  const AssetInertial& getInertial(uint32_t instanceId) const;

  const AssetTrigger* findTrigger(uint32_t instanceId) const;

  /**
   * @brief Current frame of any object (body, solid, or trigger)
   * @return nullptr if no object has this id
   */
  const ReferenceFrame* findFrame(uint32_t instanceId) const;

  const std::deque<AssetInertial>& getInertialAssets() const
  {
    return inertialAssets_;
  }

  // ========== Queries ==========

  /**
   * @brief Closest hit along a ray against solids and dynamic bodies
   *
   * Trigger volumes are ignored, as is any collider the ray starts inside.
   *
   * @param origin Ray origin [m]
   * @param direction Ray direction (normalized internally, must be non-zero)
   * @param maxDistance Maximum hit distance [m]
   * @param ignoreId Object to exclude, typically the querying body
   */
  std::optional<RaycastHit> raycast(
    const Coordinate& origin,
    const Coordinate& direction,
    double maxDistance,
    std::optional<uint32_t> ignoreId = std::nullopt) const;

  /**
   * @brief Whether a body is currently inside a trigger volume
   *
   * Reflects the overlaps detected during the last step().
   */
  bool isOverlapping(uint32_t triggerId, uint32_t bodyId) const;

  // ========== Listeners ==========

  /**
   * @brief Register a trigger listener (non-owning)
   *
   * Adding the same listener twice has no effect.
   */
  void addTriggerListener(TriggerListener* listener);

  void removeTriggerListener(TriggerListener* listener);

  // ========== Simulation ==========

  /**
   * @brief Advance the simulation
   * @param dt Timestep [s]
   * @throws std::invalid_argument if dt is not positive and finite
   */
  void step(double dt);

  void setGravity(const Coordinate& gravity)
  {
    gravity_ = gravity;
  }

  const Coordinate& getGravity() const
  {
    return gravity_;
  }

  /**
   * @brief Total simulated time [s]
   */
  double getTime() const
  {
    return time_;
  }

private:
  using OverlapKey = std::pair<uint32_t, uint32_t>;  // (trigger, body)

  void dispatchTriggerEvents();

  void integrateBodies(double dt);

  void resolveEnvironmentPenetration(AssetInertial& body) const;

  void notify(const TriggerEvent& event);

  std::unique_ptr<Integrator> integrator_;

  std::deque<AssetInertial> inertialAssets_;
  std::deque<AssetEnvironment> environmentalAssets_;
  std::deque<AssetTrigger> triggerVolumes_;

  std::vector<TriggerListener*> listeners_;
  std::set<OverlapKey> activeOverlaps_;

  uint32_t nextInstanceId_{1};

  Coordinate gravity_{0.0, 0.0, -9.81};

  double time_{0.0};
};

}  // namespace impetus_sim

#endif  // IMPETUS_SIM_WORLD_MODEL_HPP
