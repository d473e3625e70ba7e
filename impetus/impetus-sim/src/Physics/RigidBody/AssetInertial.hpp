#ifndef IMPETUS_SIM_PHYSICS_INERTIAL_ASSET_HPP
#define IMPETUS_SIM_PHYSICS_INERTIAL_ASSET_HPP

#include <Eigen/Dense>
#include <optional>

#include "impetus-sim/src/DataTypes/Coordinate.hpp"
#include "impetus-sim/src/DataTypes/ForceVector.hpp"
#include "impetus-sim/src/DataTypes/TorqueVector.hpp"
#include "impetus-sim/src/Physics/ForceMode.hpp"
#include "impetus-sim/src/Physics/RigidBody/AssetPhysical.hpp"
#include "impetus-sim/src/Physics/RigidBody/InertialState.hpp"

namespace impetus_sim
{

/**
 * @brief Dynamic object with full rigid body physics.
 *
 * AssetInertial extends AssetPhysical with mass, an inertia tensor about the
 * centre of mass (the frame origin), a kinematic state, and per-step force and
 * torque accumulators.
 *
 * Forces and torques are accumulated until the world integrates the step and
 * clears them. Impulses bypass the accumulators and change velocities
 * immediately.
 *
 * Usage pattern:
 * @code
 * AssetInertial crate{1, 20.0, ReferenceFrame{Coordinate{0, 0, 1}},
 *                     BoxCollider{Coordinate{0.5, 0.5, 0.5}}};
 *
 * crate.applyForceAtPoint(ForceVector{0, 10, 0}, Coordinate{0.5, 0, 1});
 * crate.applyImpulse(ForceVector{0, 0, 50});
 * @endcode
 */
class AssetInertial : public AssetPhysical
{
public:
  /**
   * @brief Construct a dynamic body
   *
   * The inertia tensor is computed from the collider as a solid box. Bodies
   * without a collider use a solid sphere of radius 0.5 m.
   *
   * @param instanceId Unique id within the world
   * @param mass Mass [kg]
   * @param frame Initial position and orientation
   * @param collider Optional collision box
   * @throws std::invalid_argument if mass <= 0
   */
  AssetInertial(uint32_t instanceId,
                double mass,
                const ReferenceFrame& frame,
                std::optional<BoxCollider> collider);

  // ========== Mass Properties ==========

  double getMass() const;

  /**
   * @brief Inertia tensor about the centre of mass in the body frame [kg⋅m²]
   */
  const Eigen::Matrix3d& getInertiaTensor() const;

  /**
   * @brief Inverse inertia tensor in the body frame [1/(kg⋅m²)]
   */
  const Eigen::Matrix3d& getInverseInertiaTensor() const;

  /**
   * @brief Inverse inertia tensor rotated into the world frame
   *
   * I_world⁻¹ = R I_body⁻¹ Rᵀ
   */
  Eigen::Matrix3d getWorldInverseInertiaTensor() const;

  // ========== Kinematic State ==========

  const InertialState& getInertialState() const;

  /**
   * @brief Mutable state, used by the integrator.
   *
   * Call syncReferenceFrame() after changing position or orientation.
   */
  InertialState& getInertialState();

  /**
   * @brief Copy position and orientation from the state into the frame
   */
  void syncReferenceFrame();

  void setLinearVelocity(const Coordinate& velocity);

  /**
   * @brief Current linear speed [m/s]
   */
  double getSpeed() const;

  // ========== Force and Torque Application ==========

  /**
   * @brief Accumulate a force through the centre of mass (no torque)
   * @param force Force in world frame [N]
   */
  void applyForce(const ForceVector& force);

  /**
   * @brief Accumulate a force applied at a world-space point
   *
   * Adds the force plus the induced torque τ = r × F, with r measured from
   * the centre of mass.
   *
   * @param force Force in world frame [N]
   * @param worldPoint Application point in world frame [m]
   */
  void applyForceAtPoint(const ForceVector& force, const Coordinate& worldPoint);

  /**
   * @brief Accumulate a pure torque
   * @param torque Torque in world frame [N⋅m]
   */
  void applyTorque(const TorqueVector& torque);

  /**
   * @brief Apply a linear impulse through the centre of mass: Δv = J / m
   * @param impulse Impulse in world frame [N⋅s]
   */
  void applyImpulse(const ForceVector& impulse);

  /**
   * @brief Apply a linear impulse at a world-space point
   *
   * Δv = J / m and Δω = I⁻¹ (r × J).
   */
  void applyImpulseAtPoint(const ForceVector& impulse,
                           const Coordinate& worldPoint);

  /**
   * @brief Apply an angular impulse: Δω = I⁻¹ L
   * @param impulse Angular impulse in world frame [N⋅m⋅s]
   */
  void applyAngularImpulse(const TorqueVector& impulse);

  /**
   * @brief Force or impulse at a world point, selected by mode
   */
  void addForceAtPosition(const ForceVector& force,
                          const Coordinate& worldPoint,
                          ForceMode mode);

  /**
   * @brief Torque or angular impulse, selected by mode
   */
  void addTorque(const TorqueVector& torque, ForceMode mode);

  const ForceVector& getAccumulatedForce() const;

  const TorqueVector& getAccumulatedTorque() const;

  /**
   * @brief Reset the force and torque accumulators to zero
   */
  void clearForces();

private:
  double mass_;
  Eigen::Matrix3d inertiaTensor_;
  Eigen::Matrix3d inverseInertiaTensor_;

  InertialState state_;

  ForceVector accumulatedForce_;
  TorqueVector accumulatedTorque_;
};

}  // namespace impetus_sim

#endif  // IMPETUS_SIM_PHYSICS_INERTIAL_ASSET_HPP
