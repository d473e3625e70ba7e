#ifndef IMPETUS_SIM_PHYSICS_INTEGRATOR_HPP
#define IMPETUS_SIM_PHYSICS_INTEGRATOR_HPP

#include <Eigen/Dense>

#include "impetus-sim/src/DataTypes/ForceVector.hpp"
#include "impetus-sim/src/DataTypes/TorqueVector.hpp"
#include "impetus-sim/src/Physics/RigidBody/InertialState.hpp"

namespace impetus_sim
{

/**
 * @brief Loads and mass properties held constant over one integration step
 *
 * Everything is expressed in the world frame. Gravity is already folded
 * into force.
 */
struct BodyLoads
{
  ForceVector force;                                         ///< [N]
  TorqueVector torque;                                       ///< [N·m]
  double inverseMass{0.0};                                   ///< [1/kg]
  Eigen::Matrix3d inverseInertia{Eigen::Matrix3d::Zero()};  ///< [1/(kg·m²)]
};

/**
 * @brief Time-stepping scheme for rigid body motion
 *
 * WorldModel owns one instance and calls it once per body per step.
 * Implementations keep no per-body state.
 */
class Integrator
{
public:
  virtual ~Integrator() = default;

  /**
   * @brief Advance a body's kinematic state
   * @param state Kinematic state, updated in place
   * @param loads Net loads and inverse mass properties
   * @param dt Step length [s]
   */
  virtual void step(InertialState& state,
                    const BodyLoads& loads,
                    double dt) const = 0;
};

}  // namespace impetus_sim

#endif  // IMPETUS_SIM_PHYSICS_INTEGRATOR_HPP
