#ifndef IMPETUS_SIM_INERTIAL_STATE_HPP
#define IMPETUS_SIM_INERTIAL_STATE_HPP

#include <Eigen/Geometry>

#include "impetus-sim/src/DataTypes/Coordinate.hpp"

namespace impetus_sim
{

/**
 * @brief Complete kinematic state of a rigid body.
 *
 * Contains position, velocity, and acceleration for both linear and angular
 * motion, all expressed in the world frame. Orientation uses a unit
 * quaternion to avoid gimbal lock.
 */
struct InertialState
{
  // Linear components
  Coordinate position;
  Coordinate velocity;
  Coordinate acceleration;

  // Angular components
  Eigen::Quaterniond orientation{1.0, 0.0, 0.0, 0.0};  // Identity (w, x, y, z)
  Coordinate angularVelocity;                         // ω [rad/s]
  Coordinate angularAcceleration;                     // α = I⁻¹ * τ [rad/s²]

  /**
   * @brief Linear speed |v| [m/s]
   */
  [[nodiscard]] double speed() const
  {
    return velocity.norm();
  }
};

}  // namespace impetus_sim

#endif  // IMPETUS_SIM_INERTIAL_STATE_HPP
