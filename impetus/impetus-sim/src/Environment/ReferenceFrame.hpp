#ifndef IMPETUS_SIM_REFERENCE_FRAME_HPP
#define IMPETUS_SIM_REFERENCE_FRAME_HPP

#include <Eigen/Dense>
#include <Eigen/Geometry>

#include "impetus-sim/src/DataTypes/Coordinate.hpp"

namespace impetus_sim
{

/**
 * @brief Pose of a body or volume relative to the world frame
 *
 * Holds an origin and a unit quaternion mapping local vectors into the
 * world. Local axes follow WorldAxes (+X forward, +Y left, +Z up), so
 * forward() and up() are the body's facing and vertical directions.
 *
 * @code
 * ReferenceFrame tunnel{Coordinate{6, 0, 2},
 *                       Eigen::Quaterniond{Eigen::AngleAxisd{
 *                         std::numbers::pi / 2, Eigen::Vector3d::UnitZ()}}};
 * Coordinate blowing = tunnel.forward();  // (0, 1, 0)
 * @endcode
 */
class ReferenceFrame
{
public:
  /**
   * @param origin Frame origin in world coordinates
   * @param orientation Local-to-world rotation, normalized on entry
   */
  explicit ReferenceFrame(
    const Coordinate& origin = Coordinate{},
    const Eigen::Quaterniond& orientation = Eigen::Quaterniond::Identity());

  /// World point to local point.
  Coordinate globalToLocal(const Coordinate& point) const;

  /// Local point to world point.
  Coordinate localToGlobal(const Coordinate& point) const;

  /**
   * @brief Rotate a world-frame direction into the local frame
   *
   * The origin is ignored. Use for directions, velocities and forces.
   */
  Coordinate globalToLocalRelative(const Coordinate& direction) const;

  /**
   * @brief Rotate a local-frame direction into the world frame
   *
   * The origin is ignored. Use for directions, velocities and forces.
   */
  Coordinate localToGlobalRelative(const Coordinate& direction) const;

  Coordinate forward() const;
  Coordinate up() const;

  void setOrigin(const Coordinate& origin);

  /// @param orientation Local-to-world rotation, normalized on entry
  void setOrientation(const Eigen::Quaterniond& orientation);

  const Coordinate& getOrigin() const
  {
    return origin_;
  }

  const Eigen::Quaterniond& getOrientation() const
  {
    return orientation_;
  }

  /// Local-to-world rotation matrix.
  Eigen::Matrix3d getRotation() const
  {
    return orientation_.toRotationMatrix();
  }

private:
  Coordinate origin_;
  Eigen::Quaterniond orientation_;
};

}  // namespace impetus_sim

#endif  // IMPETUS_SIM_REFERENCE_FRAME_HPP
