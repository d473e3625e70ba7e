#ifndef IMPETUS_SIM_PHYSICS_BOX_COLLIDER_HPP
#define IMPETUS_SIM_PHYSICS_BOX_COLLIDER_HPP

#include <optional>

#include "impetus-sim/src/DataTypes/Coordinate.hpp"
#include "impetus-sim/src/Environment/ReferenceFrame.hpp"

namespace impetus_sim
{

/**
 * @brief Oriented box collision shape centred on its owner's frame origin
 *
 * The box is described by its half extents along the owner's local axes.
 * All queries take the owner's ReferenceFrame so the same collider can be
 * shared by objects at different poses.
 *
 * Usage:
 * @code
 * BoxCollider box{Coordinate{0.5, 0.5, 1.0}};
 * ReferenceFrame frame{Coordinate{0, 0, 1}};
 *
 * double halfHeight = box.worldHalfExtents(frame).z();
 * auto hit = box.intersectRay(frame, Coordinate{0, 0, 5}, WorldAxes::down(), 10.0);
 * @endcode
 */
class BoxCollider
{
public:
  /**
   * @brief Construct from half extents in the local frame [m]
   * @throws std::invalid_argument if any extent is non-positive or not finite
   */
  explicit BoxCollider(const Coordinate& halfExtents);

  const Coordinate& getHalfExtents() const
  {
    return halfExtents_;
  }

  /**
   * @brief Half extents of the world-space axis-aligned bounding box
   *
   * For an unrotated frame this equals getHalfExtents().
   */
  Coordinate worldHalfExtents(const ReferenceFrame& frame) const;

  /**
   * @brief Check whether a world-space point lies inside or on the box
   */
  bool contains(const ReferenceFrame& frame, const Coordinate& point) const;

  /**
   * @brief Intersect a world-space ray with the box (slab test)
   *
   * Rays that start inside the box report no hit.
   *
   * @param frame Pose of the box
   * @param origin Ray origin in world frame
   * @param direction Ray direction (need not be normalized, must be non-zero)
   * @param maxDistance Maximum distance along the normalized direction [m]
   * @return Distance to the entry point, or std::nullopt if no hit within
   *         maxDistance
   */
  std::optional<double> intersectRay(const ReferenceFrame& frame,
                                     const Coordinate& origin,
                                     const Coordinate& direction,
                                     double maxDistance) const;

  /**
   * @brief Oriented box overlap test (separating axis theorem)
   *
   * Tests the 15 candidate axes (3 face normals of each box plus the 9
   * edge cross products). Touching boxes count as overlapping.
   */
  bool overlaps(const ReferenceFrame& frame,
                const BoxCollider& other,
                const ReferenceFrame& otherFrame) const;

private:
  Coordinate halfExtents_;
};

}  // namespace impetus_sim

#endif  // IMPETUS_SIM_PHYSICS_BOX_COLLIDER_HPP
