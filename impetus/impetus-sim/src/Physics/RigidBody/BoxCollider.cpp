#include "impetus-sim/src/Physics/RigidBody/BoxCollider.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>
#include <string>
#include <utility>

namespace impetus_sim
{

namespace
{

// Guards the cross-product axes against near-parallel edges
constexpr double kParallelEpsilon = 1e-9;

}  // namespace

BoxCollider::BoxCollider(const Coordinate& halfExtents)
  : halfExtents_{halfExtents}
{
  for (Eigen::Index i = 0; i < 3; ++i)
  {
    if (!std::isfinite(halfExtents_[i]) || halfExtents_[i] <= 0.0)
    {
      throw std::invalid_argument(
        "Box half extents must be positive and finite, got: " +
        std::to_string(halfExtents_[i]) + " on axis " + std::to_string(i));
    }
  }
}

Coordinate BoxCollider::worldHalfExtents(const ReferenceFrame& frame) const
{
  return frame.getRotation().cwiseAbs() * halfExtents_;
}

bool BoxCollider::contains(const ReferenceFrame& frame,
                           const Coordinate& point) const
{
  Coordinate local = frame.globalToLocal(point);
  return (local.cwiseAbs().array() <= halfExtents_.array()).all();
}

std::optional<double> BoxCollider::intersectRay(const ReferenceFrame& frame,
                                                const Coordinate& origin,
                                                const Coordinate& direction,
                                                double maxDistance) const
{
  double const length = direction.norm();
  if (length == 0.0 || maxDistance < 0.0)
  {
    return std::nullopt;
  }

  Coordinate localOrigin = frame.globalToLocal(origin);
  if ((localOrigin.cwiseAbs().array() < halfExtents_.array()).all())
  {
    return std::nullopt;
  }

  Coordinate localDir = frame.globalToLocalRelative(direction / length);

  double tMin = 0.0;
  double tMax = maxDistance;
  for (Eigen::Index i = 0; i < 3; ++i)
  {
    if (std::abs(localDir[i]) < std::numeric_limits<double>::epsilon())
    {
      // Parallel to this slab: must already be between the planes
      if (std::abs(localOrigin[i]) > halfExtents_[i])
      {
        return std::nullopt;
      }
      continue;
    }

    double const inv = 1.0 / localDir[i];
    double t1 = (-halfExtents_[i] - localOrigin[i]) * inv;
    double t2 = (halfExtents_[i] - localOrigin[i]) * inv;
    if (t1 > t2)
    {
      std::swap(t1, t2);
    }

    tMin = std::max(tMin, t1);
    tMax = std::min(tMax, t2);
    if (tMin > tMax)
    {
      return std::nullopt;
    }
  }

  return tMin;
}

bool BoxCollider::overlaps(const ReferenceFrame& frame,
                           const BoxCollider& other,
                           const ReferenceFrame& otherFrame) const
{
  const Eigen::Vector3d& a = halfExtents_;
  const Eigen::Vector3d& b = other.halfExtents_;

  // Rotation of B expressed in A's frame, and B's centre in A's frame
  Eigen::Matrix3d const R =
    frame.getRotation().transpose() * otherFrame.getRotation();
  Eigen::Vector3d const t = frame.getRotation().transpose() *
                            (otherFrame.getOrigin() - frame.getOrigin());
  Eigen::Matrix3d const absR =
    R.cwiseAbs() + Eigen::Matrix3d::Constant(kParallelEpsilon);

  // Face normals of A
  for (int i = 0; i < 3; ++i)
  {
    double const ra = a[i];
    double const rb = b.dot(absR.row(i));
    if (std::abs(t[i]) > ra + rb)
    {
      return false;
    }
  }

  // Face normals of B
  for (int j = 0; j < 3; ++j)
  {
    double const ra = a.dot(absR.col(j));
    double const rb = b[j];
    if (std::abs(t.dot(R.col(j))) > ra + rb)
    {
      return false;
    }
  }

  // Edge-edge axes A_i x B_j
  for (int i = 0; i < 3; ++i)
  {
    int const i1 = (i + 1) % 3;
    int const i2 = (i + 2) % 3;
    for (int j = 0; j < 3; ++j)
    {
      int const j1 = (j + 1) % 3;
      int const j2 = (j + 2) % 3;

      double const ra = a[i1] * absR(i2, j) + a[i2] * absR(i1, j);
      double const rb = b[j1] * absR(i, j2) + b[j2] * absR(i, j1);
      double const dist = std::abs(t[i2] * R(i1, j) - t[i1] * R(i2, j));
      if (dist > ra + rb)
      {
        return false;
      }
    }
  }

  return true;
}

}  // namespace impetus_sim
