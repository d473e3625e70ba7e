#include "impetus-sim/src/Environment/ReferenceFrame.hpp"

#include "impetus-sim/src/DataTypes/WorldAxes.hpp"

namespace impetus_sim
{

ReferenceFrame::ReferenceFrame(const Coordinate& origin,
                               const Eigen::Quaterniond& orientation)
  : origin_{origin}, orientation_{orientation.normalized()}
{
}

Coordinate ReferenceFrame::globalToLocal(const Coordinate& point) const
{
  return globalToLocalRelative(point - origin_);
}

Coordinate ReferenceFrame::localToGlobal(const Coordinate& point) const
{
  return localToGlobalRelative(point) + origin_;
}

Coordinate ReferenceFrame::globalToLocalRelative(
  const Coordinate& direction) const
{
  return orientation_.conjugate() * direction;
}

Coordinate ReferenceFrame::localToGlobalRelative(
  const Coordinate& direction) const
{
  return orientation_ * direction;
}

Coordinate ReferenceFrame::forward() const
{
  return localToGlobalRelative(WorldAxes::forward());
}

Coordinate ReferenceFrame::up() const
{
  return localToGlobalRelative(WorldAxes::up());
}

void ReferenceFrame::setOrigin(const Coordinate& origin)
{
  origin_ = origin;
}

void ReferenceFrame::setOrientation(const Eigen::Quaterniond& orientation)
{
  orientation_ = orientation.normalized();
}

}  // namespace impetus_sim
