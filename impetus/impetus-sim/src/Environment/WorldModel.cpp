#include "impetus-sim/src/Environment/WorldModel.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>

#include "impetus-sim/src/Physics/Integration/SemiImplicitEulerIntegrator.hpp"

namespace impetus_sim
{

namespace
{

template <typename Container>
auto findById(Container& assets, uint32_t instanceId)
  -> decltype(&assets.front())
{
  auto it = std::find_if(assets.begin(),
                         assets.end(),
                         [instanceId](const auto& asset)
                         { return asset.getInstanceId() == instanceId; });
  return it != assets.end() ? &(*it) : nullptr;
}

}  // namespace

WorldModel::WorldModel()
  : integrator_{std::make_unique<SemiImplicitEulerIntegrator>()}
{
}

WorldModel::WorldModel(std::unique_ptr<Integrator> integrator)
  : integrator_{std::move(integrator)}
{
  if (!integrator_)
  {
    throw std::invalid_argument("WorldModel requires a non-null integrator");
  }
}

// ========== Spawning ==========

AssetInertial& WorldModel::spawnInertialObject(
  const ReferenceFrame& frame,
  double mass,
  std::optional<BoxCollider> collider)
{
  // Construct first so a bad mass does not consume an id
  AssetInertial asset{nextInstanceId_, mass, frame, std::move(collider)};
  ++nextInstanceId_;
  return inertialAssets_.emplace_back(std::move(asset));
}

const AssetEnvironment& WorldModel::spawnEnvironmentObject(
  const ReferenceFrame& frame,
  const BoxCollider& collider)
{
  return environmentalAssets_.emplace_back(nextInstanceId_++, frame, collider);
}

const AssetTrigger& WorldModel::spawnTriggerVolume(const ReferenceFrame& frame,
                                                   const BoxCollider& volume)
{
  return triggerVolumes_.emplace_back(nextInstanceId_++, frame, volume);
}

// ========== Lookup ==========

AssetInertial* WorldModel::findInertial(uint32_t instanceId)
{
  return findById(inertialAssets_, instanceId);
}

const AssetInertial* WorldModel::findInertial(uint32_t instanceId) const
{
  return findById(inertialAssets_, instanceId);
}

AssetInertial& WorldModel::getInertial(uint32_t instanceId)
{
  AssetInertial* asset = findInertial(instanceId);
  if (asset == nullptr)
  {
    throw std::out_of_range("No inertial object with instance id " +
                            std::to_string(instanceId));
  }
  return *asset;
}

const AssetInertial& WorldModel::getInertial(uint32_t instanceId) const
{
  const AssetInertial* asset = findInertial(instanceId);
  if (asset == nullptr)
  {
    throw std::out_of_range("No inertial object with instance id " +
                            std::to_string(instanceId));
  }
  return *asset;
}

const AssetTrigger* WorldModel::findTrigger(uint32_t instanceId) const
{
  return findById(triggerVolumes_, instanceId);
}

const ReferenceFrame* WorldModel::findFrame(uint32_t instanceId) const
{
  if (const auto* inertial = findById(inertialAssets_, instanceId))
  {
    return &inertial->getReferenceFrame();
  }
  if (const auto* environment = findById(environmentalAssets_, instanceId))
  {
    return &environment->getReferenceFrame();
  }
  if (const auto* trigger = findById(triggerVolumes_, instanceId))
  {
    return &trigger->getReferenceFrame();
  }
  return nullptr;
}

// ========== Queries ==========

std::optional<RaycastHit> WorldModel::raycast(
  const Coordinate& origin,
  const Coordinate& direction,
  double maxDistance,
  std::optional<uint32_t> ignoreId) const
{
  double const length = direction.norm();
  if (length == 0.0)
  {
    return std::nullopt;
  }
  Coordinate const unitDir = direction / length;

  std::optional<RaycastHit> closest;
  auto test = [&](const AssetPhysical& asset)
  {
    if (!asset.hasCollider() ||
        (ignoreId && *ignoreId == asset.getInstanceId()))
    {
      return;
    }
    double const limit = closest ? closest->distance : maxDistance;
    auto distance = asset.getCollider()->intersectRay(
      asset.getReferenceFrame(), origin, unitDir, limit);
    if (distance)
    {
      closest = RaycastHit{asset.getInstanceId(),
                           *distance,
                           Coordinate{origin + unitDir * (*distance)}};
    }
  };

  for (const auto& asset : environmentalAssets_)
  {
    test(asset);
  }
  for (const auto& asset : inertialAssets_)
  {
    test(asset);
  }

  return closest;
}

bool WorldModel::isOverlapping(uint32_t triggerId, uint32_t bodyId) const
{
  return activeOverlaps_.count(OverlapKey{triggerId, bodyId}) > 0;
}

// ========== Listeners ==========

void WorldModel::addTriggerListener(TriggerListener* listener)
{
  if (listener == nullptr ||
      std::find(listeners_.begin(), listeners_.end(), listener) !=
        listeners_.end())
  {
    return;
  }
  listeners_.push_back(listener);
}

void WorldModel::removeTriggerListener(TriggerListener* listener)
{
  listeners_.erase(std::remove(listeners_.begin(), listeners_.end(), listener),
                   listeners_.end());
}

// ========== Simulation ==========

void WorldModel::step(double dt)
{
  if (!std::isfinite(dt) || dt <= 0.0)
  {
    throw std::invalid_argument("Timestep must be positive and finite, got: " +
                                std::to_string(dt));
  }

  dispatchTriggerEvents();
  integrateBodies(dt);
  time_ += dt;
}

void WorldModel::dispatchTriggerEvents()
{
  std::set<OverlapKey> current;
  for (const auto& trigger : triggerVolumes_)
  {
    for (const auto& body : inertialAssets_)
    {
      if (!body.hasCollider())
      {
        continue;
      }
      if (trigger.getVolume().overlaps(trigger.getReferenceFrame(),
                                       *body.getCollider(),
                                       body.getReferenceFrame()))
      {
        current.emplace(trigger.getInstanceId(), body.getInstanceId());
      }
    }
  }

  for (const auto& key : activeOverlaps_)
  {
    if (current.count(key) == 0)
    {
      spdlog::debug("WorldModel: body {} left trigger {}", key.second, key.first);
      notify(TriggerEvent{TriggerPhase::Exit, key.first, key.second});
    }
  }
  for (const auto& key : current)
  {
    if (activeOverlaps_.count(key) == 0)
    {
      spdlog::debug("WorldModel: body {} entered trigger {}", key.second, key.first);
      notify(TriggerEvent{TriggerPhase::Enter, key.first, key.second});
    }
  }
  for (const auto& key : current)
  {
    notify(TriggerEvent{TriggerPhase::Stay, key.first, key.second});
  }

  activeOverlaps_ = std::move(current);
}

void WorldModel::notify(const TriggerEvent& event)
{
  for (TriggerListener* listener : listeners_)
  {
    switch (event.phase)
    {
      case TriggerPhase::Enter:
        listener->onTriggerEnter(event);
        break;
      case TriggerPhase::Stay:
        listener->onTriggerStay(event);
        break;
      case TriggerPhase::Exit:
        listener->onTriggerExit(event);
        break;
    }
  }
}

void WorldModel::integrateBodies(double dt)
{
  for (auto& body : inertialAssets_)
  {
    BodyLoads const loads{
      body.getAccumulatedForce() + gravity_ * body.getMass(),
      body.getAccumulatedTorque(),
      1.0 / body.getMass(),
      body.getWorldInverseInertiaTensor()};

    integrator_->step(body.getInertialState(), loads, dt);
    body.syncReferenceFrame();

    resolveEnvironmentPenetration(body);

    body.clearForces();
  }
}

void WorldModel::resolveEnvironmentPenetration(AssetInertial& body) const
{
  if (!body.hasCollider())
  {
    return;
  }

  for (const auto& solid : environmentalAssets_)
  {
    InertialState& state = body.getInertialState();
    Coordinate const bodyExtents =
      body.getCollider()->worldHalfExtents(body.getReferenceFrame());
    Coordinate const solidExtents =
      solid.getCollider()->worldHalfExtents(solid.getReferenceFrame());
    Coordinate const offset = state.position - solid.getReferenceFrame().getOrigin();

    Eigen::Vector3d const penetration =
      (bodyExtents + solidExtents) - offset.cwiseAbs();
    if ((penetration.array() <= 0.0).any())
    {
      continue;
    }

    // Push out along the axis of least penetration
    Eigen::Index axis = 0;
    penetration.minCoeff(&axis);
    double const sign = offset[axis] >= 0.0 ? 1.0 : -1.0;
    state.position[axis] += sign * penetration[axis];

    // Remove the velocity component into the surface
    if (state.velocity[axis] * sign < 0.0)
    {
      state.velocity[axis] = 0.0;
    }
    body.syncReferenceFrame();

    spdlog::trace("WorldModel: body {} pushed out of solid {} along axis {} by {}",
                  body.getInstanceId(),
                  solid.getInstanceId(),
                  axis,
                  penetration[axis]);
  }
}

}  // namespace impetus_sim
