#include "impetus-sim/src/Forces/WindZone.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <stdexcept>
#include <string>
#include <utility>

#include "impetus-sim/src/Environment/WorldModel.hpp"
#include "impetus-sim/src/Noise/PerlinNoise1D.hpp"
#include "impetus-sim/src/Physics/RigidBody/AssetInertial.hpp"
#include "impetus-sim/src/Physics/RigidBody/AssetTrigger.hpp"

namespace impetus_sim
{

WindZone::WindZone(WorldModel& world,
                   uint32_t triggerId,
                   WindZoneConfig config,
                   std::shared_ptr<const NoiseSource> noise)
  : world_{world},
    triggerId_{triggerId},
    config_{config},
    noise_{std::move(noise)},
    currentForce_{config.useVariation ? config.minForce : config.baseForce}
{
  if (world_.findTrigger(triggerId_) == nullptr)
  {
    throw std::invalid_argument("WindZone requires a trigger volume, got id: " +
                                std::to_string(triggerId_));
  }

  if (!noise_)
  {
    noise_ = std::make_shared<PerlinNoise1D>();
  }

  if (config_.minForce > config_.baseForce)
  {
    spdlog::warn("WindZone {}: minForce {} exceeds baseForce {}, variation "
                 "range is inverted",
                 triggerId_,
                 config_.minForce,
                 config_.baseForce);
  }

  world_.addTriggerListener(this);
}

WindZone::~WindZone()
{
  world_.removeTriggerListener(this);
}

void WindZone::update(double elapsedSeconds)
{
  pushed_ = false;
  if (!config_.useVariation)
  {
    return;
  }

  noiseValue_ = std::clamp(
    noise_->sample(elapsedSeconds * config_.variationFrequency), 0.0, 1.0);
  currentForce_ =
    config_.minForce + (config_.baseForce - config_.minForce) * noiseValue_;
}

void WindZone::onTriggerStay(const TriggerEvent& event)
{
  if (event.triggerId != triggerId_)
  {
    return;
  }

  AssetInertial* body = world_.findInertial(event.bodyId);
  if (body == nullptr)
  {
    return;
  }

  ForceVector const force = getForceVector();
  body->applyForce(force);
  pushed_ = true;

  spdlog::trace("WindZone {}: pushed body {} with {} N",
                triggerId_,
                event.bodyId,
                force.norm());
}

double WindZone::getCurrentForce() const
{
  return config_.useVariation ? currentForce_ : config_.baseForce;
}

ForceVector WindZone::getForceVector() const
{
  const AssetTrigger* trigger = world_.findTrigger(triggerId_);
  return ForceVector{trigger->getReferenceFrame().forward() *
                     getCurrentForce()};
}

ForceVisualization WindZone::visualize() const
{
  const ReferenceFrame& frame =
    world_.findTrigger(triggerId_)->getReferenceFrame();
  return ForceVisualization{ForceKind::Directional,
                            frame.getOrigin(),
                            frame.forward(),
                            getCurrentForce(),
                            pushed_};
}

}  // namespace impetus_sim
