#include "impetus-sim/src/Forces/ForceRuleEvaluator.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <stdexcept>
#include <string>
#include <utility>

#include "impetus-sim/src/DataTypes/WorldAxes.hpp"
#include "impetus-sim/src/Environment/WorldModel.hpp"
#include "impetus-sim/src/Physics/RigidBody/AssetInertial.hpp"

namespace impetus_sim
{

namespace
{

void checkIndex(std::size_t index, std::size_t count)
{
  if (index >= count)
  {
    throw std::out_of_range("Force rule index " + std::to_string(index) +
                            " out of range, rule count: " +
                            std::to_string(count));
  }
}

}  // namespace

ForceRuleEvaluator::ForceRuleEvaluator(WorldModel& world,
                                       uint32_t ownerId,
                                       std::vector<ForceRule> rules)
  : world_{world},
    ownerId_{ownerId},
    rules_{std::move(rules)},
    active_(rules_.size(), false)
{
  for (std::size_t i = 0; i < rules_.size(); ++i)
  {
    const ForceRule& rule = rules_[i];
    if (rule.strength < 0.0)
    {
      spdlog::warn("ForceRuleEvaluator: rule {} has negative strength {}, "
                   "force will point against its direction",
                   i,
                   rule.strength);
    }
    if (rule.speedCap <= 0.0)
    {
      spdlog::warn("ForceRuleEvaluator: rule {} has speed cap {}, it can "
                   "never fire",
                   i,
                   rule.speedCap);
    }
    if (!rule.triggerKey && !rule.triggerObject)
    {
      spdlog::warn("ForceRuleEvaluator: rule {} has neither a trigger key "
                   "nor a trigger object",
                   i);
    }
  }

  if (world_.findInertial(ownerId_) == nullptr)
  {
    spdlog::warn("ForceRuleEvaluator: owner {} is not a dynamic body, "
                 "rules will not be applied",
                 ownerId_);
  }

  world_.addTriggerListener(this);
}

ForceRuleEvaluator::~ForceRuleEvaluator()
{
  world_.removeTriggerListener(this);
}

void ForceRuleEvaluator::update(const InputState& input)
{
  grounded_ = checkGrounded();
  std::fill(active_.begin(), active_.end(), false);

  AssetInertial* owner = world_.findInertial(ownerId_);
  if (owner == nullptr)
  {
    return;
  }

  for (std::size_t i = 0; i < rules_.size(); ++i)
  {
    const ForceRule& rule = rules_[i];
    if (!rule.triggerKey)
    {
      continue;
    }

    bool fired = false;
    ForceMode mode = ForceMode::Force;
    if (rule.continuous && input.isKeyHeld(*rule.triggerKey))
    {
      fired = true;
    }
    else if (!rule.continuous && input.isKeyJustPressed(*rule.triggerKey))
    {
      fired = true;
      mode = ForceMode::Impulse;
    }

    if (fired && passesGates(rule, *owner))
    {
      apply(i, *owner, mode);
    }
  }
}

void ForceRuleEvaluator::onTriggerEnter(const TriggerEvent& event)
{
  fireTriggerRules(event, false);
}

void ForceRuleEvaluator::onTriggerStay(const TriggerEvent& event)
{
  fireTriggerRules(event, true);
}

void ForceRuleEvaluator::fireTriggerRules(const TriggerEvent& event,
                                          bool continuous)
{
  if (event.bodyId != ownerId_)
  {
    return;
  }

  AssetInertial* owner = world_.findInertial(ownerId_);
  if (owner == nullptr)
  {
    return;
  }

  ForceMode const mode = continuous ? ForceMode::Force : ForceMode::Impulse;
  for (std::size_t i = 0; i < rules_.size(); ++i)
  {
    const ForceRule& rule = rules_[i];
    if (rule.continuous != continuous || !rule.triggerObject ||
        *rule.triggerObject != event.triggerId)
    {
      continue;
    }
    if (passesGates(rule, *owner))
    {
      apply(i, *owner, mode);
    }
  }
}

bool ForceRuleEvaluator::checkGrounded() const
{
  const AssetInertial* owner = world_.findInertial(ownerId_);
  if (owner == nullptr || !owner->hasCollider())
  {
    return false;
  }

  const ReferenceFrame& frame = owner->getReferenceFrame();
  double const probeLength =
    owner->getCollider()->worldHalfExtents(frame).z() + kGroundProbeMargin;

  return world_
    .raycast(frame.getOrigin(), WorldAxes::down(), probeLength, ownerId_)
    .has_value();
}

bool ForceRuleEvaluator::passesGates(const ForceRule& rule,
                                     const AssetInertial& owner) const
{
  if (rule.requiresGrounded && !grounded_)
  {
    return false;
  }
  return owner.getSpeed() < rule.speedCap;
}

void ForceRuleEvaluator::apply(std::size_t index,
                               AssetInertial& owner,
                               ForceMode mode)
{
  const ForceRule& rule = rules_[index];
  Coordinate const direction = resolveDirection(index);

  if (rule.kind == ForceKind::Torque)
  {
    owner.addTorque(TorqueVector{direction * rule.strength}, mode);
  }
  else
  {
    owner.addForceAtPosition(
      ForceVector{direction * rule.strength}, resolveOrigin(index), mode);
  }
  active_[index] = true;

  spdlog::debug("ForceRuleEvaluator: owner {} rule {} fired as {} ({} along "
                "[{}, {}, {}])",
                ownerId_,
                index,
                mode == ForceMode::Impulse ? "impulse" : "force",
                rule.strength,
                direction.x(),
                direction.y(),
                direction.z());
}

// ========== Queries ==========

bool ForceRuleEvaluator::isActive(std::size_t index) const
{
  checkIndex(index, rules_.size());
  return active_[index];
}

Coordinate ForceRuleEvaluator::resolveDirection(std::size_t index) const
{
  checkIndex(index, rules_.size());
  const ForceRule& rule = rules_[index];

  Coordinate const unit = rule.direction.normalizedOrZero();
  if (rule.relativeToOwner)
  {
    if (const ReferenceFrame* frame = world_.findFrame(ownerId_))
    {
      return frame->localToGlobalRelative(unit);
    }
  }
  return unit;
}

Coordinate ForceRuleEvaluator::resolveOrigin(std::size_t index) const
{
  checkIndex(index, rules_.size());
  const ForceRule& rule = rules_[index];

  if (rule.originOverride)
  {
    if (const ReferenceFrame* frame = world_.findFrame(*rule.originOverride))
    {
      return frame->getOrigin();
    }
  }
  if (const ReferenceFrame* frame = world_.findFrame(ownerId_))
  {
    return frame->getOrigin();
  }
  return Coordinate{0.0, 0.0, 0.0};
}

ForceVisualization ForceRuleEvaluator::visualize(std::size_t index) const
{
  checkIndex(index, rules_.size());
  const ForceRule& rule = rules_[index];
  return ForceVisualization{rule.kind,
                            resolveOrigin(index),
                            resolveDirection(index),
                            rule.strength,
                            active_[index]};
}

std::vector<ForceVisualization> ForceRuleEvaluator::visualizeAll() const
{
  std::vector<ForceVisualization> result;
  result.reserve(rules_.size());
  for (std::size_t i = 0; i < rules_.size(); ++i)
  {
    result.push_back(visualize(i));
  }
  return result;
}

}  // namespace impetus_sim
