#include "impetus-sim/src/Engine.hpp"

#include <spdlog/spdlog.h>

#include <stdexcept>
#include <string>
#include <utility>

namespace impetus_sim
{

Engine::Engine() : worldModel_{}
{
}

void Engine::update(std::chrono::milliseconds simTime)
{
  // The first frame integrates from t = 0
  std::chrono::milliseconds const previous =
    lastUpdateTime_.value_or(std::chrono::milliseconds{0});
  if (simTime < previous)
  {
    throw std::invalid_argument(
      "Simulation time must not go backwards, got: " +
      std::to_string(simTime.count()) +
      " ms after: " + std::to_string(previous.count()) + " ms");
  }

  lastUpdateTime_ = simTime;
  auto const delta = simTime - previous;
  if (delta.count() == 0)
  {
    return;
  }

  for (auto& evaluator : evaluators_)
  {
    evaluator->update(inputState_);
  }

  double const elapsedSeconds =
    std::chrono::duration<double>(simTime).count();
  for (auto& windZone : windZones_)
  {
    windZone->update(elapsedSeconds);
  }

  worldModel_.step(std::chrono::duration<double>(delta).count());

  inputState_.update(delta);
}

void Engine::setKeyState(KeyCode key, bool pressed)
{
  inputState_.updateKey(key, pressed);
}

ForceRuleEvaluator& Engine::addForceRuleEvaluator(uint32_t ownerId,
                                                  std::vector<ForceRule> rules)
{
  spdlog::debug("Engine: adding {} force rules for body {}",
                rules.size(),
                ownerId);
  return *evaluators_.emplace_back(std::make_unique<ForceRuleEvaluator>(
    worldModel_, ownerId, std::move(rules)));
}

WindZone& Engine::addWindZone(uint32_t triggerId,
                              const WindZoneConfig& config,
                              std::shared_ptr<const NoiseSource> noise)
{
  return *windZones_.emplace_back(std::make_unique<WindZone>(
    worldModel_, triggerId, config, std::move(noise)));
}

}  // namespace impetus_sim
