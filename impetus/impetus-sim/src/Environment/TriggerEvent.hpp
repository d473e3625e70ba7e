#ifndef IMPETUS_SIM_TRIGGER_EVENT_HPP
#define IMPETUS_SIM_TRIGGER_EVENT_HPP

#include <cstdint>

namespace impetus_sim
{

enum class TriggerPhase : std::uint8_t
{
  Enter,  ///< First step of an overlap
  Stay,   ///< Every step of an overlap, including the first
  Exit    ///< First step after an overlap ended
};

/**
 * @brief Overlap notification between a trigger volume and a dynamic body
 */
struct TriggerEvent
{
  TriggerPhase phase{TriggerPhase::Enter};
  uint32_t triggerId{0};
  uint32_t bodyId{0};
};

/**
 * @brief Receiver of trigger events from WorldModel
 *
 * Handlers run inside WorldModel::step() before integration, so forces
 * they accumulate act during the same step. Handlers must not add or remove
 * world objects or listeners.
 */
class TriggerListener
{
public:
  virtual ~TriggerListener() = default;

  virtual void onTriggerEnter(const TriggerEvent& /* event */)
  {
  }

  virtual void onTriggerStay(const TriggerEvent& /* event */)
  {
  }

  virtual void onTriggerExit(const TriggerEvent& /* event */)
  {
  }

protected:
  TriggerListener() = default;
  TriggerListener(const TriggerListener&) = default;
  TriggerListener& operator=(const TriggerListener&) = default;
  TriggerListener(TriggerListener&&) noexcept = default;
  TriggerListener& operator=(TriggerListener&&) noexcept = default;
};

}  // namespace impetus_sim

#endif  // IMPETUS_SIM_TRIGGER_EVENT_HPP
