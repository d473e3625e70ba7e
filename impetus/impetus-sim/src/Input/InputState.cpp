#include "impetus-sim/src/Input/InputState.hpp"

namespace impetus_sim
{

void InputState::updateKey(KeyCode key, bool pressed)
{
  KeyState& state = keys_[key];
  if (pressed == state.pressed)
  {
    return;
  }

  state.pressed = pressed;
  if (pressed)
  {
    state.pressFrame = frame_;
    state.pressTime = now_;
  }
}

const KeyState* InputState::find(KeyCode key) const
{
  auto it = keys_.find(key);
  return it != keys_.end() ? &it->second : nullptr;
}

bool InputState::isKeyHeld(KeyCode key) const
{
  const KeyState* state = find(key);
  return state != nullptr && state->pressed;
}

bool InputState::isKeyJustPressed(KeyCode key) const
{
  const KeyState* state = find(key);
  return state != nullptr && state->pressFrame == frame_;
}

std::chrono::milliseconds InputState::getKeyHoldDuration(KeyCode key) const
{
  const KeyState* state = find(key);
  if (state == nullptr || !state->pressed)
  {
    return std::chrono::milliseconds{0};
  }
  return now_ - state->pressTime;
}

void InputState::update(std::chrono::milliseconds deltaTime)
{
  now_ += deltaTime;
  ++frame_;
}

void InputState::reset()
{
  keys_.clear();
  now_ = std::chrono::milliseconds{0};
  frame_ = 0;
}

}  // namespace impetus_sim
