#ifndef IMPETUS_SIM_INPUT_STATE_HPP
#define IMPETUS_SIM_INPUT_STATE_HPP

#include <chrono>
#include <cstdint>
#include <optional>
#include <unordered_map>

namespace impetus_sim
{

/**
 * @brief Keyboard key identifier
 *
 * Layout-compatible with SDL_Keycode so a windowing front end can forward
 * its key events unchanged.
 */
using KeyCode = std::uint32_t;

/**
 * @brief Per-key record
 *
 * A key is "just" pressed while pressFrame equals the input's current frame
 * number. Releasing the key keeps pressFrame, so a tap that goes down and up
 * inside one frame still registers.
 */
struct KeyState
{
  bool pressed{false};
  std::optional<std::uint64_t> pressFrame;  // Frame of the latest key down
  std::chrono::milliseconds pressTime{0};   // Input clock at the press
};

/**
 * @brief Keyboard state shared by every force component in a frame
 *
 * The front end feeds events with updateKey(). During a frame, components
 * read isKeyHeld() for continuous rules and isKeyJustPressed() for one-shot
 * rules. The owner ends the frame with update(), which advances the clock
 * and the frame number; presses from the ended frame are no longer "just"
 * pressed.
 *
 * @note Not thread-safe, single-threaded simulation assumed.
 */
class InputState
{
public:
  /**
   * @brief Record a key event
   * @param key The key code
   * @param pressed True on key down, false on key up
   *
   * A key-down for a key already held (auto repeat) is ignored, so it does
   * not start a new press.
   */
  void updateKey(KeyCode key, bool pressed);

  [[nodiscard]] bool isKeyHeld(KeyCode key) const;

  /**
   * @brief True if the key went down during the current frame
   *
   * Stays true for the rest of the frame even if the key was released
   * again.
   */
  [[nodiscard]] bool isKeyJustPressed(KeyCode key) const;

  /**
   * @brief Input clock time since the current press began
   * @return Zero if the key is not held
   */
  [[nodiscard]] std::chrono::milliseconds getKeyHoldDuration(KeyCode key) const;

  /**
   * @brief End the current frame
   * @param deltaTime Duration of the frame that ended
   */
  void update(std::chrono::milliseconds deltaTime);

  /**
   * @brief Release every key and rewind the clock and frame counter
   */
  void reset();

  [[nodiscard]] std::uint64_t getFrame() const
  {
    return frame_;
  }

private:
  const KeyState* find(KeyCode key) const;

  std::unordered_map<KeyCode, KeyState> keys_;
  std::chrono::milliseconds now_{0};
  std::uint64_t frame_{0};
};

}  // namespace impetus_sim

#endif  // IMPETUS_SIM_INPUT_STATE_HPP
