#ifndef IMPETUS_SIM_NOISE_SOURCE_HPP
#define IMPETUS_SIM_NOISE_SOURCE_HPP

namespace impetus_sim
{

/**
 * @brief Deterministic, smooth scalar signal of one real variable
 *
 * Implementations must return values in [0, 1], produce the same output for
 * the same input, and be continuous in the input.
 */
class NoiseSource
{
public:
  virtual ~NoiseSource() = default;

  /**
   * @brief Sample the signal
   * @param x Sample coordinate (typically elapsed time times a frequency)
   * @return Value in [0, 1]
   */
  [[nodiscard]] virtual double sample(double x) const = 0;

protected:
  NoiseSource() = default;
  NoiseSource(const NoiseSource&) = default;
  NoiseSource& operator=(const NoiseSource&) = default;
  NoiseSource(NoiseSource&&) noexcept = default;
  NoiseSource& operator=(NoiseSource&&) noexcept = default;
};

}  // namespace impetus_sim

#endif  // IMPETUS_SIM_NOISE_SOURCE_HPP
