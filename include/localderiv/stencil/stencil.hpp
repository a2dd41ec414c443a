#pragma once
#include "../core/containers.hpp"
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace localderiv::stencil {

enum class DifferenceKind { Central, Forward, Backward };

enum class Derivative { First = 1, Second = 2 };

[[nodiscard]] auto to_string(DifferenceKind kind) noexcept -> std::string_view;
[[nodiscard]] auto to_string(Derivative derivative) noexcept -> std::string_view;

// One sample of a 1-D formula: weight = numerator / Stencil::divisor().
struct Tap {
  core::Index offset;
  std::int64_t numerator;

  friend bool operator==(const Tap&, const Tap&) = default;
};

/**
 * @brief Immutable 1-D finite-difference formula.
 *
 * value = sum(numerator_i * f(x + offset_i)) / divisor
 *
 * Weights are kept as integer numerators over one common divisor so that every
 * coefficient is an exact rational. Zero-weight taps are dropped on construction,
 * which means no sample is ever read for them. The derivative is per unit grid
 * spacing.
 */
class Stencil {
private:
  Derivative derivative_;
  DifferenceKind kind_;
  int order_;
  std::int64_t divisor_;
  std::vector<Tap> taps_;
  core::Index min_offset_ = 0;
  core::Index max_offset_ = 0;

public:
  Stencil(Derivative derivative, DifferenceKind kind, int order, std::int64_t divisor, std::vector<Tap> taps);

  [[nodiscard]] auto derivative() const noexcept -> Derivative { return derivative_; }
  [[nodiscard]] auto kind() const noexcept -> DifferenceKind { return kind_; }
  [[nodiscard]] auto order() const noexcept -> int { return order_; }
  [[nodiscard]] auto divisor() const noexcept -> std::int64_t { return divisor_; }
  [[nodiscard]] auto taps() const noexcept -> std::span<const Tap> { return taps_; }
  [[nodiscard]] auto size() const noexcept -> std::size_t { return taps_.size(); }

  [[nodiscard]] auto weight(const Tap& tap) const noexcept -> double {
    return static_cast<double>(tap.numerator) / static_cast<double>(divisor_);
  }

  // Smallest and largest offset of any stored tap, 0 included.
  [[nodiscard]] auto min_offset() const noexcept -> core::Index { return min_offset_; }
  [[nodiscard]] auto max_offset() const noexcept -> core::Index { return max_offset_; }
  [[nodiscard]] auto reach() const noexcept -> core::Index;

  // Applies the formula to any callable mapping an offset to a sample value.
  template <typename Sampler>
  [[nodiscard]] auto apply(Sampler&& sample) const -> double {
    double accumulator = 0.0;
    for (const auto& tap : taps_) {
      accumulator += static_cast<double>(tap.numerator) * sample(tap.offset);
    }
    return accumulator / static_cast<double>(divisor_);
  }

  // Backward counterpart of a forward formula: offsets and numerators negated.
  [[nodiscard]] auto mirrored(DifferenceKind kind) const -> Stencil;

  // k-th discrete moment sum(numerator * offset^k) / divisor.
  [[nodiscard]] auto moment(int k) const -> double;

  [[nodiscard]] auto to_string() const -> std::string;
};

} // namespace localderiv::stencil
