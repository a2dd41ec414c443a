#include "localderiv/stencil/stencil.hpp"
#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <format>

namespace localderiv::stencil {

auto to_string(DifferenceKind kind) noexcept -> std::string_view {
  switch (kind) {
  case DifferenceKind::Central:
    return "central";
  case DifferenceKind::Forward:
    return "forward";
  case DifferenceKind::Backward:
    return "backward";
  }
  return "unknown";
}

auto to_string(Derivative derivative) noexcept -> std::string_view {
  switch (derivative) {
  case Derivative::First:
    return "first";
  case Derivative::Second:
    return "second";
  }
  return "unknown";
}

Stencil::Stencil(Derivative derivative, DifferenceKind kind, int order, std::int64_t divisor, std::vector<Tap> taps)
    : derivative_(derivative), kind_(kind), order_(order), divisor_(divisor) {
  std::erase_if(taps, [](const Tap& tap) { return tap.numerator == 0; });
  std::ranges::sort(taps, {}, &Tap::offset);
  taps_ = std::move(taps);

  for (const auto& tap : taps_) {
    min_offset_ = std::min(min_offset_, tap.offset);
    max_offset_ = std::max(max_offset_, tap.offset);
  }
}

auto Stencil::reach() const noexcept -> core::Index { return std::max(-min_offset_, max_offset_); }

auto Stencil::mirrored(DifferenceKind kind) const -> Stencil {
  std::vector<Tap> taps;
  taps.reserve(taps_.size());
  for (const auto& tap : taps_) {
    // f'(x) changes sign under x -> -x; f''(x) does not.
    const auto sign = derivative_ == Derivative::First ? -1 : 1;
    taps.push_back(Tap{-tap.offset, sign * tap.numerator});
  }
  return Stencil(derivative_, kind, order_, divisor_, std::move(taps));
}

auto Stencil::moment(int k) const -> double {
  double sum = 0.0;
  for (const auto& tap : taps_) {
    sum += static_cast<double>(tap.numerator) * std::pow(static_cast<double>(tap.offset), k);
  }
  return sum / static_cast<double>(divisor_);
}

auto Stencil::to_string() const -> std::string {
  std::string taps;
  for (const auto& tap : taps_) {
    taps += std::format("{}({:+}: {}/{})", taps.empty() ? "" : " ", tap.offset, tap.numerator, divisor_);
  }
  return std::format("{} derivative, {} difference, order {}: {}", stencil::to_string(derivative_),
                     stencil::to_string(kind_), order_, taps);
}

} // namespace localderiv::stencil
