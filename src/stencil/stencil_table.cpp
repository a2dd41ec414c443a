#include "localderiv/stencil/stencil_table.hpp"
#include "localderiv/core/constants.hpp"
#include <algorithm>
#include <format>
#include <map>
#include <tuple>

namespace localderiv::stencil {

namespace {

using Key = std::tuple<Derivative, DifferenceKind, int>;

// Numerators listed from the lowest offset upward.
auto make(Derivative derivative, DifferenceKind kind, int order, core::Index first_offset, std::int64_t divisor,
          std::initializer_list<std::int64_t> numerators) -> StencilPtr {
  std::vector<Tap> taps;
  taps.reserve(numerators.size());
  core::Index offset = first_offset;
  for (const auto numerator : numerators) {
    taps.push_back(Tap{offset++, numerator});
  }
  return std::make_shared<const Stencil>(derivative, kind, order, divisor, std::move(taps));
}

auto build_registry() -> std::map<Key, StencilPtr> {
  std::map<Key, StencilPtr> registry;
  auto add = [&registry](StencilPtr stencil) {
    registry.emplace(Key{stencil->derivative(), stencil->kind(), stencil->order()}, std::move(stencil));
  };

  constexpr auto first = Derivative::First;
  constexpr auto second = Derivative::Second;
  constexpr auto central = DifferenceKind::Central;
  constexpr auto forward = DifferenceKind::Forward;

  // Central, first derivative: antisymmetric, half-width order / 2
  add(make(first, central, 2, -1, 2, {-1, 0, 1}));
  add(make(first, central, 4, -2, 12, {1, -8, 0, 8, -1}));
  add(make(first, central, 6, -3, 60, {-1, 9, -45, 0, 45, -9, 1}));
  add(make(first, central, 8, -4, 840, {3, -32, 168, -672, 0, 672, -168, 32, -3}));

  // Forward, first derivative: offsets 0 .. order
  add(make(first, forward, 1, 0, 1, {-1, 1}));
  add(make(first, forward, 2, 0, 2, {-3, 4, -1}));
  add(make(first, forward, 3, 0, 6, {-11, 18, -9, 2}));
  add(make(first, forward, 4, 0, 12, {-25, 48, -36, 16, -3}));
  add(make(first, forward, 5, 0, 60, {-137, 300, -300, 200, -75, 12}));
  add(make(first, forward, 6, 0, 60, {-147, 360, -450, 400, -225, 72, -10}));

  // Backward, first derivative: forward formulas reflected through the evaluation point
  for (const int order : constants::orders::one_sided_first) {
    const auto& fwd = registry.at(Key{first, forward, order});
    add(std::make_shared<const Stencil>(fwd->mirrored(DifferenceKind::Backward)));
  }

  // Central, second derivative
  add(make(second, central, 2, -1, 1, {1, -2, 1}));
  add(make(second, central, 4, -2, 12, {-1, 16, -30, 16, -1}));

  return registry;
}

auto registry() -> const std::map<Key, StencilPtr>& {
  static const auto instance = build_registry();
  return instance;
}

auto format_orders(std::span<const int> orders) -> std::string {
  std::string out;
  for (std::size_t i = 0; i < orders.size(); ++i) {
    out += std::format("{}{}", i == 0 ? "" : ", ", orders[i]);
  }
  return out.empty() ? "none" : out;
}

} // namespace

auto supported_orders(Derivative derivative, DifferenceKind kind) noexcept -> std::span<const int> {
  if (derivative == Derivative::First) {
    if (kind == DifferenceKind::Central) {
      return constants::orders::central_first;
    }
    return constants::orders::one_sided_first;
  }
  if (kind == DifferenceKind::Central) {
    return constants::orders::central_second;
  }
  return {};
}

auto is_supported(Derivative derivative, DifferenceKind kind, int order) noexcept -> bool {
  const auto orders = supported_orders(derivative, kind);
  return std::ranges::find(orders, order) != orders.end();
}

auto lookup(Derivative derivative, DifferenceKind kind, int order)
    -> std::expected<StencilPtr, core::ConfigurationError> {
  const auto& table = registry();
  const auto it = table.find(Key{derivative, kind, order});
  if (it == table.end()) {
    return std::unexpected(core::ConfigurationError(
        std::format("unsupported accuracy order {} for {} derivative, {} difference. Supported orders: {}", order,
                    to_string(derivative), to_string(kind), format_orders(supported_orders(derivative, kind)))));
  }
  return it->second;
}

auto first_derivative(DifferenceKind kind, int order) -> std::expected<StencilPtr, core::ConfigurationError> {
  return lookup(Derivative::First, kind, order);
}

auto second_derivative(DifferenceKind kind, int order) -> std::expected<StencilPtr, core::ConfigurationError> {
  return lookup(Derivative::Second, kind, order);
}

} // namespace localderiv::stencil
