#include "localderiv/core/interval.hpp"
#include <algorithm>
#include <format>
#include <ranges>

namespace localderiv::core {

auto Interval::create_min_max(Position min, Position max) -> std::expected<Interval, GeometryError> {
  if (min.size() != max.size()) {
    return std::unexpected(
        GeometryError(std::format("min has {} axes but max has {}", min.size(), max.size())));
  }
  if (min.empty()) {
    return std::unexpected(GeometryError("Interval needs at least one axis"));
  }
  for (std::size_t d = 0; d < min.size(); ++d) {
    if (min[d] > max[d]) {
      return std::unexpected(
          GeometryError(std::format("Axis {}: min {} is greater than max {}", d, min[d], max[d])));
    }
  }
  return Interval(std::move(min), std::move(max));
}

auto Interval::from_dimensions(std::span<const Index> dimensions) -> std::expected<Interval, GeometryError> {
  Position min(dimensions.size(), 0);
  Position max;
  max.reserve(dimensions.size());
  for (const auto dim : dimensions) {
    if (dim <= 0) {
      return std::unexpected(GeometryError(std::format("Dimension must be positive, got {}", dim)));
    }
    max.push_back(dim - 1);
  }
  return create_min_max(std::move(min), std::move(max));
}

auto Interval::num_elements() const noexcept -> std::size_t {
  std::size_t count = min_.empty() ? 0 : 1;
  for (std::size_t d = 0; d < min_.size(); ++d) {
    count *= static_cast<std::size_t>(dimension(d));
  }
  return count;
}

auto Interval::contains(std::span<const Index> position) const noexcept -> bool {
  if (position.size() != min_.size()) {
    return false;
  }
  for (std::size_t d = 0; d < min_.size(); ++d) {
    if (position[d] < min_[d] || position[d] > max_[d]) {
      return false;
    }
  }
  return true;
}

auto Interval::contains(const Interval& other) const noexcept -> bool {
  return other.num_dimensions() == num_dimensions() && contains(other.min()) && contains(other.max());
}

auto Interval::expand(Index low, Index high) const -> Interval {
  Position min = min_;
  Position max = max_;
  std::ranges::transform(min, min.begin(), [low](Index v) { return v - low; });
  std::ranges::transform(max, max.begin(), [high](Index v) { return v + high; });
  return Interval(std::move(min), std::move(max));
}

auto Interval::to_string() const -> std::string {
  auto join = [](const Position& values) {
    std::string out;
    for (std::size_t i = 0; i < values.size(); ++i) {
      out += std::format("{}{}", i == 0 ? "" : ", ", values[i]);
    }
    return out;
  };
  return std::format("[{}] -> [{}]", join(min_), join(max_));
}

} // namespace localderiv::core
