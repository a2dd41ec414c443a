#pragma once
#include "containers.hpp"
#include "exceptions.hpp"
#include <expected>
#include <span>
#include <string>
#include <vector>

namespace localderiv::core {

// Axis-aligned integer box, bounds inclusive on both ends.
class Interval {
private:
  Position min_;
  Position max_;

  Interval(Position min, Position max) noexcept : min_(std::move(min)), max_(std::move(max)) {}

public:
  Interval() = default;

  [[nodiscard]] static auto create_min_max(Position min, Position max) -> std::expected<Interval, GeometryError>;

  // [0, dims[d] - 1] on every axis.
  [[nodiscard]] static auto from_dimensions(std::span<const Index> dimensions)
      -> std::expected<Interval, GeometryError>;

  [[nodiscard]] auto num_dimensions() const noexcept -> std::size_t { return min_.size(); }
  [[nodiscard]] auto min(std::size_t d) const noexcept -> Index { return min_[d]; }
  [[nodiscard]] auto max(std::size_t d) const noexcept -> Index { return max_[d]; }
  [[nodiscard]] auto min() const noexcept -> std::span<const Index> { return min_; }
  [[nodiscard]] auto max() const noexcept -> std::span<const Index> { return max_; }
  [[nodiscard]] auto dimension(std::size_t d) const noexcept -> Index { return max_[d] - min_[d] + 1; }
  [[nodiscard]] auto num_elements() const noexcept -> std::size_t;

  [[nodiscard]] auto contains(std::span<const Index> position) const noexcept -> bool;
  [[nodiscard]] auto contains(const Interval& other) const noexcept -> bool;

  // Grows the box by `low` below min and `high` above max on every axis.
  [[nodiscard]] auto expand(Index low, Index high) const -> Interval;
  [[nodiscard]] auto expand(Index margin) const -> Interval { return expand(margin, margin); }

  [[nodiscard]] auto to_string() const -> std::string;

  friend bool operator==(const Interval&, const Interval&) = default;
};

// Visits every position of `interval`, axis 0 fastest.
template <typename Visitor>
void for_each_position(const Interval& interval, Visitor&& visit) {
  const auto n = interval.num_dimensions();
  if (n == 0) {
    return;
  }
  Position pos(interval.min().begin(), interval.min().end());
  while (true) {
    visit(std::span<const Index>(pos));
    std::size_t d = 0;
    for (; d < n; ++d) {
      if (pos[d] < interval.max(d)) {
        ++pos[d];
        break;
      }
      pos[d] = interval.min(d);
    }
    if (d == n) {
      return;
    }
  }
}

} // namespace localderiv::core
