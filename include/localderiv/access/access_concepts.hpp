#pragma once
#include "../core/containers.hpp"
#include "../core/interval.hpp"
#include <concepts>
#include <cstddef>
#include <span>
#include <utility>

namespace localderiv::access {

/**
 * @brief Positioned, movable read cursor over a real-valued n-dimensional source.
 *
 * Bounds are the cursor's business: reading where the source cannot serve is
 * reported by the cursor itself (ArrayImage throws core::AccessError).
 */
template <typename C>
concept ScalarCursor = std::copy_constructible<C> &&
    requires(C& cursor, const C& const_cursor, std::span<const core::Index> position, std::span<core::Index> out,
             core::Index value, std::size_t d) {
      { const_cursor.num_dimensions() } -> std::convertible_to<std::size_t>;
      { const_cursor.position(d) } -> std::convertible_to<core::Index>;
      const_cursor.localize(out);
      cursor.set_position(position);
      cursor.set_position(value, d);
      cursor.move(value, d);
      { cursor.get() } -> std::convertible_to<double>;
    };

// Something a cursor can be opened on, restricted to an access interval.
template <typename S>
concept ScalarSource = requires(const S& source, const core::Interval& interval) {
  { source.num_dimensions() } -> std::convertible_to<std::size_t>;
  { source.cursor(interval) } -> ScalarCursor;
};

// A source that also knows its own extent.
template <typename S>
concept BoundedScalarSource = ScalarSource<S> && requires(const S& source) {
  { source.interval() } -> std::convertible_to<core::Interval>;
};

template <ScalarSource S>
using cursor_t = decltype(std::declval<const S&>().cursor(std::declval<const core::Interval&>()));

} // namespace localderiv::access
