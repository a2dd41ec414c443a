#pragma once
#include "../access/access_concepts.hpp"
#include "../core/containers.hpp"
#include "../core/interval.hpp"
#include <cstddef>
#include <span>

namespace localderiv::derivatives {

/**
 * @brief Shared state of the derivative evaluators.
 *
 * Owns one cursor opened on the padded interval and one output buffer. The
 * evaluator's position is the cursor's position; every positioning call is
 * forwarded so the two never drift apart. Not safe for concurrent use: give each
 * thread its own copy.
 */
template <access::ScalarSource Source>
class PositionedEvaluator {
public:
  using cursor_type = access::cursor_t<Source>;

protected:
  const Source* source_;
  core::Interval interval_;
  core::Interval padded_interval_;
  cursor_type cursor_;
  core::Matrix<double> matrix_;

  PositionedEvaluator(const Source& source, core::Interval interval, core::Interval padded_interval, std::size_t rows,
                      std::size_t cols)
      : source_(&source), interval_(std::move(interval)), padded_interval_(std::move(padded_interval)),
        cursor_(source.cursor(padded_interval_)), matrix_(rows, cols) {}

public:
  [[nodiscard]] auto num_dimensions() const noexcept -> std::size_t { return cursor_.num_dimensions(); }

  [[nodiscard]] auto position(std::size_t d) const -> core::Index { return cursor_.position(d); }

  [[nodiscard]] auto position() const -> core::Position {
    core::Position out(num_dimensions());
    cursor_.localize(out);
    return out;
  }

  void localize(std::span<core::Index> out) const { cursor_.localize(out); }

  void set_position(std::span<const core::Index> position) { cursor_.set_position(position); }
  void set_position(core::Index value, std::size_t d) { cursor_.set_position(value, d); }

  void move(core::Index delta, std::size_t d) { cursor_.move(delta, d); }
  void move(std::span<const core::Index> deltas) {
    for (std::size_t d = 0; d < deltas.size(); ++d) {
      cursor_.move(deltas[d], d);
    }
  }
  void fwd(std::size_t d) { cursor_.move(1, d); }
  void bck(std::size_t d) { cursor_.move(-1, d); }

  // Region the caller asked for, and the region the cursor may visit.
  [[nodiscard]] auto interval() const noexcept -> const core::Interval& { return interval_; }
  [[nodiscard]] auto padded_interval() const noexcept -> const core::Interval& { return padded_interval_; }

  [[nodiscard]] auto source() const noexcept -> const Source& { return *source_; }

  // Result of the last evaluate(); overwritten by the next one.
  [[nodiscard]] auto output() const noexcept -> const core::Matrix<double>& { return matrix_; }
};

} // namespace localderiv::derivatives
