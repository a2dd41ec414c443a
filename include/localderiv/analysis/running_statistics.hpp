#pragma once
#include <cstddef>
#include <limits>

namespace localderiv::analysis {

/**
 * @brief Streaming mean / variance / maximum of a sample (Welford update).
 *
 * variance() is the unbiased sample variance, standard_deviation() its square
 * root. Both are NaN with fewer than two samples; mean() is NaN when empty.
 */
class RunningStatistics {
private:
  std::size_t count_ = 0;
  double mean_ = 0.0;
  double m2_ = 0.0;
  double max_ = -std::numeric_limits<double>::infinity();
  double min_ = std::numeric_limits<double>::infinity();

public:
  void add(double value) noexcept;
  void merge(const RunningStatistics& other) noexcept;
  void reset() noexcept { *this = RunningStatistics{}; }

  [[nodiscard]] auto count() const noexcept -> std::size_t { return count_; }
  [[nodiscard]] auto mean() const noexcept -> double;
  [[nodiscard]] auto variance() const noexcept -> double;
  [[nodiscard]] auto standard_deviation() const noexcept -> double;
  [[nodiscard]] auto max() const noexcept -> double { return max_; }
  [[nodiscard]] auto min() const noexcept -> double { return min_; }
};

} // namespace localderiv::analysis
