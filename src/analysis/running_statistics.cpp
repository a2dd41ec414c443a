#include "localderiv/analysis/running_statistics.hpp"
#include <algorithm>
#include <cmath>

namespace localderiv::analysis {

void RunningStatistics::add(double value) noexcept {
  ++count_;
  const double delta = value - mean_;
  mean_ += delta / static_cast<double>(count_);
  m2_ += delta * (value - mean_);
  max_ = std::max(max_, value);
  min_ = std::min(min_, value);
}

// Chan et al. pairwise combination.
void RunningStatistics::merge(const RunningStatistics& other) noexcept {
  if (other.count_ == 0) {
    return;
  }
  if (count_ == 0) {
    *this = other;
    return;
  }
  const auto n_a = static_cast<double>(count_);
  const auto n_b = static_cast<double>(other.count_);
  const double n = n_a + n_b;
  const double delta = other.mean_ - mean_;

  mean_ += delta * n_b / n;
  m2_ += other.m2_ + delta * delta * n_a * n_b / n;
  count_ += other.count_;
  max_ = std::max(max_, other.max_);
  min_ = std::min(min_, other.min_);
}

auto RunningStatistics::mean() const noexcept -> double {
  return count_ == 0 ? std::numeric_limits<double>::quiet_NaN() : mean_;
}

auto RunningStatistics::variance() const noexcept -> double {
  return count_ < 2 ? std::numeric_limits<double>::quiet_NaN() : m2_ / static_cast<double>(count_ - 1);
}

auto RunningStatistics::standard_deviation() const noexcept -> double { return std::sqrt(variance()); }

} // namespace localderiv::analysis
