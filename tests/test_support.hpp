#pragma once
#include "localderiv/access/array_image.hpp"
#include "localderiv/core/interval.hpp"
#include "localderiv/fields/analytic_field.hpp"
#include <cmath>
#include <iostream>
#include <string_view>
#include <vector>

namespace localderiv::test {

// Image of the given size holding field.value(p) at every pixel p.
inline auto sampled_image(const fields::AnalyticField& field, const std::vector<core::Index>& dimensions)
    -> access::ArrayImage {
  auto image = access::ArrayImage::create(dimensions);
  if (!image) {
    throw image.error();
  }
  if (auto filled = fields::fill_image(image.value(), field); !filled) {
    throw filled.error();
  }
  return std::move(image.value());
}

inline auto box(core::Position min, core::Position max) -> core::Interval {
  auto interval = core::Interval::create_min_max(std::move(min), std::move(max));
  if (!interval) {
    throw interval.error();
  }
  return interval.value();
}

inline auto near(double actual, double expected, double tolerance) -> bool {
  return std::abs(actual - expected) <= tolerance;
}

// Prints `message` when `condition` is false and counts the failure.
inline void expect(bool condition, std::string_view message, int& failures) {
  if (!condition) {
    std::cerr << "FAILED: " << message << "\n";
    ++failures;
  }
}

} // namespace localderiv::test
