#include "localderiv/analysis/accuracy_probe.hpp"
#include "localderiv/derivatives/gradient_evaluator.hpp"
#include "test_support.hpp"
#include <format>
#include <limits>
#include <vector>

using namespace localderiv;
using stencil::DifferenceKind;
using Type = fields::Profile::Type;

namespace {

struct Case {
  DifferenceKind kind;
  int order;
  double tolerance;
};

// 100 * z / (x + 1), sampled far enough from x = -1 for every order to converge.
const fields::SeparableProductField& convergence_field() {
  static const fields::SeparableProductField field(
      {{Type::Reciprocal, 1.0}, {Type::Constant, 100.0}, {Type::Linear, 1.0}});
  return field;
}

void check_convergence(int& failures) {
  const auto& field = convergence_field();
  const auto image = test::sampled_image(field, {128, 128, 64});
  const auto region = test::box({50, 50, 20}, {70, 70, 30});

  const std::vector<Case> cases = {
      {DifferenceKind::Central, 2, 1e-3},  {DifferenceKind::Central, 4, 1e-6},  {DifferenceKind::Central, 6, 1e-8},
      {DifferenceKind::Central, 8, 1e-10}, {DifferenceKind::Forward, 1, 1e-1},  {DifferenceKind::Forward, 2, 1e-2},
      {DifferenceKind::Forward, 3, 1e-3},  {DifferenceKind::Forward, 4, 1e-4},  {DifferenceKind::Forward, 5, 1e-5},
      {DifferenceKind::Forward, 6, 1e-6},  {DifferenceKind::Backward, 1, 1e-1}, {DifferenceKind::Backward, 2, 1e-2},
      {DifferenceKind::Backward, 3, 1e-3}, {DifferenceKind::Backward, 4, 1e-4}, {DifferenceKind::Backward, 5, 1e-5},
      {DifferenceKind::Backward, 6, 1e-6}};

  for (const auto& c : cases) {
    auto evaluator = derivatives::gradient::create(image, region, c.kind, c.order);
    if (!evaluator) {
      test::expect(false, evaluator.error().message(), failures);
      continue;
    }
    auto report = analysis::probe(evaluator.value(), field, region, c.tolerance);
    if (!report) {
      test::expect(false, report.error().message(), failures);
      continue;
    }
    test::expect(report->positions == region.num_elements(), "every position visited", failures);
    test::expect(report->passed(), analysis::summarize(report.value()), failures);
  }

  auto max_error = [&](DifferenceKind kind, int order) {
    auto evaluator = derivatives::gradient::create(image, region, kind, order).value();
    return analysis::probe(evaluator, field, region, 1.0).value().overall.max();
  };

  // Higher order is more accurate on a smooth field, for every kind.
  for (auto kind : {DifferenceKind::Central, DifferenceKind::Forward, DifferenceKind::Backward}) {
    double previous = std::numeric_limits<double>::infinity();
    for (int order : stencil::supported_orders(stencil::Derivative::First, kind)) {
      const double error = max_error(kind, order);
      test::expect(error < previous,
                   std::format("{} order {} improves on the previous order ({} vs {})", stencil::to_string(kind),
                               order, error, previous),
                   failures);
      previous = error;
    }
  }

  // Centred formulas beat one-sided ones of the same order on the same samples.
  for (int order : {2, 4, 6}) {
    const double central = max_error(DifferenceKind::Central, order);
    const double forward = max_error(DifferenceKind::Forward, order);
    test::expect(central < forward,
                 std::format("central order {} error {} should be below forward error {}", order, central, forward),
                 failures);
  }
}

// x^2 * y is reproduced exactly by every formula of order >= 2 along x and every order along y.
void check_polynomial_exactness(int& failures) {
  const fields::SeparableProductField field({{Type::Quadratic, 1.0}, {Type::Linear, 1.0}});
  const auto image = test::sampled_image(field, {16, 16});
  const auto region = test::box({7, 7}, {8, 8});
  constexpr double tol = 1e-9;

  for (auto kind : {DifferenceKind::Central, DifferenceKind::Forward, DifferenceKind::Backward}) {
    for (int order : stencil::supported_orders(stencil::Derivative::First, kind)) {
      if (order < 2) {
        continue;
      }
      auto evaluator = derivatives::gradient::create(image, region, kind, order).value();
      auto report = analysis::probe(evaluator, field, region, tol).value();
      test::expect(report.passed(), std::format("polynomial exactness: {}", analysis::summarize(report)), failures);
    }
  }

  // f(x, y) = x^2 y at (7, 7): d/dx = 2 x y = 98, d/dy = x^2 = 49.
  auto evaluator = derivatives::gradient::central_difference(image, region).value();
  evaluator.set_position(std::vector<core::Index>{7, 7});
  const auto& g = evaluator.evaluate();
  test::expect(g.rows() == 2 && g.cols() == 1, "gradient buffer is n x 1", failures);
  test::expect(test::near(g(0, 0), 98.0, tol) && test::near(g(1, 0), 49.0, tol), "central gradient at (7, 7)",
               failures);
}

void check_padding(int& failures) {
  const auto image = test::sampled_image(convergence_field(), {80, 13, 40});
  const auto region = test::box({50, 6, 20}, {70, 6, 30});

  auto forward = derivatives::gradient::forward_difference(image, region, 3).value();
  test::expect(forward.interval() == region, "requested region kept", failures);
  for (std::size_t d = 0; d < 3; ++d) {
    test::expect(forward.padded_interval().min(d) == region.min(d), "forward never reads below the region", failures);
    test::expect(forward.padded_interval().max(d) == region.max(d) + 3, "forward reads order samples above",
                 failures);
  }

  auto backward = derivatives::gradient::backward_difference(image, region, 3).value();
  for (std::size_t d = 0; d < 3; ++d) {
    test::expect(backward.padded_interval().max(d) == region.max(d), "backward never reads above the region",
                 failures);
  }

  auto central = derivatives::gradient::central_difference(image, region).value();
  test::expect(central.padded_interval() == region.expand(1), "central order 2 pads by one", failures);
  test::expect(central.kind() == DifferenceKind::Central && central.accuracy_order() == 2, "default order is 2",
               failures);
  auto default_backward = derivatives::gradient::backward_difference(image, region).value();
  test::expect(default_backward.accuracy_order() == 2, "backward default order is 2", failures);
}

void check_rejections(int& failures) {
  const auto image = test::sampled_image(convergence_field(), {8, 8, 8});
  const auto region = test::box({3, 3, 3}, {4, 4, 4});

  for (int order : {0, 3, 5, 7, 10}) {
    test::expect(!derivatives::gradient::central_difference(image, region, order),
                 std::format("central order {} rejected", order), failures);
  }
  for (int order : {0, 7, -2}) {
    test::expect(!derivatives::gradient::forward_difference(image, region, order),
                 std::format("forward order {} rejected", order), failures);
    test::expect(!derivatives::gradient::backward_difference(image, region, order),
                 std::format("backward order {} rejected", order), failures);
  }
  test::expect(!derivatives::gradient::central_difference(image, test::box({3, 3}, {4, 4})),
               "region with the wrong number of axes rejected", failures);
}

// Stepping with fwd/bck/move and evaluating does not disturb the position.
void check_positioning(int& failures) {
  const auto& field = convergence_field();
  const auto image = test::sampled_image(field, {80, 13, 40});
  const auto region = test::box({50, 6, 20}, {70, 6, 30});
  auto evaluator = derivatives::gradient::central_difference(image, region, 4).value();

  evaluator.set_position(std::vector<core::Index>{55, 6, 25});
  evaluator.fwd(0);
  evaluator.bck(2);
  evaluator.move(std::vector<core::Index>{2, 0, -1});
  const std::vector<core::Index> expected = {58, 6, 23};
  test::expect(evaluator.position() == expected, "fwd, bck and move", failures);

  const auto& first = evaluator.evaluate();
  const double dx = first(0, 0);
  test::expect(evaluator.position() == expected, "evaluate leaves the position unchanged", failures);
  test::expect(&first == &evaluator.output(), "evaluate returns the evaluator's buffer", failures);

  evaluator.set_position(60, 0);
  static_cast<void>(evaluator.evaluate());
  test::expect(first(0, 0) != dx, "buffer is overwritten by the next evaluate", failures);
}

} // namespace

int main() {
  int failures = 0;

  try {
    check_convergence(failures);
    check_polynomial_exactness(failures);
    check_padding(failures);
    check_rejections(failures);
    check_positioning(failures);
  } catch (const core::LocalDerivException& e) {
    std::cerr << "Unexpected exception: " << e.full_message() << "\n";
    return 1;
  }

  if (failures > 0) {
    std::cerr << failures << " gradient check(s) failed\n";
    return 1;
  }
  std::cout << "gradient OK\n";
  return 0;
}
