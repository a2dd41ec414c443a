#include "localderiv/analysis/accuracy_probe.hpp"
#include "localderiv/derivatives/hessian_evaluator.hpp"
#include "test_support.hpp"
#include <format>
#include <numbers>
#include <vector>

using namespace localderiv;
using Type = fields::Profile::Type;

namespace {

// Second-order polynomials are differentiated exactly at every order, mixed terms included.
void check_quadratic_form(int& failures) {
  const std::vector<double> center = {7.5, 8.0};
  auto field = fields::QuadraticFormField::rotated_gaussian_form(std::numbers::pi / 5.0, 3.0, 1.5, center, 3).value();
  const auto image = test::sampled_image(field, {16, 16, 6});
  const auto region = test::box({4, 4, 2}, {11, 11, 3});

  for (int order : {2, 4}) {
    auto evaluator = derivatives::hessian::central_difference(image, region, order).value();
    test::expect(evaluator.padded_interval() == region.expand(order / 2),
                 std::format("order {} pads by {}", order, order / 2), failures);

    auto report = analysis::probe(evaluator, field, region, 1e-10).value();
    test::expect(report.passed(), analysis::summarize(report), failures);
    test::expect(report.asymmetric_entries == 0, "hessian is symmetric", failures);
    test::expect(report.components.size() == 6, "upper triangle of a 3 x 3 matrix", failures);
  }
}

// f = -a x^2 - 2 b x y - c y^2 embedded in 3-D: H = [[-2a, -2b, 0], [-2b, -2c, 0], [0, 0, 0]].
void check_exact_entries(int& failures) {
  const std::vector<double> center = {0.0, 0.0};
  auto field = fields::QuadraticFormField::rotated_gaussian_form(0.3, 2.0, 1.0, center, 3).value();
  const auto image = test::sampled_image(field, {5, 5, 5});
  auto evaluator = derivatives::hessian::central_difference(image, test::box({1, 1, 1}, {3, 3, 3})).value();

  const auto& form = field.form();
  const double a = form(0, 0);
  const double b = form(0, 1);
  const double c = form(1, 1);
  constexpr double tol = 1e-12;

  core::for_each_position(evaluator.interval(), [&](std::span<const core::Index> position) {
    evaluator.set_position(position);
    const auto& h = evaluator.evaluate();
    const bool exact = test::near(h(0, 0), -2.0 * a, tol) && test::near(h(1, 1), -2.0 * c, tol) &&
                       test::near(h(2, 2), 0.0, tol) && test::near(h(0, 1), -2.0 * b, tol) &&
                       test::near(h(0, 2), 0.0, tol) && test::near(h(1, 2), 0.0, tol);
    test::expect(exact, std::format("order-2 hessian entries at ({}, {}, {})", position[0], position[1], position[2]),
                 failures);
    test::expect(h(0, 1) == h(1, 0) && h(0, 2) == h(2, 0) && h(1, 2) == h(2, 1), "bit-identical symmetry",
                 failures);
  });
}

void check_buffer(int& failures) {
  const fields::SeparableProductField field({{Type::Quadratic, 1.0}, {Type::Linear, 1.0}});
  const auto image = test::sampled_image(field, {10, 10});
  const auto region = test::box({3, 3}, {6, 6});
  auto evaluator = derivatives::hessian::central_difference(image, region).value();

  // f = x^2 y: f_xx = 2 y, f_xy = 2 x, f_yy = 0.
  evaluator.set_position(std::vector<core::Index>{4, 5});
  const auto& h = evaluator.evaluate();
  test::expect(&h == &evaluator.output(), "evaluate returns the evaluator's buffer", failures);
  test::expect(h.rows() == 2 && h.cols() == 2, "hessian buffer is n x n", failures);
  test::expect(test::near(h(0, 0), 10.0, 1e-10) && test::near(h(0, 1), 8.0, 1e-10) &&
                   test::near(h(1, 0), 8.0, 1e-10) && test::near(h(1, 1), 0.0, 1e-10),
               "hessian of x^2 y at (4, 5)", failures);

  evaluator.fwd(1);
  static_cast<void>(evaluator.evaluate());
  test::expect(test::near(h(0, 0), 12.0, 1e-10), "buffer overwritten at the next position", failures);
}

// On 100 z / (x + 1) the order-4 formulas beat the order-2 ones.
void check_order_improves(int& failures) {
  const fields::SeparableProductField field({{Type::Reciprocal, 1.0}, {Type::Constant, 100.0}, {Type::Linear, 1.0}});
  const auto image = test::sampled_image(field, {80, 13, 40});
  const auto region = test::box({50, 6, 20}, {70, 6, 30});

  auto second = derivatives::hessian::central_difference(image, region, 2).value();
  auto fourth = derivatives::hessian::central_difference(image, region, 4).value();
  auto second_report = analysis::probe(second, field, region, 1e-3).value();
  auto fourth_report = analysis::probe(fourth, field, region, 1e-6).value();

  test::expect(second_report.passed(), analysis::summarize(second_report), failures);
  test::expect(fourth_report.passed(), analysis::summarize(fourth_report), failures);
  test::expect(fourth_report.overall.max() < second_report.overall.max(), "order 4 is more accurate than order 2",
               failures);
}

void check_copy(int& failures) {
  const fields::SeparableProductField field({{Type::Quadratic, 1.0}, {Type::Linear, 1.0}});
  const auto image = test::sampled_image(field, {10, 10});
  const auto region = test::box({3, 3}, {6, 6});
  auto original = derivatives::hessian::central_difference(image, region, 4).value();

  const std::vector<core::Index> start = {5, 4};
  original.set_position(start);
  auto copy = original.copy();
  test::expect(copy.position() == start, "copy keeps the position", failures);
  test::expect(copy.accuracy_order() == 4 && copy.padded_interval() == original.padded_interval(),
               "copy keeps the formulas and the region", failures);
  test::expect(&copy.output() != &original.output(), "copy has its own buffer", failures);

  copy.fwd(0);
  test::expect(original.position() == start, "moving the copy leaves the original in place", failures);

  const double from_copy = copy.evaluate()(0, 1);
  const double from_original = original.evaluate()(0, 1);
  test::expect(test::near(from_copy, 12.0, 1e-10) && test::near(from_original, 10.0, 1e-10),
               "copy and original evaluate at their own positions", failures);

  copy.bck(0);
  test::expect(copy.evaluate()(0, 1) == original.output()(0, 1), "same position, same result", failures);

  // The copy constructor gives the same independence.
  auto cloned = original;
  cloned.move(std::vector<core::Index>{-1, 1});
  static_cast<void>(cloned.evaluate());
  test::expect(original.position() == start, "moving a copy-constructed evaluator leaves the original", failures);
  test::expect(test::near(original.output()(0, 1), 10.0, 1e-10) && test::near(cloned.output()(0, 1), 8.0, 1e-10),
               "copy-constructed evaluator has its own buffer", failures);
}

void check_rejections(int& failures) {
  const fields::SeparableProductField field({{Type::Quadratic, 1.0}, {Type::Linear, 1.0}});
  const auto image = test::sampled_image(field, {10, 10});
  const auto region = test::box({3, 3}, {6, 6});

  for (int order : {0, 1, 3, 6, 8}) {
    auto evaluator = derivatives::hessian::central_difference(image, region, order);
    test::expect(!evaluator, std::format("hessian order {} rejected", order), failures);
    if (!evaluator) {
      test::expect(evaluator.error().message().find("Supported orders: 2, 4") != std::string::npos,
                   evaluator.error().message(), failures);
    }
  }
}

} // namespace

int main() {
  int failures = 0;

  try {
    check_quadratic_form(failures);
    check_exact_entries(failures);
    check_buffer(failures);
    check_order_improves(failures);
    check_copy(failures);
    check_rejections(failures);
  } catch (const core::LocalDerivException& e) {
    std::cerr << "Unexpected exception: " << e.full_message() << "\n";
    return 1;
  }

  if (failures > 0) {
    std::cerr << failures << " hessian check(s) failed\n";
    return 1;
  }
  std::cout << "hessian OK\n";
  return 0;
}
