#include "localderiv/analysis/accuracy_probe.hpp"
#include "localderiv/derivatives/gradient_evaluator.hpp"
#include "localderiv/derivatives/hessian_evaluator.hpp"
#include "test_support.hpp"
#include <string>
#include <thread>
#include <vector>

using namespace localderiv;
using Type = fields::Profile::Type;

namespace {

struct Slab {
  core::Interval region;
  analysis::RunningStatistics gradient_error;
  analysis::RunningStatistics hessian_error;
};

} // namespace

// Evaluators are not shared between threads: each worker takes its own copy of a
// prototype and walks its own slab of the region. The merged statistics must
// match a single-threaded pass.
int main() {
  int failures = 0;

  try {
    const fields::SeparableProductField field(
        {{Type::Reciprocal, 1.0}, {Type::Constant, 100.0}, {Type::Linear, 1.0}});
    const auto image = test::sampled_image(field, {80, 13, 40});
    const auto region = test::box({50, 6, 20}, {70, 6, 31});

    auto gradient_prototype = derivatives::gradient::central_difference(image, region, 4).value();
    auto hessian_prototype = derivatives::hessian::central_difference(image, region, 4).value();

    auto serial_gradient = analysis::probe(gradient_prototype, field, region, 1e-6).value();
    auto serial_hessian = analysis::probe(hessian_prototype, field, region, 1e-6).value();

    constexpr core::Index n_workers = 4;
    std::vector<Slab> slabs;
    for (core::Index w = 0; w < n_workers; ++w) {
      slabs.push_back(Slab{test::box({50, 6, 20 + 3 * w}, {70, 6, 22 + 3 * w}), {}, {}});
    }

    std::vector<std::thread> workers;
    std::vector<std::string> worker_errors(slabs.size());

    for (std::size_t w = 0; w < slabs.size(); ++w) {
      workers.emplace_back([&, w, gradient = gradient_prototype.copy(), hessian = hessian_prototype.copy()]() mutable {
        auto& slab = slabs[w];
        try {
          core::for_each_position(slab.region, [&](std::span<const core::Index> position) {
            gradient.set_position(position);
            hessian.set_position(position);
            const auto& g = gradient.evaluate();
            const auto& h = hessian.evaluate();
            const auto exact_g = field.gradient(position);
            const auto exact_h = field.hessian(position);
            for (Eigen::Index i = 0; i < exact_g.size(); ++i) {
              slab.gradient_error.add(std::abs(g(static_cast<std::size_t>(i), 0) - exact_g(i)));
              for (Eigen::Index j = i; j < exact_g.size(); ++j) {
                slab.hessian_error.add(
                    std::abs(h(static_cast<std::size_t>(i), static_cast<std::size_t>(j)) - exact_h(i, j)));
              }
            }
          });
        } catch (const core::LocalDerivException& e) {
          worker_errors[w] = e.full_message();
        }
      });
    }
    for (auto& worker : workers) {
      worker.join();
    }
    for (const auto& error : worker_errors) {
      test::expect(error.empty(), error, failures);
    }

    analysis::RunningStatistics gradient_total;
    analysis::RunningStatistics hessian_total;
    for (const auto& slab : slabs) {
      gradient_total.merge(slab.gradient_error);
      hessian_total.merge(slab.hessian_error);
    }

    test::expect(gradient_total.count() == serial_gradient.overall.count(), "every gradient component covered",
                 failures);
    test::expect(hessian_total.count() == serial_hessian.overall.count(), "every hessian component covered",
                 failures);
    test::expect(gradient_total.max() == serial_gradient.overall.max(), "same maximum gradient error", failures);
    test::expect(hessian_total.max() == serial_hessian.overall.max(), "same maximum hessian error", failures);
    test::expect(test::near(gradient_total.mean(), serial_gradient.overall.mean(), 1e-15),
                 "same mean gradient error", failures);

    // The prototypes were never moved by the workers.
    const std::vector<core::Index> last = {70, 6, 31};
    test::expect(gradient_prototype.position() == last && hessian_prototype.position() == last,
                 "prototypes stay where the serial pass left them", failures);

  } catch (const core::LocalDerivException& e) {
    std::cerr << "Unexpected exception: " << e.full_message() << "\n";
    return 1;
  }

  if (failures > 0) {
    std::cerr << failures << " copy check(s) failed\n";
    return 1;
  }
  std::cout << "copies OK\n";
  return 0;
}
