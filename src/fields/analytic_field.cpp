#include "localderiv/fields/analytic_field.hpp"
#include <cmath>
#include <format>

namespace localderiv::fields {

namespace {

auto to_vector(std::span<const core::Index> position) -> core::MathVector<double> {
  core::MathVector<double> p(static_cast<Eigen::Index>(position.size()));
  for (std::size_t i = 0; i < position.size(); ++i) {
    p(static_cast<Eigen::Index>(i)) = static_cast<double>(position[i]);
  }
  return p;
}

} // namespace

// ---------------------------------------------------------------------------------------------
// Profile
// ---------------------------------------------------------------------------------------------

auto Profile::value(double t) const noexcept -> double {
  switch (type) {
  case Type::Reciprocal:
    return 1.0 / (t + 1.0);
  case Type::Constant:
    return constant;
  case Type::Linear:
    return t;
  case Type::Quadratic:
    return t * t;
  }
  return 0.0;
}

auto Profile::first_derivative(double t) const noexcept -> double {
  switch (type) {
  case Type::Reciprocal:
    return -1.0 / (t + 1.0) / (t + 1.0);
  case Type::Constant:
    return 0.0;
  case Type::Linear:
    return 1.0;
  case Type::Quadratic:
    return 2.0 * t;
  }
  return 0.0;
}

auto Profile::second_derivative(double t) const noexcept -> double {
  switch (type) {
  case Type::Reciprocal:
    return 2.0 / ((t + 1.0) * (t + 1.0) * (t + 1.0));
  case Type::Constant:
  case Type::Linear:
    return 0.0;
  case Type::Quadratic:
    return 2.0;
  }
  return 0.0;
}

auto Profile::to_string() const -> std::string {
  switch (type) {
  case Type::Reciprocal:
    return "1/(t+1)";
  case Type::Constant:
    return std::format("{}", constant);
  case Type::Linear:
    return "t";
  case Type::Quadratic:
    return "t^2";
  }
  return "?";
}

// ---------------------------------------------------------------------------------------------
// SeparableProductField
// ---------------------------------------------------------------------------------------------

auto SeparableProductField::value(std::span<const core::Index> position) const -> double {
  double product = 1.0;
  for (std::size_t d = 0; d < profiles_.size(); ++d) {
    product *= profiles_[d].value(static_cast<double>(position[d]));
  }
  return product;
}

auto SeparableProductField::gradient(std::span<const core::Index> position) const -> core::MathVector<double> {
  const auto n = profiles_.size();
  core::MathVector<double> g(static_cast<Eigen::Index>(n));
  for (std::size_t i = 0; i < n; ++i) {
    double product = 1.0;
    for (std::size_t d = 0; d < n; ++d) {
      const auto t = static_cast<double>(position[d]);
      product *= (d == i) ? profiles_[d].first_derivative(t) : profiles_[d].value(t);
    }
    g(static_cast<Eigen::Index>(i)) = product;
  }
  return g;
}

auto SeparableProductField::hessian(std::span<const core::Index> position) const -> core::MathMatrix<double> {
  const auto n = profiles_.size();
  core::MathMatrix<double> h(static_cast<Eigen::Index>(n), static_cast<Eigen::Index>(n));
  for (std::size_t i = 0; i < n; ++i) {
    for (std::size_t j = i; j < n; ++j) {
      double product = 1.0;
      for (std::size_t d = 0; d < n; ++d) {
        const auto t = static_cast<double>(position[d]);
        if (d == i && d == j) {
          product *= profiles_[d].second_derivative(t);
        } else if (d == i || d == j) {
          product *= profiles_[d].first_derivative(t);
        } else {
          product *= profiles_[d].value(t);
        }
      }
      h(static_cast<Eigen::Index>(i), static_cast<Eigen::Index>(j)) = product;
      h(static_cast<Eigen::Index>(j), static_cast<Eigen::Index>(i)) = product;
    }
  }
  return h;
}

auto SeparableProductField::description() const -> std::string {
  std::string out;
  for (std::size_t d = 0; d < profiles_.size(); ++d) {
    out += std::format("{}f{}({})", d == 0 ? "" : " * ", d, profiles_[d].to_string());
  }
  return out;
}

// ---------------------------------------------------------------------------------------------
// QuadraticFormField
// ---------------------------------------------------------------------------------------------

auto QuadraticFormField::create(core::MathMatrix<double> form, core::MathVector<double> center)
    -> std::expected<QuadraticFormField, core::GeometryError> {
  if (form.rows() != form.cols()) {
    return std::unexpected(core::GeometryError(std::format("form must be square, got {}x{}", form.rows(), form.cols())));
  }
  if (form.rows() != center.size()) {
    return std::unexpected(core::GeometryError(
        std::format("form is {}x{} but the center has {} coordinates", form.rows(), form.cols(), center.size())));
  }
  if (!form.isApprox(form.transpose())) {
    return std::unexpected(core::GeometryError("form must be symmetric"));
  }
  return QuadraticFormField(std::move(form), std::move(center));
}

auto QuadraticFormField::rotated_gaussian_form(double theta, double sigma_x, double sigma_y,
                                               std::span<const double> center, std::size_t n_dims)
    -> std::expected<QuadraticFormField, core::GeometryError> {
  if (n_dims < 2) {
    return std::unexpected(core::GeometryError("rotated form needs at least 2 dimensions"));
  }
  if (center.size() < 2) {
    return std::unexpected(core::GeometryError("rotated form needs a 2-D center"));
  }
  if (sigma_x <= 0.0 || sigma_y <= 0.0) {
    return std::unexpected(core::GeometryError("sigma must be positive"));
  }

  const double ct = std::cos(theta);
  const double st = std::sin(theta);
  const double s2t = std::sin(2.0 * theta);
  const double sx2 = sigma_x * sigma_x;
  const double sy2 = sigma_y * sigma_y;

  const double a = ct * ct / 2.0 / sx2 + st * st / 2.0 / sy2;
  const double b = -s2t / 4.0 / sx2 + s2t / 4.0 / sy2;
  const double c = st * st / 2.0 / sx2 + ct * ct / 2.0 / sy2;

  const auto n = static_cast<Eigen::Index>(n_dims);
  core::MathMatrix<double> form = core::MathMatrix<double>::Zero(n, n);
  form(0, 0) = a;
  form(0, 1) = b;
  form(1, 0) = b;
  form(1, 1) = c;

  core::MathVector<double> origin = core::MathVector<double>::Zero(n);
  origin(0) = center[0];
  origin(1) = center[1];

  return create(std::move(form), std::move(origin));
}

auto QuadraticFormField::value(std::span<const core::Index> position) const -> double {
  const core::MathVector<double> r = to_vector(position) - center_;
  return -r.dot(form_ * r);
}

auto QuadraticFormField::gradient(std::span<const core::Index> position) const -> core::MathVector<double> {
  const core::MathVector<double> r = to_vector(position) - center_;
  return -2.0 * (form_ * r);
}

auto QuadraticFormField::hessian(std::span<const core::Index>) const -> core::MathMatrix<double> {
  return -2.0 * form_;
}

auto QuadraticFormField::description() const -> std::string {
  return std::format("-(p - c)^T A (p - c), {}-D", center_.size());
}

// ---------------------------------------------------------------------------------------------

auto fill_image(access::ArrayImage& image, const AnalyticField& field) -> std::expected<void, core::GeometryError> {
  if (image.num_dimensions() != field.num_dimensions()) {
    return std::unexpected(core::GeometryError(
        std::format("image has {} axes but the field has {}", image.num_dimensions(), field.num_dimensions())));
  }
  core::for_each_position(image.interval(), [&](std::span<const core::Index> position) {
    image.data()[image.offset_of(position)] = field.value(position);
  });
  return {};
}

} // namespace localderiv::fields
