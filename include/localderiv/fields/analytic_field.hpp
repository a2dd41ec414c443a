#pragma once
#include "../access/array_image.hpp"
#include "../core/containers.hpp"
#include "../core/exceptions.hpp"
#include <expected>
#include <memory>
#include <span>
#include <string>
#include <vector>

namespace localderiv::fields {

// Scalar field with closed-form derivatives, sampled on the integer lattice.
class AnalyticField {
public:
  virtual ~AnalyticField() = default;

  [[nodiscard]] virtual auto num_dimensions() const noexcept -> std::size_t = 0;
  [[nodiscard]] virtual auto value(std::span<const core::Index> position) const -> double = 0;
  [[nodiscard]] virtual auto gradient(std::span<const core::Index> position) const -> core::MathVector<double> = 0;
  [[nodiscard]] virtual auto hessian(std::span<const core::Index> position) const -> core::MathMatrix<double> = 0;
  [[nodiscard]] virtual auto description() const -> std::string = 0;
};

// 1-D factor of a separable field.
struct Profile {
  enum class Type { Reciprocal, Constant, Linear, Quadratic };

  Type type = Type::Constant;
  double constant = 1.0; // only used by Constant

  [[nodiscard]] auto value(double t) const noexcept -> double;
  [[nodiscard]] auto first_derivative(double t) const noexcept -> double;
  [[nodiscard]] auto second_derivative(double t) const noexcept -> double;
  [[nodiscard]] auto to_string() const -> std::string;
};

/**
 * @brief f(x) = p_0(x_0) * p_1(x_1) * ... with one profile per axis.
 *
 * With profiles {reciprocal, constant 100, linear} this is the field
 * 100 * z / (x + 1) used to measure gradient convergence.
 */
class SeparableProductField final : public AnalyticField {
private:
  std::vector<Profile> profiles_;

public:
  explicit SeparableProductField(std::vector<Profile> profiles) : profiles_(std::move(profiles)) {}

  [[nodiscard]] auto num_dimensions() const noexcept -> std::size_t override { return profiles_.size(); }
  [[nodiscard]] auto value(std::span<const core::Index> position) const -> double override;
  [[nodiscard]] auto gradient(std::span<const core::Index> position) const -> core::MathVector<double> override;
  [[nodiscard]] auto hessian(std::span<const core::Index> position) const -> core::MathMatrix<double> override;
  [[nodiscard]] auto description() const -> std::string override;
};

/**
 * @brief f(p) = -(p - c)^T A (p - c) for a symmetric A.
 *
 * Gradient -2 A (p - c), Hessian -2 A everywhere.
 */
class QuadraticFormField final : public AnalyticField {
private:
  core::MathMatrix<double> form_;
  core::MathVector<double> center_;

  QuadraticFormField(core::MathMatrix<double> form, core::MathVector<double> center)
      : form_(std::move(form)), center_(std::move(center)) {}

public:
  [[nodiscard]] static auto create(core::MathMatrix<double> form, core::MathVector<double> center)
      -> std::expected<QuadraticFormField, core::GeometryError>;

  /**
   * @brief -a x^2 - 2 b x y - c y^2 around (center[0], center[1]), embedded in
   * `n_dims` dimensions (n_dims >= 2). a, b, c describe an anisotropic
   * Gaussian of widths (sigma_x, sigma_y) rotated by theta.
   */
  [[nodiscard]] static auto rotated_gaussian_form(double theta, double sigma_x, double sigma_y,
                                                  std::span<const double> center, std::size_t n_dims)
      -> std::expected<QuadraticFormField, core::GeometryError>;

  [[nodiscard]] auto form() const noexcept -> const core::MathMatrix<double>& { return form_; }

  [[nodiscard]] auto num_dimensions() const noexcept -> std::size_t override {
    return static_cast<std::size_t>(center_.size());
  }
  [[nodiscard]] auto value(std::span<const core::Index> position) const -> double override;
  [[nodiscard]] auto gradient(std::span<const core::Index> position) const -> core::MathVector<double> override;
  [[nodiscard]] auto hessian(std::span<const core::Index> position) const -> core::MathMatrix<double> override;
  [[nodiscard]] auto description() const -> std::string override;
};

// Writes field.value(p) into every pixel p of the image.
[[nodiscard]] auto fill_image(access::ArrayImage& image, const AnalyticField& field)
    -> std::expected<void, core::GeometryError>;

} // namespace localderiv::fields
