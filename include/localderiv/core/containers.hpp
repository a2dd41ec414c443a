#pragma once
#include <Eigen/Dense>
#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace localderiv::core {

// Integer lattice coordinate, one entry per axis.
using Index = std::int64_t;
using Position = std::vector<Index>;

template <typename Scalar = double>
using MathVector = Eigen::Vector<Scalar, Eigen::Dynamic>;

template <typename Scalar = double>
using MathMatrix = Eigen::Matrix<Scalar, Eigen::Dynamic, Eigen::Dynamic>;

// Dense output buffer addressed by (row, col), 0-based.
template <typename Scalar = double>
class Matrix {
private:
  Eigen::Matrix<Scalar, Eigen::Dynamic, Eigen::Dynamic> data_;

public:
  Matrix() = default;
  Matrix(std::size_t rows, std::size_t cols) : data_(rows, cols) { data_.setZero(); }

  Matrix(Matrix&&) = default;
  Matrix& operator=(Matrix&&) = default;

  Matrix(const Matrix&) = default;
  Matrix& operator=(const Matrix&) = default;

  [[nodiscard]] auto rows() const noexcept -> std::size_t { return static_cast<std::size_t>(data_.rows()); }
  [[nodiscard]] auto cols() const noexcept -> std::size_t { return static_cast<std::size_t>(data_.cols()); }

  auto operator()(std::size_t i, std::size_t j) -> Scalar& { return data_(i, j); }
  [[nodiscard]] auto operator()(std::size_t i, std::size_t j) const -> const Scalar& { return data_(i, j); }
};

} // namespace localderiv::core
