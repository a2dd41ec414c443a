#pragma once
#include "../core/constants.hpp"
#include "../core/containers.hpp"
#include "../fields/analytic_field.hpp"
#include "../stencil/stencil.hpp"
#include <string>
#include <string_view>
#include <vector>

namespace localderiv::io {

struct ImageConfig {
  std::vector<core::Index> dimensions;
};

struct FieldConfig {
  enum class Type { Separable, QuadraticForm };
  Type type = Type::Separable;

  // Separable
  std::vector<fields::Profile::Type> profiles;
  double constant = constants::defaults::field_constant;

  // QuadraticForm
  double theta = 0.0;
  std::vector<double> sigma = {1.0, 1.0};
  std::vector<double> center = {0.0, 0.0};
};

struct RegionConfig {
  std::vector<core::Index> min;
  std::vector<core::Index> max;
};

struct RunConfig {
  enum class Operator { Gradient, Hessian };
  Operator op = Operator::Gradient;
  stencil::DifferenceKind kind = stencil::DifferenceKind::Central;
  int order = constants::orders::default_order;
  double tolerance = 0.0;
};

struct OutputConfig {
  enum class Format { CSV, HDF5 };
  std::string directory = constants::defaults::output_directory;
  std::string case_name = constants::defaults::case_name;
  std::vector<Format> formats = {Format::CSV};
};

struct Configuration {
  ImageConfig image;
  FieldConfig field;
  RegionConfig region;
  std::vector<RunConfig> runs;
  OutputConfig output;
  bool verbose = false;
};

[[nodiscard]] auto to_string(RunConfig::Operator op) noexcept -> std::string_view;
[[nodiscard]] auto to_string(OutputConfig::Format format) noexcept -> std::string_view;

} // namespace localderiv::io
