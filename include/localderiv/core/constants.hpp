#pragma once

#include <array>
#include <cstddef>

namespace localderiv::constants {

// ================================================================================================
// ACCURACY ORDERS
// ================================================================================================

namespace orders {
/// Central first-derivative stencils (gradient)
inline constexpr std::array<int, 4> central_first = {2, 4, 6, 8};

/// One-sided first-derivative stencils (forward and backward gradient)
inline constexpr std::array<int, 6> one_sided_first = {1, 2, 3, 4, 5, 6};

/// Central second-derivative stencils (Hessian)
inline constexpr std::array<int, 2> central_second = {2, 4};

/// Default accuracy order of every factory
inline constexpr int default_order = 2;
} // namespace orders

// ================================================================================================
// NUMERICAL TOLERANCES
// ================================================================================================

namespace tolerance {
/// Exactness on polynomial fields
inline constexpr double polynomial_exact = 1e-12;

/// Stencil moment conditions
inline constexpr double moment = 1e-9;
} // namespace tolerance

// ================================================================================================
// APPLICATION DEFAULTS
// ================================================================================================

namespace defaults {
inline constexpr const char* output_directory = "localderiv_outputs";
inline constexpr const char* case_name = "report";
inline constexpr const char* config_directory = "config";
inline constexpr double field_constant = 100.0;
} // namespace defaults

namespace exit_codes {
inline constexpr int success = 0;
inline constexpr int tolerance_violated = 1;
inline constexpr int failure = 2;
} // namespace exit_codes

} // namespace localderiv::constants
