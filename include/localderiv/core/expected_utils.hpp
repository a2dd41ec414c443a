#pragma once

#include "exceptions.hpp"
#include <expected>
#include <format>
#include <string>
#include <type_traits>
#include <utility>

namespace localderiv::core {

/**
 * @brief Assign-or-return helper
 *
 * Usage:
 *   LOCALDERIV_TRY_ASSIGN(value, some_expected_result);
 * Expands to:
 *   auto tmp = some_expected_result;
 *   if (!tmp) return std::unexpected(tmp.error());
 *   value = std::move(tmp.value());
 */
#define LOCALDERIV_TRY_ASSIGN(lhs, expr)                                                      \
    do {                                                                                      \
        auto localderiv_try_tmp = (expr);                                                     \
        if (!localderiv_try_tmp)                                                              \
            return std::unexpected(localderiv_try_tmp.error());                               \
        lhs = std::move(localderiv_try_tmp.value());                                          \
    } while (0)

namespace expected_utils {

/**
 * @brief Re-wrap the error of an expected as a ConfigurationError with context
 *
 * Lets geometry or file failures surface through functions that report
 * configuration problems.
 */
template <typename T, typename E>
[[nodiscard]] auto as_configuration_error(std::expected<T, E> initial, const std::string& context)
    -> std::expected<T, ConfigurationError> {
  if (!initial) {
    return std::unexpected(ConfigurationError(std::format("{}: {}", context, initial.error().message())));
  }
  if constexpr (std::is_void_v<T>) {
    return {};
  } else {
    return std::move(initial.value());
  }
}

} // namespace expected_utils

} // namespace localderiv::core
