#pragma once

#include "findiff/core/exceptions.hpp"
#include <expected>
#include <format>
#include <string>
#include <type_traits>

namespace findiff::core {

/**
 * @brief Utilities for working with std::expected to reduce boilerplate
 */
namespace expected_utils {

/**
 * @brief Assign-or-return helper
 *
 * Usage:
 *   FINDIFF_TRY_ASSIGN(value, some_expected_result);
 * Expands to:
 *   auto tmp = some_expected_result;
 *   if (!tmp) return std::unexpected(tmp.error());
 *   value = std::move(tmp.value());
 */
#define FINDIFF_TRY_ASSIGN(lhs, expr)                                                         \
    do {                                                                                      \
        auto findiff_try_tmp = (expr);                                                        \
        if (!findiff_try_tmp)                                                                 \
            return std::unexpected(findiff_try_tmp.error());                                  \
        lhs = std::move(findiff_try_tmp.value());                                             \
    } while (0)

/**
 * @brief Void-or-return helper
 *
 * Usage: FINDIFF_TRY_VOID(some_void_expected_result);
 */
#define FINDIFF_TRY_VOID(expr)                                                                \
    do {                                                                                      \
        auto findiff_try_tmp_void = (expr);                                                   \
        if (!findiff_try_tmp_void)                                                            \
            return std::unexpected(findiff_try_tmp_void.error());                             \
    } while (0)

/**
 * @brief Execute a callable that may throw, converting exceptions to an error value
 *
 * @tparam Error Error type, constructible from a message
 * @tparam F Callable type
 * @param func Callable returning a plain value
 * @param context Prefix for the error message
 * @return Value returned by func or an Error carrying the exception message
 */
template <typename Error, typename F>
[[nodiscard]] auto with_context(F&& func, const std::string& context)
    -> std::expected<std::invoke_result_t<F>, Error> {
  try {
    return func();
  } catch (const std::exception& e) {
    return std::unexpected(Error(std::format("{}: {}", context, e.what())));
  } catch (...) {
    return std::unexpected(Error(std::format("{}: unknown exception", context)));
  }
}

} // namespace expected_utils

} // namespace findiff::core
