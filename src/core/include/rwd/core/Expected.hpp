/**
 * @file Expected.hpp
 * @brief Monadic error-handling type built on std::expected.
 *
 * Provides Expected<T> as an alias for std::expected<T, Error> and the
 * RWD_TRY / RWD_TRY_VOID macros for early-return propagation.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef RWD_CORE_EXPECTED_HPP
    #define RWD_CORE_EXPECTED_HPP

    #include "Error.hpp"

    #include <expected>

namespace rwd::core {

/**
 * @brief Alias for an expected value or a structured Error.
 * @tparam T The success-path value type.
 */
template <typename T>
using Expected = std::expected<T, Error>;

/**
 * @brief Alias for operations that succeed with no value.
 */
using ExpectedVoid = Expected<void>;

} // namespace rwd::core

/**
 * @brief Propagate an error from an Expected expression.
 *
 * Evaluates @p expr once.  If the result holds an error, the enclosing
 * function immediately returns that error wrapped in an unexpected.
 * Otherwise the macro yields the contained value.
 *
 * @param expr An expression of type rwd::core::Expected<U>.
 */
#define RWD_TRY(expr)                                                     \
    ({                                                                     \
        auto &&_rwd_result = (expr);                                       \
        if (!_rwd_result.has_value()) [[unlikely]]                         \
            return std::unexpected(std::move(_rwd_result.error()));         \
        std::move(_rwd_result.value());                                    \
    })

/**
 * @brief Propagate an error from an ExpectedVoid expression.
 * @param expr An expression of type rwd::core::ExpectedVoid.
 */
#define RWD_TRY_VOID(expr)                                                \
    do {                                                                    \
        auto &&_rwd_result = (expr);                                       \
        if (!_rwd_result.has_value()) [[unlikely]]                         \
            return std::unexpected(std::move(_rwd_result.error()));         \
    } while (false)

#endif // RWD_CORE_EXPECTED_HPP
