/**
 * @file Expected.hpp
 * @brief Monadic error-handling type built on std::expected.
 *
 * Provides Expected<T> as an alias for std::expected<T, Error> and the
 * RWN_TRY / RWN_TRY_VOID macros for early-return propagation.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-03-14
 * @copyright MIT License
 */
#pragma once

#ifndef RWN_CORE_EXPECTED_HPP
    #define RWN_CORE_EXPECTED_HPP

    #include "Error.hpp"

    #include <expected>

namespace rwn::core {

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

} // namespace rwn::core

/**
 * @brief Propagate an error from an Expected expression.
 *
 * Evaluates @p expr once.  If the result holds an error, the enclosing
 * function immediately returns that error wrapped in an unexpected.
 * Otherwise the macro yields the contained value.
 *
 * @param expr An expression of type rwn::core::Expected<U>.
 */
#define RWN_TRY(expr)                                                     \
    ({                                                                     \
        auto &&_rwn_result = (expr);                                       \
        if (!_rwn_result.has_value()) [[unlikely]]                         \
            return std::unexpected(std::move(_rwn_result.error()));         \
        std::move(_rwn_result.value());                                    \
    })

/**
 * @brief Propagate an error from an ExpectedVoid expression.
 * @param expr An expression of type rwn::core::ExpectedVoid.
 */
#define RWN_TRY_VOID(expr)                                                \
    do {                                                                    \
        auto &&_rwn_result = (expr);                                       \
        if (!_rwn_result.has_value()) [[unlikely]]                         \
            return std::unexpected(std::move(_rwn_result.error()));         \
    } while (false)

#endif // RWN_CORE_EXPECTED_HPP
