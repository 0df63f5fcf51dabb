/**
 * @file Expected.hpp
 * @brief Value-or-Error return type for the library's fallible calls.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef RDX_CORE_EXPECTED_HPP
    #define RDX_CORE_EXPECTED_HPP

    #include "Error.hpp"

    #include <expected>

namespace rdx::core {

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

} // namespace rdx::core

/**
 * @brief Propagate an error from an Expected expression.
 *
 * Evaluates @p expr once.  If the result holds an error, the enclosing
 * function immediately returns that error wrapped in an unexpected.
 * Otherwise the macro yields the contained value.
 *
 * @param expr An expression of type rdx::core::Expected<U>.
 */
#define RDX_TRY(expr)                                                     \
    ({                                                                     \
        auto &&_rdx_result = (expr);                                       \
        if (!_rdx_result.has_value()) [[unlikely]]                         \
            return std::unexpected(std::move(_rdx_result.error()));         \
        std::move(_rdx_result.value());                                    \
    })

/**
 * @brief Propagate an error from an ExpectedVoid expression.
 * @param expr An expression of type rdx::core::ExpectedVoid.
 */
#define RDX_TRY_VOID(expr)                                                \
    do {                                                                    \
        auto &&_rdx_result = (expr);                                       \
        if (!_rdx_result.has_value()) [[unlikely]]                         \
            return std::unexpected(std::move(_rdx_result.error()));         \
    } while (false)

#endif // RDX_CORE_EXPECTED_HPP
