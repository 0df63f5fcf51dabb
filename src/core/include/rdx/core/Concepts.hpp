/**
 * @file Concepts.hpp
 * @brief C++20 concepts constraining generic interfaces across the library.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef RDX_CORE_CONCEPTS_HPP
    #define RDX_CORE_CONCEPTS_HPP

    #include "Types.hpp"

    #include <concepts>
    #include <type_traits>

namespace rdx::core {

/**
 * @brief A type the engine may permute in place: swappable and movable.
 *
 * The counting pass additionally moves items into a scratch buffer, so
 * move construction is required as well as move assignment.
 */
template <typename T>
concept Permutable = std::movable<T> && std::swappable<T>;

/**
 * @brief An integral type other than bool.
 */
template <typename T>
concept NonBoolIntegral = std::integral<T> && !std::same_as<std::remove_cv_t<T>, bool>;

} // namespace rdx::core

#endif // RDX_CORE_CONCEPTS_HPP
