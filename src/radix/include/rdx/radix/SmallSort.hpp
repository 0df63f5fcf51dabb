/**
 * @file SmallSort.hpp
 * @brief Comparison fallback for partitions below the radix crossover.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef RDX_RADIX_SMALL_SORT_HPP
    #define RDX_RADIX_SMALL_SORT_HPP

    #include <rdx/core/Concepts.hpp>
    #include <rdx/core/Types.hpp>
    #include <rdx/radix/RadixKey.hpp>

    #include <span>

namespace rdx::radix {

/**
 * @brief Lexicographic three-way comparison of the digits of @p lhs and
 *        @p rhs from @p digit to the end of the key.
 * @return Negative, zero or positive like memcmp.
 */
template <typename T, typename E>
    requires KeyExtractor<E, T>
[[nodiscard]] int compareDigits(const T &lhs, const T &rhs, const E &extractor, core::usize digit);

/**
 * @brief Insertion sort of @p items by their digits from @p digit onward.
 *
 * Digits are re-read through the extractor on every comparison; nothing
 * is materialised.
 */
template <core::Permutable T, typename E>
    requires KeyExtractor<E, T>
void insertionSort(std::span<T> items, const E &extractor, core::usize digit);

} // namespace rdx::radix

    #include "SmallSort.inl"

#endif // RDX_RADIX_SMALL_SORT_HPP
