/**
 * @file CountingSort.hpp
 * @brief Out-of-place LSD counting sort over the remaining digits of a
 *        small partition.
 *
 * Used by the selector for partitions small enough that a few stable
 * counting passes through a scratch buffer beat further bucket recursion.
 * The scratch buffer is as large as the partition, which the tuning table
 * caps at kMaxCountingSortThreshold items.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef RDX_RADIX_COUNTING_SORT_HPP
    #define RDX_RADIX_COUNTING_SORT_HPP

    #include <rdx/core/Concepts.hpp>
    #include <rdx/core/Types.hpp>
    #include <rdx/radix/RadixKey.hpp>

    #include <span>

namespace rdx::radix {

/**
 * @brief Sort @p items by digits [fromDigit, digitCount) with one stable
 *        counting pass per digit, least significant first.
 *
 * Passes whose digit is uniform across the range are skipped.
 *
 * @throws std::bad_alloc if the scratch buffer cannot be allocated.
 */
template <core::Permutable T, typename E>
    requires KeyExtractor<E, T>
void lsdCountingSort(std::span<T> items, const E &extractor, core::usize fromDigit);

} // namespace rdx::radix

    #include "CountingSort.inl"

#endif // RDX_RADIX_COUNTING_SORT_HPP
