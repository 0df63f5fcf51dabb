/**
 * @file Histogram.hpp
 * @brief Digit histograms over a range of items.
 *
 * Counting is a read-only linear pass, so disjoint sub-ranges can be
 * counted concurrently and merged by elementwise addition;
 * countDigitsParallel does exactly that on a JobSystem.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef RDX_RADIX_HISTOGRAM_HPP
    #define RDX_RADIX_HISTOGRAM_HPP

    #include <rdx/concurrency/JobSystem.hpp>
    #include <rdx/core/Types.hpp>
    #include <rdx/radix/Partition.hpp>
    #include <rdx/radix/RadixKey.hpp>

    #include <span>

namespace rdx::radix {

/**
 * @brief Count the occurrences of each value of digit @p digit.
 * @return 256 counts summing to items.size().
 */
template <typename T, typename E>
    requires KeyExtractor<E, T>
[[nodiscard]] Histogram countDigits(std::span<const T> items, const E &extractor, core::usize digit);

/**
 * @brief countDigits split into @p chunks jobs on @p pool.
 *
 * The calling thread joins (and helps with) the jobs before merging.
 */
template <typename T, typename E>
    requires KeyExtractor<E, T>
[[nodiscard]] Histogram countDigitsParallel(
    std::span<const T> items,
    const E &extractor,
    core::usize digit,
    concurrency::JobSystem &pool,
    core::usize chunks
);

/**
 * @brief True if every item of @p items has the same value at @p digit.
 *
 * Stops at the first mismatch, so non-uniform input is usually rejected
 * after a couple of reads.
 */
template <typename T, typename E>
    requires KeyExtractor<E, T>
[[nodiscard]] bool isUniformDigit(std::span<const T> items, const E &extractor, core::usize digit);

/// @brief Exclusive prefix sums: the first index of each bucket.
[[nodiscard]] constexpr Histogram prefixSums(const Histogram &histogram) noexcept
{
    Histogram sums{};
    core::usize running = 0;
    for (core::usize b = 0; b < core::kRadix; ++b) {
        sums[b] = running;
        running += histogram[b];
    }
    return sums;
}

/// @brief Number of buckets with at least one item.
[[nodiscard]] constexpr core::usize nonEmptyBucketCount(const Histogram &histogram) noexcept
{
    core::usize count = 0;
    for (core::usize c : histogram)
        count += (c != 0);
    return count;
}

/// @brief True if at most one bucket is non-empty.
[[nodiscard]] constexpr bool isUniform(const Histogram &histogram) noexcept
{
    return nonEmptyBucketCount(histogram) <= 1;
}

} // namespace rdx::radix

    #include "Histogram.inl"

#endif // RDX_RADIX_HISTOGRAM_HPP
