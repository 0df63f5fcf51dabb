/**
 * @file BucketPartitioner.hpp
 * @brief In-place 256-way partition of a range on one digit.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef RDX_RADIX_BUCKET_PARTITIONER_HPP
    #define RDX_RADIX_BUCKET_PARTITIONER_HPP

    #include <rdx/core/Concepts.hpp>
    #include <rdx/core/Types.hpp>
    #include <rdx/radix/Partition.hpp>
    #include <rdx/radix/RadixKey.hpp>

    #include <span>

namespace rdx::radix {

/**
 * @brief Permute @p items so that each digit value occupies a contiguous
 *        range, buckets in ascending digit order.
 *
 * Cycle-following (American flag) permutation: every swap drops one item
 * at the head of its destination bucket, so each item moves at most once
 * to its final bucket and no auxiliary buffer is allocated.  Order inside
 * a bucket is unspecified.
 *
 * @param items     Range to partition.
 * @param extractor Key extractor.
 * @param digit     Digit index to partition on.
 * @param histogram Digit counts of @p items (from countDigits).
 * @param origin    Absolute index of items[0] in the full sequence.
 * @return Absolute boundaries of the 256 buckets.
 */
template <core::Permutable T, typename E>
    requires KeyExtractor<E, T>
BucketBoundaries partitionInPlace(
    std::span<T> items,
    const E &extractor,
    core::usize digit,
    const Histogram &histogram,
    core::usize origin
);

} // namespace rdx::radix

    #include "BucketPartitioner.inl"

#endif // RDX_RADIX_BUCKET_PARTITIONER_HPP
