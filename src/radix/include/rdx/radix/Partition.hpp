/**
 * @file Partition.hpp
 * @brief Index-range vocabulary of the MSD engine.
 *
 * A Partition never owns items: it is a half-open range over the single
 * item sequence handed to the sort call, plus the digit index the range
 * still has to be discriminated on.  Every item of a partition shares the
 * same bytes for all digits below Partition::digit.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef RDX_RADIX_PARTITION_HPP
    #define RDX_RADIX_PARTITION_HPP

    #include <rdx/core/Assert.hpp>
    #include <rdx/core/Constants.hpp>
    #include <rdx/core/Types.hpp>

    #include <array>

namespace rdx::radix {

/// @brief Occurrences of each digit value in one (partition, digit) pair.
using Histogram = std::array<core::usize, core::kRadix>;

/**
 * @brief Half-open range [start, end) at a digit index.
 */
struct Partition {
    core::usize start = 0;
    core::usize end   = 0;
    core::usize digit = 0;

    [[nodiscard]] constexpr core::usize size()  const noexcept { return end - start; }
    [[nodiscard]] constexpr bool        empty() const noexcept { return end == start; }
};

/**
 * @brief End offset of each of the 256 buckets of a partitioned range.
 *
 * Offsets are absolute indices into the item sequence, non-decreasing,
 * and the last one equals the partition's end.
 */
class BucketBoundaries final {
public:
    /**
     * @brief Derive boundaries from a histogram.
     * @param histogram Digit counts of the range.
     * @param origin    Absolute index of the range's first item.
     */
    [[nodiscard]] static constexpr BucketBoundaries fromHistogram(const Histogram &histogram, core::usize origin) noexcept
    {
        BucketBoundaries bounds;
        bounds._origin = origin;

        core::usize running = origin;
        for (core::usize b = 0; b < core::kRadix; ++b) {
            running += histogram[b];
            bounds._ends[b] = running;
        }
        return bounds;
    }

    [[nodiscard]] constexpr core::usize begin(core::usize bucket) const noexcept
    {
        return bucket == 0 ? _origin : _ends[bucket - 1];
    }

    [[nodiscard]] constexpr core::usize end(core::usize bucket) const noexcept { return _ends[bucket]; }

    [[nodiscard]] constexpr core::usize size(core::usize bucket) const noexcept
    {
        return end(bucket) - begin(bucket);
    }

    [[nodiscard]] constexpr core::usize origin() const noexcept { return _origin; }

    /// @brief The child partition holding bucket @p bucket at @p digit.
    [[nodiscard]] constexpr Partition child(core::usize bucket, core::usize digit) const noexcept
    {
        RDX_ASSERT(bucket < core::kRadix);
        return Partition{begin(bucket), end(bucket), digit};
    }

private:
    core::usize                           _origin = 0;
    std::array<core::usize, core::kRadix> _ends{};
};

} // namespace rdx::radix

#endif // RDX_RADIX_PARTITION_HPP
