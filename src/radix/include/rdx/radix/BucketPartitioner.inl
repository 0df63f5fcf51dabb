/**
 * @file BucketPartitioner.inl
 * @brief Template implementation of partitionInPlace.
 * @see   BucketPartitioner.hpp
 */

#ifndef RDX_RADIX_BUCKET_PARTITIONER_INL
    #define RDX_RADIX_BUCKET_PARTITIONER_INL

    #include <rdx/core/Assert.hpp>
    #include <rdx/core/Platform.hpp>
    #include <rdx/radix/Histogram.hpp>

    #include <utility>

namespace rdx::radix {

template <core::Permutable T, typename E>
    requires KeyExtractor<E, T>
BucketBoundaries partitionInPlace(
    std::span<T> items,
    const E &extractor,
    core::usize digit,
    const Histogram &histogram,
    core::usize origin
) {
    Histogram heads = prefixSums(histogram);
    Histogram tails{};
    for (core::usize b = 0; b < core::kRadix; ++b)
        tails[b] = heads[b] + histogram[b];

    RDX_ASSERT(tails[core::kRadix - 1] == items.size());

    // heads[b] is the first slot of bucket b not yet known to hold a
    // b-digit item. The last bucket is filled by elimination.
    for (core::usize b = 0; b + 1 < core::kRadix; ++b) {
        while (heads[b] < tails[b]) {
            T &slot = items[heads[b]];
            const core::usize target = extractor.digitAt(slot, digit);

            if (target == b) {
                ++heads[b];
                continue;
            }

            // Full target bucket: the extractor disagreed with the count
            // pass. Leave the item here rather than write past the range.
            if (RDX_UNLIKELY(heads[target] >= tails[target])) {
                ++heads[b];
                continue;
            }

            using std::swap;
            swap(slot, items[heads[target]]);
            ++heads[target];
        }
    }

    return BucketBoundaries::fromHistogram(histogram, origin);
}

} // namespace rdx::radix

#endif // RDX_RADIX_BUCKET_PARTITIONER_INL
