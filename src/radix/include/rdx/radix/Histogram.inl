/**
 * @file Histogram.inl
 * @brief Template implementation of the digit histogram builders.
 * @see   Histogram.hpp
 */

#ifndef RDX_RADIX_HISTOGRAM_INL
    #define RDX_RADIX_HISTOGRAM_INL

    #include <rdx/core/Assert.hpp>

    #include <algorithm>
    #include <vector>

namespace rdx::radix {

template <typename T, typename E>
    requires KeyExtractor<E, T>
Histogram countDigits(std::span<const T> items, const E &extractor, core::usize digit)
{
    RDX_ASSERT(digit < extractor.digitCount());

    // Four interleaved tables break the store-to-load dependency on runs of
    // equal digits.
    Histogram counts0{};
    Histogram counts1{};
    Histogram counts2{};
    Histogram counts3{};

    const core::usize n       = items.size();
    const core::usize unrolled = n - (n % 4);

    for (core::usize i = 0; i < unrolled; i += 4) {
        ++counts0[extractor.digitAt(items[i],     digit)];
        ++counts1[extractor.digitAt(items[i + 1], digit)];
        ++counts2[extractor.digitAt(items[i + 2], digit)];
        ++counts3[extractor.digitAt(items[i + 3], digit)];
    }
    for (core::usize i = unrolled; i < n; ++i)
        ++counts0[extractor.digitAt(items[i], digit)];

    for (core::usize b = 0; b < core::kRadix; ++b)
        counts0[b] += counts1[b] + counts2[b] + counts3[b];

    return counts0;
}

template <typename T, typename E>
    requires KeyExtractor<E, T>
Histogram countDigitsParallel(
    std::span<const T> items,
    const E &extractor,
    core::usize digit,
    concurrency::JobSystem &pool,
    core::usize chunks
) {
    chunks = std::clamp<core::usize>(chunks, 1, std::max<core::usize>(items.size(), 1));
    if (chunks == 1)
        return countDigits<T>(items, extractor, digit);

    const core::usize chunkSize = (items.size() + chunks - 1) / chunks;
    std::vector<Histogram> partial(chunks);

    concurrency::JobHandle handle{};
    try {
        for (core::usize c = 0; c < chunks; ++c) {
            const core::usize first = std::min(c * chunkSize, items.size());
            const core::usize last  = std::min(first + chunkSize, items.size());
            const auto slice = items.subspan(first, last - first);

            pool.kickJob([slice, &extractor, digit, out = &partial[c]]() {
                *out = countDigits<T>(slice, extractor, digit);
            }, handle);
        }
    } catch (...) {
        // Queued jobs point into this frame.
        pool.drainCounter(handle);
        throw;
    }
    pool.waitForCounter(handle);

    Histogram total{};
    for (const Histogram &h : partial)
        for (core::usize b = 0; b < core::kRadix; ++b)
            total[b] += h[b];
    return total;
}

template <typename T, typename E>
    requires KeyExtractor<E, T>
bool isUniformDigit(std::span<const T> items, const E &extractor, core::usize digit)
{
    if (items.size() < 2)
        return true;

    const core::u8 first = extractor.digitAt(items.front(), digit);
    if (extractor.digitAt(items.back(), digit) != first)
        return false;

    for (core::usize i = 1; i + 1 < items.size(); ++i)
        if (extractor.digitAt(items[i], digit) != first)
            return false;
    return true;
}

} // namespace rdx::radix

#endif // RDX_RADIX_HISTOGRAM_INL
