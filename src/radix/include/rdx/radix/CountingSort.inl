/**
 * @file CountingSort.inl
 * @brief Template implementation of lsdCountingSort.
 * @see   CountingSort.hpp
 */

#ifndef RDX_RADIX_COUNTING_SORT_INL
    #define RDX_RADIX_COUNTING_SORT_INL

    #include <rdx/radix/Histogram.hpp>

    #include <algorithm>
    #include <iterator>
    #include <utility>
    #include <vector>

namespace rdx::radix {

template <core::Permutable T, typename E>
    requires KeyExtractor<E, T>
void lsdCountingSort(std::span<T> items, const E &extractor, core::usize fromDigit)
{
    const core::usize digitCount = extractor.digitCount();
    if (items.size() < 2 || fromDigit >= digitCount)
        return;

    // Counts do not depend on order, so one read pass picks the digits
    // that need a pass.
    const core::usize levels = digitCount - fromDigit;
    std::vector<Histogram> counts(levels, Histogram{});
    for (const T &item : items)
        for (core::usize d = fromDigit; d < digitCount; ++d)
            ++counts[d - fromDigit][extractor.digitAt(item, d)];

    std::vector<core::usize> passes;
    passes.reserve(levels);
    for (core::usize d = digitCount; d-- > fromDigit;)
        if (!isUniform(counts[d - fromDigit]))
            passes.push_back(d);

    if (passes.empty())
        return;

    std::vector<T> scratch(std::make_move_iterator(items.begin()), std::make_move_iterator(items.end()));
    std::span<T> src{scratch};
    std::span<T> dst{items};

    // Each pass scatters by the digits it read itself, so the write
    // offsets always fit the range.
    std::vector<core::u8> digits(items.size());
    for (core::usize d : passes) {
        Histogram heads{};
        for (core::usize i = 0; i < src.size(); ++i) {
            digits[i] = extractor.digitAt(src[i], d);
            ++heads[digits[i]];
        }
        heads = prefixSums(heads);
        for (core::usize i = 0; i < src.size(); ++i)
            dst[heads[digits[i]]++] = std::move(src[i]);
        std::swap(src, dst);
    }

    if (src.data() != items.data())
        std::move(src.begin(), src.end(), items.begin());
}

} // namespace rdx::radix

#endif // RDX_RADIX_COUNTING_SORT_INL
