/**
 * @file SmallSort.inl
 * @brief Template implementation of the small-partition sorter.
 * @see   SmallSort.hpp
 */

#ifndef RDX_RADIX_SMALL_SORT_INL
    #define RDX_RADIX_SMALL_SORT_INL

    #include <utility>

namespace rdx::radix {

template <typename T, typename E>
    requires KeyExtractor<E, T>
int compareDigits(const T &lhs, const T &rhs, const E &extractor, core::usize digit)
{
    const core::usize count = extractor.digitCount();
    for (core::usize d = digit; d < count; ++d) {
        const int l = extractor.digitAt(lhs, d);
        const int r = extractor.digitAt(rhs, d);
        if (l != r)
            return l - r;
    }
    return 0;
}

template <core::Permutable T, typename E>
    requires KeyExtractor<E, T>
void insertionSort(std::span<T> items, const E &extractor, core::usize digit)
{
    for (core::usize i = 1; i < items.size(); ++i) {
        if (compareDigits(items[i - 1], items[i], extractor, digit) <= 0)
            continue;

        T moving = std::move(items[i]);
        core::usize j = i;
        do {
            items[j] = std::move(items[j - 1]);
            --j;
        } while (j > 0 && compareDigits(moving, items[j - 1], extractor, digit) < 0);
        items[j] = std::move(moving);
    }
}

} // namespace rdx::radix

#endif // RDX_RADIX_SMALL_SORT_INL
