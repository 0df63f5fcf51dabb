/**
 * @file Sorter.inl
 * @brief Template implementation of the MSD driver.
 * @see   Sorter.hpp
 */

#ifndef RDX_RADIX_SORTER_INL
    #define RDX_RADIX_SORTER_INL

    #include <rdx/core/Assert.hpp>
    #include <rdx/core/Log.hpp>
    #include <rdx/radix/BucketPartitioner.hpp>
    #include <rdx/radix/CountingSort.hpp>
    #include <rdx/radix/Histogram.hpp>
    #include <rdx/radix/Profile.hpp>
    #include <rdx/radix/SmallSort.hpp>
    #include <rdx/radix/Strategy.hpp>
    #include <rdx/radix/Tuner.hpp>

    #include <format>

namespace rdx::radix {

template <core::Permutable T, typename E>
    requires KeyExtractor<E, T>
Sorter<T, E>::Sorter(std::span<T> items, const E &extractor, const TuningTable &tuning, const ITuner &tuner,
                     concurrency::JobSystem *pool)
    : _items(items)
    , _extractor(extractor)
    , _digitCount(extractor.digitCount())
    , _tuning(tuning)
    , _tuner(tuner)
    , _dispatcher(tuning, pool)
{
}

template <core::Permutable T, typename E>
    requires KeyExtractor<E, T>
void Sorter<T, E>::run()
{
    if (core::Log::enabled(core::LogLevel::kDebug)) {
        const core::u32 workers = _dispatcher.pool() != nullptr ? _dispatcher.pool()->workerCount() : 1;
        core::Log::debug("rdx", std::format("sorting {} items on {} digits, {} worker(s)",
                                            _items.size(), _digitCount, workers));
    }

    sortPartition(Partition{0, _items.size(), 0}, 0);
}

template <core::Permutable T, typename E>
    requires KeyExtractor<E, T>
void Sorter<T, E>::sortPartition(Partition part, core::usize depth)
{
    for (;;) {
        const core::usize length    = part.size();
        const core::usize remaining = part.digit < _digitCount ? _digitCount - part.digit : 0;

        PartitionInfo info{length, remaining, depth, false};
        info.uniform = remaining > 0 && _tuner.wantsUniformScan(_tuning, info)
                    && isUniformDigit<T>(slice(part), _extractor, part.digit);

        Strategy strategy = _tuner.pick(_tuning, info);
        if (remaining == 0 && (strategy == Strategy::kSkip || strategy == Strategy::kMsdRecurse))
            strategy = Strategy::kDone;

        switch (strategy) {
            case Strategy::kDone:
                RDX_PROFILE_EVENT(record(Strategy::kDone, length, 0));
                return;

            case Strategy::kSkip:
                RDX_PROFILE_EVENT(record(Strategy::kSkip, length, 0));
                ++part.digit;
                continue;

            case Strategy::kSmallSort: {
                RDX_PROFILE_SCOPE(Strategy::kSmallSort, length);
                insertionSort(slice(part), _extractor, part.digit);
                return;
            }

            case Strategy::kCountingSort: {
                RDX_PROFILE_SCOPE(Strategy::kCountingSort, length);
                lsdCountingSort(slice(part), _extractor, part.digit);
                return;
            }

            case Strategy::kMsdRecurse:
                msdRecurse(part, depth);
                return;
        }
        RDX_UNREACHABLE();
    }
}

template <core::Permutable T, typename E>
    requires KeyExtractor<E, T>
void Sorter<T, E>::msdRecurse(const Partition &part, core::usize depth)
{
    RDX_ASSERT(part.digit < _digitCount);

    BucketBoundaries bounds;
    {
        RDX_PROFILE_SCOPE(Strategy::kMsdRecurse, part.size());

        const std::span<T> range = slice(part);
        concurrency::JobSystem *pool = _dispatcher.pool();

        const Histogram counts = (pool != nullptr && _dispatcher.shouldCountInParallel(range.size()))
            ? countDigitsParallel<T>(range, _extractor, part.digit, *pool, _dispatcher.countChunks())
            : countDigits<T>(range, _extractor, part.digit);

        bounds = partitionInPlace(range, _extractor, part.digit, counts, part.start);
    }

    // Last digit: every bucket already holds equal keys.
    if (part.digit + 1 == _digitCount)
        return;

    _dispatcher.dispatch(bounds, part.digit + 1, depth, [this](Partition child, core::usize childDepth) {
        sortPartition(child, childDepth);
    });
}

} // namespace rdx::radix

#endif // RDX_RADIX_SORTER_INL
