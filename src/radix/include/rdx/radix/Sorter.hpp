/**
 * @file Sorter.hpp
 * @brief MSD radix sort driver.
 *
 * A Sorter binds one sort call: the item sequence, the extractor, the
 * tuning table, the strategy tuner and the parallel dispatcher.  Every partition it processes
 * is a range of that single sequence; children of a partition are
 * disjoint, which is what lets the dispatcher run them concurrently
 * without locking.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef RDX_RADIX_SORTER_HPP
    #define RDX_RADIX_SORTER_HPP

    #include <rdx/concurrency/JobSystem.hpp>
    #include <rdx/core/Concepts.hpp>
    #include <rdx/core/NonCopyable.hpp>
    #include <rdx/core/Types.hpp>
    #include <rdx/radix/Dispatcher.hpp>
    #include <rdx/radix/Partition.hpp>
    #include <rdx/radix/RadixKey.hpp>
    #include <rdx/radix/Tuner.hpp>
    #include <rdx/radix/TuningTable.hpp>

    #include <span>

namespace rdx::radix {

template <core::Permutable T, typename E>
    requires KeyExtractor<E, T>
class Sorter final : public core::NonCopyable<Sorter<T, E>> {
public:
    /**
     * @param items     Sequence to sort in place.
     * @param extractor Key extractor, shared read-only by every worker.
     * @param tuning    Thresholds.
     * @param tuner     Strategy selector.
     * @param pool      Job system, or nullptr for a sequential sort.
     */
    Sorter(std::span<T> items, const E &extractor, const TuningTable &tuning, const ITuner &tuner,
           concurrency::JobSystem *pool);

    /// @brief Sort the whole sequence.  Returns once every spawned job
    ///        has been joined.
    void run();

private:
    /// Selector loop for one partition: skips uniform digits, then runs
    /// the terminal strategy.
    void sortPartition(Partition part, core::usize depth);

    /// Histogram, in-place bucket partition, then children at digit + 1.
    void msdRecurse(const Partition &part, core::usize depth);

    [[nodiscard]] std::span<T> slice(const Partition &part) const noexcept
    {
        return _items.subspan(part.start, part.size());
    }

    std::span<T>        _items;
    const E            &_extractor;
    core::usize         _digitCount;
    const TuningTable  &_tuning;
    const ITuner       &_tuner;
    ParallelDispatcher  _dispatcher;
};

} // namespace rdx::radix

    #include "Sorter.inl"

#endif // RDX_RADIX_SORTER_HPP
