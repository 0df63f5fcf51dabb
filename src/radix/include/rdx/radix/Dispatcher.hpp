/**
 * @file Dispatcher.hpp
 * @brief Fork/join of MSD child partitions on a JobSystem.
 *
 * One dispatcher lives for the duration of a sort call.  It decides, per
 * child partition, whether the child becomes a job or runs inline on the
 * thread that produced it, and it joins every job it spawned before the
 * parent partition is considered done.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef RDX_RADIX_DISPATCHER_HPP
    #define RDX_RADIX_DISPATCHER_HPP

    #include <rdx/concurrency/JobSystem.hpp>
    #include <rdx/core/NonCopyable.hpp>
    #include <rdx/core/Platform.hpp>
    #include <rdx/core/Types.hpp>
    #include <rdx/radix/Partition.hpp>
    #include <rdx/radix/TuningTable.hpp>

    #include <atomic>

namespace rdx::radix {

/**
 * @brief Spawn-or-inline policy plus the fork/join itself.
 *
 * A child is spawned only if threading is compiled in, the pool has more
 * than one worker, the child holds at least parallelSplitThreshold items,
 * the parent's depth is below maxParallelDepth and fewer than
 * workerCount * taskBudgetPerWorker spawned children are still running.
 */
class ParallelDispatcher final : public core::NonCopyable<ParallelDispatcher> {
public:
    /**
     * @param tuning Thresholds; must outlive the dispatcher.
     * @param pool   Job system, or nullptr for a sequential sort.
     */
    ParallelDispatcher(const TuningTable &tuning, concurrency::JobSystem *pool) noexcept;

    /// @brief The pool the engine may use, nullptr when sorting sequentially.
    [[nodiscard]] concurrency::JobSystem *pool() const noexcept { return _pool; }

    [[nodiscard]] bool shouldSpawn(core::usize size, core::usize depth) const noexcept;

    /// @brief True if a histogram over @p size items should be split.
    [[nodiscard]] bool shouldCountInParallel(core::usize size) const noexcept;

    /// @brief Number of chunks for a parallel histogram.
    [[nodiscard]] core::usize countChunks() const noexcept;

    /// @brief Spawned children currently queued or running.
    [[nodiscard]] core::usize inFlight() const noexcept { return _inFlight.load(std::memory_order_relaxed); }

    /**
     * @brief Run @p fn on every child bucket of @p bounds holding at least
     *        two items, then join.
     *
     * Eligible children are kicked first so workers can start on them
     * while the calling thread handles the rest inline.  If an inline
     * child throws, spawned children are still drained before the
     * exception leaves; otherwise the first exception of a spawned child
     * is rethrown after the join.
     *
     * @param bounds     Buckets of the parent partition.
     * @param childDigit Digit index the children are sorted from.
     * @param depth      Recursion depth of the parent.
     * @param fn         Callable `(Partition child, usize childDepth)`.
     */
    template <typename Fn>
    void dispatch(const BucketBoundaries &bounds, core::usize childDigit, core::usize depth, Fn &&fn);

private:
    bool tryAcquireSlot() noexcept;
    void releaseSlot() noexcept;

    const TuningTable        &_tuning;
    concurrency::JobSystem   *_pool;
    core::usize               _budget;
    std::atomic<core::usize>  _inFlight{0};
};

} // namespace rdx::radix

    #include "Dispatcher.inl"

#endif // RDX_RADIX_DISPATCHER_HPP
