/**
 * @file Dispatcher.inl
 * @brief Implementation of ParallelDispatcher.
 * @see   Dispatcher.hpp
 */

#ifndef RDX_RADIX_DISPATCHER_INL
    #define RDX_RADIX_DISPATCHER_INL

    #include <rdx/radix/Profile.hpp>

    #include <algorithm>
    #include <array>

namespace rdx::radix {

inline ParallelDispatcher::ParallelDispatcher(const TuningTable &tuning,
                                              [[maybe_unused]] concurrency::JobSystem *pool) noexcept
    : _tuning(tuning)
#if RDX_MULTI_THREADED
    , _pool((pool != nullptr && pool->workerCount() > 1) ? pool : nullptr)
#else
    , _pool(nullptr)
#endif
    , _budget(_pool != nullptr ? _pool->workerCount() * tuning.taskBudgetPerWorker() : 0)
{
}

inline bool ParallelDispatcher::shouldSpawn(core::usize size, core::usize depth) const noexcept
{
    return _pool != nullptr
        && size >= _tuning.parallelSplitThreshold()
        && depth < _tuning.maxParallelDepth()
        && _inFlight.load(std::memory_order_relaxed) < _budget;
}

inline bool ParallelDispatcher::shouldCountInParallel(core::usize size) const noexcept
{
    return _pool != nullptr && size >= _tuning.parallelCountThreshold();
}

inline core::usize ParallelDispatcher::countChunks() const noexcept
{
    if (_pool == nullptr)
        return 1;
    return std::max<core::usize>(1, _pool->workerCount() * _tuning.parallelCountChunksPerWorker());
}

inline bool ParallelDispatcher::tryAcquireSlot() noexcept
{
    core::usize current = _inFlight.load(std::memory_order_relaxed);
    while (current < _budget) {
        if (_inFlight.compare_exchange_weak(current, current + 1, std::memory_order_acq_rel))
            return true;
    }
    return false;
}

inline void ParallelDispatcher::releaseSlot() noexcept
{
    _inFlight.fetch_sub(1, std::memory_order_acq_rel);
}

template <typename Fn>
void ParallelDispatcher::dispatch(const BucketBoundaries &bounds, core::usize childDigit, core::usize depth, Fn &&fn)
{
    std::array<bool, core::kRadix> spawned{};

    if (_pool == nullptr) {
        for (core::usize b = 0; b < core::kRadix; ++b) {
            if (bounds.size(b) < 2)
                continue;
            RDX_PROFILE_EVENT(recordInline());
            fn(bounds.child(b, childDigit), depth + 1);
        }
        return;
    }

    concurrency::JobHandle handle{};

    // Spawned jobs reference this frame; never leave it before they finish.
    struct JoinGuard {
        concurrency::JobSystem &pool;
        concurrency::JobHandle &handle;
        bool                    armed = true;

        ~JoinGuard()
        {
            if (armed)
                pool.drainCounter(handle);
        }
    } guard{*_pool, handle};

    for (core::usize b = 0; b < core::kRadix; ++b) {
        const core::usize size = bounds.size(b);
        if (size < 2 || !shouldSpawn(size, depth) || !tryAcquireSlot())
            continue;

        const Partition child = bounds.child(b, childDigit);
        try {
            _pool->kickJob([this, &fn, child, depth]() {
                struct SlotRelease {
                    ParallelDispatcher &owner;
                    ~SlotRelease() { owner.releaseSlot(); }
                } release{*this};
                fn(child, depth + 1);
            }, handle);
        } catch (...) {
            releaseSlot();
            throw;
        }
        spawned[b] = true;
        RDX_PROFILE_EVENT(recordSpawn());
    }

    for (core::usize b = 0; b < core::kRadix; ++b) {
        if (spawned[b] || bounds.size(b) < 2)
            continue;
        RDX_PROFILE_EVENT(recordInline());
        fn(bounds.child(b, childDigit), depth + 1);
    }

    guard.armed = false;
    _pool->waitForCounter(handle);
}

} // namespace rdx::radix

#endif // RDX_RADIX_DISPATCHER_INL
