/**
 * @file TestDispatcher.cpp
 * @brief Unit tests for ParallelDispatcher.
 */

#include <catch2/catch.hpp>

#include "rdx/radix/Dispatcher.hpp"

#include <atomic>
#include <mutex>
#include <stdexcept>
#include <vector>

namespace rdx::radix {

namespace {

BucketBoundaries evenBuckets(core::usize perBucket, core::usize origin = 0)
{
    Histogram h{};
    h.fill(perBucket);
    return BucketBoundaries::fromHistogram(h, origin);
}

} // namespace

TEST_CASE("ParallelDispatcher without a pool runs everything inline", "[dispatcher]")
{
    ParallelDispatcher dispatcher{TuningTable::defaults(), nullptr};

    REQUIRE(dispatcher.pool() == nullptr);
    REQUIRE_FALSE(dispatcher.shouldSpawn(core::usize{1} << 30, 0));
    REQUIRE_FALSE(dispatcher.shouldCountInParallel(core::usize{1} << 30));
    REQUIRE(dispatcher.countChunks() == 1);

    Histogram h{};
    h[3] = 5;
    h[7] = 1;
    h[200] = 2;
    const BucketBoundaries bounds = BucketBoundaries::fromHistogram(h, 100);

    std::vector<Partition> seen;
    dispatcher.dispatch(bounds, 2, 0, [&seen](Partition child, core::usize depth) {
        REQUIRE(depth == 1);
        seen.push_back(child);
    });

    // Single-item buckets are already sorted and are not visited.
    REQUIRE(seen.size() == 2);
    REQUIRE(seen[0].start == 100);
    REQUIRE(seen[0].end == 105);
    REQUIRE(seen[0].digit == 2);
    REQUIRE(seen[1].start == 106);
    REQUIRE(seen[1].end == 108);
}

TEST_CASE("ParallelDispatcher spawn policy", "[dispatcher]")
{
    const TuningTable tuning = TuningTable::Builder{}
        .parallelSplitThreshold(1000)
        .parallelCountThreshold(5000)
        .parallelCountChunksPerWorker(3)
        .maxParallelDepth(2)
        .build();

    SECTION("single worker pool is ignored")
    {
        concurrency::JobSystem one{1};
        ParallelDispatcher dispatcher{tuning, &one};
        REQUIRE(dispatcher.pool() == nullptr);
    }

#if RDX_MULTI_THREADED
    SECTION("multi-worker pool")
    {
        concurrency::JobSystem pool{4};
        ParallelDispatcher dispatcher{tuning, &pool};

        REQUIRE(dispatcher.pool() == &pool);
        REQUIRE(dispatcher.countChunks() == 12);

        REQUIRE(dispatcher.shouldSpawn(1000, 0));
        REQUIRE(dispatcher.shouldSpawn(1000, 1));
        REQUIRE_FALSE(dispatcher.shouldSpawn(999, 0));
        REQUIRE_FALSE(dispatcher.shouldSpawn(1000, 2));

        REQUIRE(dispatcher.shouldCountInParallel(5000));
        REQUIRE_FALSE(dispatcher.shouldCountInParallel(4999));
    }
#endif
}

TEST_CASE("ParallelDispatcher visits every child once with a pool", "[dispatcher][parallel]")
{
    const TuningTable tuning = TuningTable::Builder{}
        .parallelSplitThreshold(10)
        .taskBudgetPerWorker(2)
        .build();

    concurrency::JobSystem pool{4};
    ParallelDispatcher dispatcher{tuning, &pool};

    const BucketBoundaries bounds = evenBuckets(10);

    std::mutex mutex;
    std::vector<int> hits(core::kRadix, 0);
    dispatcher.dispatch(bounds, 1, 0, [&](Partition child, core::usize) {
        std::lock_guard<std::mutex> lock{mutex};
        ++hits[child.start / 10];
    });

    for (int h : hits)
        REQUIRE(h == 1);
    REQUIRE(dispatcher.inFlight() == 0);
}

#if RDX_MULTI_THREADED
TEST_CASE("ParallelDispatcher joins spawned children before propagating errors", "[dispatcher][parallel]")
{
    const TuningTable tuning = TuningTable::Builder{}.parallelSplitThreshold(10).build();

    concurrency::JobSystem pool{4};
    ParallelDispatcher dispatcher{tuning, &pool};

    const BucketBoundaries bounds = evenBuckets(10);

    std::atomic<int> finished{0};
    REQUIRE_THROWS_AS(
        dispatcher.dispatch(bounds, 1, 0, [&finished](Partition child, core::usize) {
            if (child.start == 50 * 10)
                throw std::runtime_error("child failed");
            finished.fetch_add(1, std::memory_order_relaxed);
        }),
        std::runtime_error);

    // Every other child ran to completion before dispatch returned.
    REQUIRE(finished.load() == static_cast<int>(core::kRadix) - 1);
    REQUIRE(dispatcher.inFlight() == 0);
}
#endif

} // namespace rdx::radix
