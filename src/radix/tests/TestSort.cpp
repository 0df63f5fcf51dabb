/**
 * @file TestSort.cpp
 * @brief End-to-end tests for radix::sort and radix::trySort.
 */

#include <catch2/catch.hpp>

#include "rdx/radix/Sort.hpp"

#include <algorithm>
#include <array>
#include <atomic>
#include <limits>
#include <random>
#include <stdexcept>
#include <string>
#include <vector>

namespace rdx::radix {

namespace {

using Key3 = std::array<core::u8, 3>;

struct Item {
    Key3        key;
    core::u32   id;
};

template <typename T, typename E>
bool isSortedByKey(const std::vector<T> &items, const E &extractor)
{
    for (std::size_t i = 1; i < items.size(); ++i)
        if (compareDigits(items[i - 1], items[i], extractor, 0) > 0)
            return false;
    return true;
}

template <typename T>
std::vector<T> randomValues(std::size_t count, core::u32 seed)
{
    std::mt19937_64 rng{seed};
    std::vector<T> values(count);
    for (auto &v : values)
        v = static_cast<T>(rng());
    return values;
}

/// Tuning that forces the MSD path down to tiny partitions and spawns
/// eagerly, so small inputs exercise the parallel code.
TuningTable aggressiveTuning()
{
    return TuningTable::Builder{}
        .smallSortThreshold(4)
        .countingSortThreshold(0)
        .parallelSplitThreshold(16)
        .parallelCountThreshold(1024)
        .maxParallelDepth(8)
        .build();
}

} // namespace

TEST_CASE("Sorting single-byte keys", "[sort]")
{
    std::vector<core::u8> items = {170, 45, 75, 2, 255, 0};
    radix::sort(items);
    REQUIRE(items == std::vector<core::u8>{0, 2, 45, 75, 170, 255});
}

TEST_CASE("Sorting is independent of the thread count", "[sort][parallel]")
{
    const auto input = randomValues<core::u32>(100'000, 2024);
    const TraitsExtractor<core::u32> extractor;

    auto sequential = input;
    radix::sort(sequential);

    concurrency::JobSystem pool{4};
    auto parallel = input;
    radix::sort(parallel, &pool);

    auto aggressive = input;
    radix::sort(aggressive, extractor, &pool, aggressiveTuning());

    auto reference = input;
    std::sort(reference.begin(), reference.end());

    REQUIRE(sequential == reference);
    REQUIRE(parallel == reference);
    REQUIRE(aggressive == reference);
}

TEST_CASE("Sorting all-equal keys keeps every item", "[sort]")
{
    std::vector<Item> items;
    for (core::u32 i = 0; i < 1000; ++i)
        items.push_back(Item{{1, 2, 3}, i});

    const auto byKey = makeExtractor(3, [](const Item &item, core::usize i) { return item.key[i]; });
    radix::sort(items, byKey);

    REQUIRE(items.size() == 1000);
    std::vector<bool> present(1000, false);
    for (const Item &item : items) {
        REQUIRE(item.key == Key3{1, 2, 3});
        present[item.id] = true;
    }
    REQUIRE(std::all_of(present.begin(), present.end(), [](bool p) { return p; }));
}

TEST_CASE("Sorting descending keys yields ascending order", "[sort]")
{
    std::vector<core::u16> items;
    for (core::i32 v = 65535; v >= 0; v -= 7)
        items.push_back(static_cast<core::u16>(v));

    radix::sort(items);
    REQUIRE(std::is_sorted(items.begin(), items.end()));
    REQUIRE(items.front() == 65535 % 7);
    REQUIRE(items.back() == 65535);
}

TEST_CASE("Sorting with a zero-digit extractor preserves the items", "[sort]")
{
    auto items = randomValues<core::u32>(5000, 11);
    auto expected = items;

    const auto noDigits = makeExtractor(0, [](core::u32, core::usize) -> core::u8 { return 0; });
    radix::sort(items, noDigits);

    std::sort(items.begin(), items.end());
    std::sort(expected.begin(), expected.end());
    REQUIRE(items == expected);
}

TEST_CASE("Sorting trivial inputs", "[sort]")
{
    std::vector<core::u64> empty;
    radix::sort(empty);
    REQUIRE(empty.empty());

    std::vector<core::u64> single = {99};
    radix::sort(single);
    REQUIRE(single == std::vector<core::u64>{99});
}

TEST_CASE("Sorting is idempotent", "[sort]")
{
    auto items = randomValues<core::u64>(20'000, 3);
    radix::sort(items);
    const auto once = items;
    radix::sort(items);
    REQUIRE(items == once);
}

TEST_CASE("Sorting key types with default traits", "[sort]")
{
    SECTION("signed integers")
    {
        auto items = randomValues<core::i64>(30'000, 17);
        items.push_back(std::numeric_limits<core::i64>::min());
        items.push_back(std::numeric_limits<core::i64>::max());
        auto expected = items;
        std::sort(expected.begin(), expected.end());

        radix::sort(items);
        REQUIRE(items == expected);
    }

    SECTION("floating point")
    {
        std::mt19937 rng{8};
        std::uniform_real_distribution<core::f64> dist{-1.0e6, 1.0e6};
        std::vector<core::f64> items(20'000);
        for (auto &v : items)
            v = dist(rng);
        auto expected = items;
        std::sort(expected.begin(), expected.end());

        radix::sort(items);
        REQUIRE(items == expected);
    }

    SECTION("pairs order by first then second")
    {
        std::mt19937 rng{21};
        std::vector<std::pair<core::u8, core::u32>> items(10'000);
        for (auto &[a, b] : items) {
            a = static_cast<core::u8>(rng() % 4);
            b = rng();
        }
        auto expected = items;
        std::sort(expected.begin(), expected.end());

        radix::sort(items);
        REQUIRE(items == expected);
    }
}

TEST_CASE("Sorting records by a partial key", "[sort]")
{
    std::mt19937 rng{77};
    std::vector<std::pair<core::u32, std::string>> records;
    for (int i = 0; i < 3000; ++i) {
        const core::u32 key = rng() % 500;
        records.emplace_back(key, std::to_string(key));
    }

    const auto byKey = makeExtractor(4, [](const std::pair<core::u32, std::string> &r, core::usize i) {
        return RadixKeyTraits<core::u32>::digitAt(r.first, i);
    });

    concurrency::JobSystem pool{3};
    radix::sort(records, byKey, &pool, aggressiveTuning());

    REQUIRE(isSortedByKey(records, byKey));
    for (const auto &[key, text] : records)
        REQUIRE(text == std::to_string(key));
}

TEST_CASE("Sorting with every strategy forced", "[sort]")
{
    const auto input = randomValues<core::u32>(40'000, 99);
    auto reference = input;
    std::sort(reference.begin(), reference.end());

    SECTION("insertion sort only")
    {
        auto items = std::vector<core::u32>(input.begin(), input.begin() + 500);
        auto expected = items;
        std::sort(expected.begin(), expected.end());
        radix::sort(items, nullptr, TuningTable::Builder{}.smallSortThreshold(1000).build());
        REQUIRE(items == expected);
    }

    SECTION("counting sort at the root")
    {
        auto items = input;
        radix::sort(items, nullptr, TuningTable::Builder{}.countingSortThreshold(50'000).countingSortMaxDigits(4).build());
        REQUIRE(items == reference);
    }

    SECTION("msd recursion to the last digit")
    {
        auto items = input;
        radix::sort(items, nullptr, TuningTable::Builder{}.smallSortThreshold(1).countingSortThreshold(0).build());
        REQUIRE(items == reference);
    }
}

TEST_CASE("Sorting with an inconsistent extractor keeps every item", "[sort]")
{
    const auto input = randomValues<core::u32>(100'000, 41);
    auto expected = input;
    std::sort(expected.begin(), expected.end());

    // Every call answers a fresh byte, so no two passes agree on a key.
    std::atomic<core::u64> calls{0};
    const auto noisy = makeExtractor(2, [&calls](core::u32, core::usize) -> core::u8 {
        core::u64 x = calls.fetch_add(1, std::memory_order_relaxed) * 0x9E3779B97F4A7C15ull;
        x ^= x >> 31;
        x *= 0xBF58476D1CE4E5B9ull;
        return static_cast<core::u8>(x >> 56);
    });

    auto checkSameItems = [&](std::vector<core::u32> items) {
        REQUIRE(items.size() == expected.size());
        std::sort(items.begin(), items.end());
        REQUIRE(items == expected);
    };

    SECTION("msd partitioning")
    {
        auto items = input;
        radix::sort(items, noisy);
        checkSameItems(items);
    }

    SECTION("counting sort")
    {
        auto items = input;
        radix::sort(items, noisy, nullptr, TuningTable::Builder{}.countingSortThreshold(200'000).build());
        checkSameItems(items);
    }

#if RDX_MULTI_THREADED
    SECTION("parallel")
    {
        concurrency::JobSystem pool{4};
        auto items = input;
        radix::sort(items, noisy, &pool, aggressiveTuning());
        checkSameItems(items);
    }
#endif
}

TEST_CASE("trySort reports configuration errors", "[sort]")
{
    std::vector<core::u32> items = {3, 1, 2};

    const TuningTable invalid = TuningTable::Builder{}.parallelCountChunksPerWorker(0).build();
    const auto result = radix::trySort(items, nullptr, invalid);
    REQUIRE_FALSE(result.has_value());
    REQUIRE(result.error().code() == core::ErrorCode::kInvalidArgument);
    REQUIRE(items == std::vector<core::u32>{3, 1, 2});

    REQUIRE(radix::trySort(items).has_value());
    REQUIRE(items == std::vector<core::u32>{1, 2, 3});
}

TEST_CASE("trySort lets extractor exceptions through", "[sort]")
{
    std::vector<core::u32> items(200, 1);
    const auto failing = makeExtractor(4, [](core::u32, core::usize) -> core::u8 {
        throw std::logic_error("extractor failed");
    });
    REQUIRE_THROWS_AS((void)radix::trySort(items, failing), std::logic_error);
}

} // namespace rdx::radix
