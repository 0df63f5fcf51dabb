/**
 * @file TestStrategy.cpp
 * @brief Unit tests for the strategy selector.
 */

#include <catch2/catch.hpp>

#include "rdx/radix/Strategy.hpp"
#include "rdx/radix/TuningTable.hpp"

namespace rdx::radix {

TEST_CASE("pickStrategy follows the selection order", "[strategy]")
{
    const TuningTable tuning = TuningTable::Builder{}
        .smallSortThreshold(64)
        .countingSortThreshold(1000)
        .countingSortMaxDigits(2)
        .build();

    SECTION("trivial partitions are done")
    {
        REQUIRE(pickStrategy(tuning, 0, 4, false) == Strategy::kDone);
        REQUIRE(pickStrategy(tuning, 1, 4, false) == Strategy::kDone);
    }

    SECTION("small partitions are insertion sorted")
    {
        REQUIRE(pickStrategy(tuning, 2, 4, false) == Strategy::kSmallSort);
        REQUIRE(pickStrategy(tuning, 64, 4, true) == Strategy::kSmallSort);
        REQUIRE(pickStrategy(tuning, 64, 0, false) == Strategy::kSmallSort);
    }

    SECTION("no digits left")
    {
        REQUIRE(pickStrategy(tuning, 65, 0, false) == Strategy::kDone);
        REQUIRE(pickStrategy(tuning, 1'000'000, 0, true) == Strategy::kDone);
    }

    SECTION("uniform digit is skipped")
    {
        REQUIRE(pickStrategy(tuning, 65, 1, true) == Strategy::kSkip);
        REQUIRE(pickStrategy(tuning, 1'000'000, 8, true) == Strategy::kSkip);
    }

    SECTION("counting sort for medium partitions with few digits")
    {
        REQUIRE(pickStrategy(tuning, 65, 2, false) == Strategy::kCountingSort);
        REQUIRE(pickStrategy(tuning, 1000, 1, false) == Strategy::kCountingSort);
        REQUIRE(pickStrategy(tuning, 1000, 3, false) == Strategy::kMsdRecurse);
        REQUIRE(pickStrategy(tuning, 1001, 2, false) == Strategy::kMsdRecurse);
    }
}

TEST_CASE("needsUniformScan only when the flag matters", "[strategy]")
{
    const TuningTable &tuning = TuningTable::defaults();
    const core::usize small = tuning.smallSortThreshold();

    REQUIRE_FALSE(needsUniformScan(tuning, 1, 4));
    REQUIRE_FALSE(needsUniformScan(tuning, small, 4));
    REQUIRE_FALSE(needsUniformScan(tuning, small + 1, 0));
    REQUIRE(needsUniformScan(tuning, small + 1, 1));

    for (core::usize length : {core::usize{0}, core::usize{1}, small, small + 1, core::usize{1} << 20})
        for (core::usize remaining : {0, 1, 4})
            if (!needsUniformScan(tuning, length, remaining))
                REQUIRE(pickStrategy(tuning, length, remaining, true) == pickStrategy(tuning, length, remaining, false));
}

TEST_CASE("Strategy names", "[strategy]")
{
    REQUIRE(toString(Strategy::kDone) == "Done");
    REQUIRE(toString(Strategy::kSkip) == "Skip");
    REQUIRE(toString(Strategy::kSmallSort) == "SmallSort");
    REQUIRE(toString(Strategy::kCountingSort) == "CountingSort");
    REQUIRE(toString(Strategy::kMsdRecurse) == "MsdRecurse");
}

} // namespace rdx::radix
