/**
 * @file TestProfile.cpp
 * @brief Unit tests for the engine's profile counters.
 */

#include <catch2/catch.hpp>

#include "rdx/radix/Profile.hpp"
#include "rdx/radix/Sort.hpp"

#include <random>
#include <vector>

namespace rdx::radix {

TEST_CASE("Profile accumulates per-strategy counters", "[profile]")
{
    Profile profile;

    profile.record(Strategy::kSmallSort, 10, 500);
    profile.record(Strategy::kSmallSort, 20, 700);
    profile.record(Strategy::kMsdRecurse, 1000, 9000);
    profile.recordSpawn();
    profile.recordInline();
    profile.recordInline();

    const ProfileSnapshot snap = profile.snapshot();
    REQUIRE(snap[Strategy::kSmallSort].calls == 2);
    REQUIRE(snap[Strategy::kSmallSort].items == 30);
    REQUIRE(snap[Strategy::kSmallSort].nanoseconds == 1200);
    REQUIRE(snap[Strategy::kMsdRecurse].calls == 1);
    REQUIRE(snap[Strategy::kCountingSort].calls == 0);
    REQUIRE(snap.spawnedChildren == 1);
    REQUIRE(snap.inlineChildren == 2);

    const std::string report = profile.report();
    REQUIRE(report.find("SmallSort") != std::string::npos);
    REQUIRE(report.find("MsdRecurse") != std::string::npos);
    REQUIRE(report.find("1 spawned, 2 inline") != std::string::npos);

    profile.reset();
    REQUIRE(profile.snapshot()[Strategy::kSmallSort].calls == 0);
    REQUIRE(profile.snapshot().inlineChildren == 0);
}

TEST_CASE("ProfileScope records one timed call", "[profile]")
{
    Profile profile;
    {
        ProfileScope scope{Strategy::kCountingSort, 123, profile};
    }
    const ProfileSnapshot snap = profile.snapshot();
    REQUIRE(snap[Strategy::kCountingSort].calls == 1);
    REQUIRE(snap[Strategy::kCountingSort].items == 123);
}

#if RDX_PROFILING
TEST_CASE("Sorting feeds the global profile", "[profile][sort]")
{
    std::mt19937 rng{5};
    std::vector<core::u32> items(100'000);
    for (auto &v : items)
        v = rng();

    Profile::global().reset();
    radix::sort(items);

    const ProfileSnapshot snap = Profile::global().snapshot();
    REQUIRE(snap[Strategy::kMsdRecurse].calls >= 1);
    REQUIRE(snap[Strategy::kMsdRecurse].items >= items.size());
    REQUIRE(snap.inlineChildren >= 1);
}
#endif

} // namespace rdx::radix
