// /////////////////////////////////////////////////////////////////////////////
/// @file main.cpp
/// @brief rdx benchmark entry-point.
///
/// Times radix::sort against std::sort on several item counts and key
/// widths, sequentially and on a JobSystem, and checks every result.
///
/// Usage: rdx_benchmark [tuning-file]
// /////////////////////////////////////////////////////////////////////////////

#include <rdx/core/Types.hpp>
#include <rdx/core/Log.hpp>
#include <rdx/core/Platform.hpp>
#include <rdx/concurrency/JobSystem.hpp>
#include <rdx/radix/Profile.hpp>
#include <rdx/radix/Sort.hpp>
#include <rdx/radix/TuningTable.hpp>

#include <algorithm>
#include <chrono>
#include <cstdio>
#include <format>
#include <random>
#include <utility>
#include <vector>

using namespace rdx;

namespace {

template <typename Fn>
core::f64 benchmarkMs(const char* label, Fn&& fn)
{
    const auto start = std::chrono::steady_clock::now();
    fn();
    const auto end = std::chrono::steady_clock::now();
    const core::f64 ms = std::chrono::duration<core::f64, std::milli>(end - start).count();
    std::printf("  %-36s %10.3f ms\n", label, ms);
    return ms;
}

template <typename T>
std::vector<T> randomItems(core::usize count, core::u64 seed)
{
    std::mt19937_64 rng{seed};
    std::vector<T> items(count);
    for (auto& item : items)
    {
        if constexpr (requires { item.first; item.second; })
        {
            item.first  = static_cast<typename T::first_type>(rng());
            item.second = static_cast<typename T::second_type>(rng());
        }
        else
        {
            item = static_cast<T>(rng());
        }
    }
    return items;
}

/// @return False if any radix result differs from std::sort.
template <typename T>
bool benchmarkKeyType(const char* name, core::usize count,
                      concurrency::JobSystem& pool, const radix::TuningTable& tuning)
{
    std::printf("\n[%s] %zu items\n", name, count);

    const std::vector<T> input = randomItems<T>(count, 0x5EED + count);

    auto reference = input;
    benchmarkMs("std::sort", [&]() { std::sort(reference.begin(), reference.end()); });

    auto sequential = input;
    benchmarkMs("radix::sort (1 thread)", [&]() { radix::sort(sequential, nullptr, tuning); });

    auto parallel = input;
    const auto label = std::format("radix::sort ({} workers)", pool.workerCount());
    benchmarkMs(label.c_str(), [&]() { radix::sort(parallel, &pool, tuning); });

    const bool ok = sequential == reference && parallel == reference;
    if (!ok)
    {
        core::Log::error(std::format("{} x {}: radix output differs from std::sort", name, count));
    }
    return ok;
}

} // anonymous namespace

int main(int argc, char* argv[])
{
    core::Log::info("=== rdx Benchmark ===");

    radix::TuningTable tuning = radix::TuningTable::defaults();
    if (argc > 1)
    {
        auto loaded = radix::TuningTable::fromFile(argv[1]);
        if (!loaded)
        {
            core::Log::error(std::format("{}: {}", core::toString(loaded.error().code()), loaded.error().message()));
            return 1;
        }
        tuning = *loaded;
    }

    auto pool = concurrency::JobSystem::create();
    if (!pool)
    {
        core::Log::error(pool.error().message());
        return 1;
    }

    std::printf("\nActive tuning:\n%s", tuning.toString().c_str());

    bool ok = true;
    for (core::usize count : {core::usize{10'000}, core::usize{1'000'000}, core::usize{10'000'000}})
    {
        ok &= benchmarkKeyType<core::u32>("u32", count, **pool, tuning);
        ok &= benchmarkKeyType<core::u64>("u64", count, **pool, tuning);
        ok &= benchmarkKeyType<std::pair<core::u32, core::u64>>("(u32, u64)", count, **pool, tuning);
    }

#if RDX_PROFILING
    std::printf("\nProfile:\n%s", radix::Profile::global().report().c_str());
#endif

    std::printf("\n%s\n", ok ? "Done." : "FAILED.");
    return ok ? 0 : 1;
}
