// /////////////////////////////////////////////////////////////////////////////
/// @file Profile.cpp
/// @brief Profile counters and report.
// /////////////////////////////////////////////////////////////////////////////

#include <rdx/radix/Profile.hpp>

#include <format>

namespace rdx::radix {

Profile& Profile::global() noexcept
{
    static Profile instance;
    return instance;
}

void Profile::record(Strategy strategy, core::usize items, core::u64 nanoseconds) noexcept
{
    Counters& c = counters_[static_cast<core::usize>(strategy)];
    c.calls.fetch_add(1, std::memory_order_relaxed);
    c.items.fetch_add(items, std::memory_order_relaxed);
    c.nanoseconds.fetch_add(nanoseconds, std::memory_order_relaxed);
}

void Profile::recordSpawn() noexcept
{
    spawned_.fetch_add(1, std::memory_order_relaxed);
}

void Profile::recordInline() noexcept
{
    inline_.fetch_add(1, std::memory_order_relaxed);
}

ProfileSnapshot Profile::snapshot() const noexcept
{
    ProfileSnapshot snap;
    for (core::usize i = 0; i < kStrategyCount; ++i)
    {
        snap.strategies[i].calls       = counters_[i].calls.load(std::memory_order_relaxed);
        snap.strategies[i].items       = counters_[i].items.load(std::memory_order_relaxed);
        snap.strategies[i].nanoseconds = counters_[i].nanoseconds.load(std::memory_order_relaxed);
    }
    snap.spawnedChildren = spawned_.load(std::memory_order_relaxed);
    snap.inlineChildren  = inline_.load(std::memory_order_relaxed);
    return snap;
}

void Profile::reset() noexcept
{
    for (Counters& c : counters_)
    {
        c.calls.store(0, std::memory_order_relaxed);
        c.items.store(0, std::memory_order_relaxed);
        c.nanoseconds.store(0, std::memory_order_relaxed);
    }
    spawned_.store(0, std::memory_order_relaxed);
    inline_.store(0, std::memory_order_relaxed);
}

std::string Profile::report() const
{
    const ProfileSnapshot snap = snapshot();

    std::string out = std::format("  {:<14} {:>12} {:>14} {:>12}\n", "strategy", "calls", "items", "ms");
    for (core::usize i = 0; i < kStrategyCount; ++i)
    {
        const StrategyStats& s = snap.strategies[i];
        out += std::format("  {:<14} {:>12} {:>14} {:>12.3f}\n",
                           toString(static_cast<Strategy>(i)), s.calls, s.items,
                           static_cast<core::f64>(s.nanoseconds) / 1.0e6);
    }
    out += std::format("  children: {} spawned, {} inline\n", snap.spawnedChildren, snap.inlineChildren);
    return out;
}

} // namespace rdx::radix
