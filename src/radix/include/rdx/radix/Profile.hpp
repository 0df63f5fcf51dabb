// /////////////////////////////////////////////////////////////////////////////
/// @file Profile.hpp
/// @brief Per-strategy counters of the sort engine.
///
/// The engine only touches the profile through RDX_PROFILE_SCOPE and
/// RDX_PROFILE_EVENT, which expand to nothing unless the build defines
/// RDX_PROFILING=1.  The Profile class itself is always available so that
/// tooling can link against it unconditionally.
// /////////////////////////////////////////////////////////////////////////////
#pragma once

#include <rdx/core/NonCopyable.hpp>
#include <rdx/core/Platform.hpp>
#include <rdx/core/Types.hpp>
#include <rdx/radix/Strategy.hpp>

#include <array>
#include <atomic>
#include <chrono>
#include <string>

namespace rdx::radix {

/// @brief Totals for one strategy.
struct StrategyStats
{
    core::u64 calls{0};
    core::u64 items{0};
    core::u64 nanoseconds{0};
};

/// @brief Point-in-time copy of the profile counters.
struct ProfileSnapshot
{
    std::array<StrategyStats, kStrategyCount> strategies{};
    core::u64                                 spawnedChildren{0};
    core::u64                                 inlineChildren{0};

    [[nodiscard]] const StrategyStats& operator[](Strategy s) const noexcept
    {
        return strategies[static_cast<core::usize>(s)];
    }
};

// /////////////////////////////////////////////////////////////////////////////
/// @class Profile
/// @brief Lock-free process-wide counters, safe to update from any worker.
// /////////////////////////////////////////////////////////////////////////////
class Profile final : public core::NonCopyable<Profile>
{
public:
    /// @brief The instance the RDX_PROFILE_* macros feed.
    [[nodiscard]] static Profile& global() noexcept;

    Profile() = default;

    void record(Strategy strategy, core::usize items, core::u64 nanoseconds) noexcept;

    /// @brief A child partition was handed to the job system.
    void recordSpawn() noexcept;

    /// @brief A child partition ran on the thread that produced it.
    void recordInline() noexcept;

    [[nodiscard]] ProfileSnapshot snapshot() const noexcept;

    void reset() noexcept;

    /// @brief Human-readable table, one line per strategy.
    [[nodiscard]] std::string report() const;

private:
    struct Counters
    {
        std::atomic<core::u64> calls{0};
        std::atomic<core::u64> items{0};
        std::atomic<core::u64> nanoseconds{0};
    };

    std::array<Counters, kStrategyCount> counters_{};
    std::atomic<core::u64>               spawned_{0};
    std::atomic<core::u64>               inline_{0};
};

// /////////////////////////////////////////////////////////////////////////////
/// @class ProfileScope
/// @brief Records one call of a strategy, timed from construction to
///        destruction.
// /////////////////////////////////////////////////////////////////////////////
class ProfileScope final : public core::NonCopyable<ProfileScope>
{
public:
    ProfileScope(Strategy strategy, core::usize items,
                 Profile& profile = Profile::global()) noexcept
        : profile_(profile)
        , strategy_(strategy)
        , items_(items)
        , start_(std::chrono::steady_clock::now())
    {
    }

    ~ProfileScope()
    {
        const auto elapsed = std::chrono::steady_clock::now() - start_;
        profile_.record(strategy_, items_,
            static_cast<core::u64>(std::chrono::duration_cast<std::chrono::nanoseconds>(elapsed).count()));
    }

private:
    Profile&                              profile_;
    Strategy                              strategy_;
    core::usize                           items_;
    std::chrono::steady_clock::time_point start_;
};

} // namespace rdx::radix

#define RDX_PROFILE_CONCAT_IMPL(a, b) a##b
#define RDX_PROFILE_CONCAT(a, b)      RDX_PROFILE_CONCAT_IMPL(a, b)

#if RDX_PROFILING
    /// Times the rest of the enclosing block as one call of @p strategy.
    #define RDX_PROFILE_SCOPE(strategy, items) \
        ::rdx::radix::ProfileScope RDX_PROFILE_CONCAT(rdxProfileScope_, __LINE__){(strategy), (items)}
    /// Invokes a Profile member on the global profile, e.g.
    /// RDX_PROFILE_EVENT(recordSpawn()).
    #define RDX_PROFILE_EVENT(call) ::rdx::radix::Profile::global().call
#else
    #define RDX_PROFILE_SCOPE(strategy, items) ((void)0)
    #define RDX_PROFILE_EVENT(call)            ((void)0)
#endif
