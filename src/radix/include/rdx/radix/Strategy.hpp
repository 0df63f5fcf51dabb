/**
 * @file Strategy.hpp
 * @brief Per-partition algorithm selection.
 *
 * The selector is a pure function of the partition's size, the number of
 * digits it still has to be ordered on, and whether its current digit is
 * uniform.  The MSD driver runs it, through DefaultTuner, in a loop:
 * kSkip advances the digit and asks again, every other strategy is
 * terminal for the partition.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef RDX_RADIX_STRATEGY_HPP
    #define RDX_RADIX_STRATEGY_HPP

    #include <rdx/core/Types.hpp>

    #include <string_view>

namespace rdx::radix {

class TuningTable;

/**
 * @brief What to do with one partition.
 */
enum class Strategy : core::u8 {
    kDone = 0,      ///< Nothing left to discriminate on.
    kSkip,          ///< Current digit uniform: advance and re-select.
    kSmallSort,     ///< Insertion sort on the remaining digits.
    kCountingSort,  ///< LSD counting passes on the remaining digits.
    kMsdRecurse,    ///< Histogram, bucket partition, recurse per bucket.
};

inline constexpr core::usize kStrategyCount = 5;

/**
 * @brief Choose the strategy for a partition.
 *
 * Rules, first match wins:
 *  1. length <= 1                                   -> kDone
 *  2. length <= smallSortThreshold                  -> kSmallSort
 *  3. remainingDigits == 0                          -> kDone
 *  4. uniform                                       -> kSkip
 *  5. length <= countingSortThreshold and
 *     remainingDigits <= countingSortMaxDigits      -> kCountingSort
 *  6. otherwise                                     -> kMsdRecurse
 *
 * @param tuning          Thresholds.
 * @param length          Number of items in the partition.
 * @param remainingDigits Digits from the current one to the end of the key.
 * @param uniform         Result of the uniform-digit pre-scan; ignored
 *                        unless rules 1-3 did not decide.
 */
[[nodiscard]] Strategy pickStrategy(
    const TuningTable &tuning,
    core::usize length,
    core::usize remainingDigits,
    bool uniform
) noexcept;

/**
 * @brief True if pickStrategy() would consult its @c uniform argument,
 *        i.e. the pre-scan is worth running.
 */
[[nodiscard]] bool needsUniformScan(
    const TuningTable &tuning,
    core::usize length,
    core::usize remainingDigits
) noexcept;

/// @brief Display name of a strategy.
[[nodiscard]] std::string_view toString(Strategy strategy) noexcept;

} // namespace rdx::radix

#endif // RDX_RADIX_STRATEGY_HPP
