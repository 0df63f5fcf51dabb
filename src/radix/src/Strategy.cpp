/**
 * @file Strategy.cpp
 * @brief Implementation of the strategy selector.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#include "rdx/radix/Strategy.hpp"
#include "rdx/radix/TuningTable.hpp"

namespace rdx::radix {

bool needsUniformScan(const TuningTable &tuning, core::usize length, core::usize remainingDigits) noexcept
{
    return length > 1 && length > tuning.smallSortThreshold() && remainingDigits > 0;
}

Strategy pickStrategy(const TuningTable &tuning, core::usize length, core::usize remainingDigits, bool uniform) noexcept
{
    if (length <= 1)
        return Strategy::kDone;
    if (length <= tuning.smallSortThreshold())
        return Strategy::kSmallSort;
    if (remainingDigits == 0)
        return Strategy::kDone;
    if (uniform)
        return Strategy::kSkip;
    if (length <= tuning.countingSortThreshold() && remainingDigits <= tuning.countingSortMaxDigits())
        return Strategy::kCountingSort;
    return Strategy::kMsdRecurse;
}

std::string_view toString(Strategy strategy) noexcept
{
    switch (strategy) {
        case Strategy::kDone:         return "Done";
        case Strategy::kSkip:         return "Skip";
        case Strategy::kSmallSort:    return "SmallSort";
        case Strategy::kCountingSort: return "CountingSort";
        case Strategy::kMsdRecurse:   return "MsdRecurse";
    }
    return "Unknown";
}

} // namespace rdx::radix
