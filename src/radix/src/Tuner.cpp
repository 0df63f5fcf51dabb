/**
 * @file Tuner.cpp
 * @brief ITuner defaults and the built-in tuner.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#include "rdx/radix/Tuner.hpp"
#include "rdx/radix/TuningTable.hpp"

namespace rdx::radix {

bool ITuner::wantsUniformScan(const TuningTable &tuning, const PartitionInfo &info) const
{
    return needsUniformScan(tuning, info.length, info.remainingDigits);
}

Strategy DefaultTuner::pick(const TuningTable &tuning, const PartitionInfo &info) const
{
    return pickStrategy(tuning, info.length, info.remainingDigits, info.uniform);
}

const DefaultTuner &DefaultTuner::instance() noexcept
{
    static const DefaultTuner tuner;
    return tuner;
}

} // namespace rdx::radix
