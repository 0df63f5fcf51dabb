/**
 * @file Tuner.hpp
 * @brief Replaceable strategy selection.
 *
 * The MSD driver asks an ITuner which strategy to run on every partition
 * it visits.  DefaultTuner applies pickStrategy() to the TuningTable;
 * callers with knowledge of their key distribution can install their own.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef RDX_RADIX_TUNER_HPP
    #define RDX_RADIX_TUNER_HPP

    #include <rdx/core/Types.hpp>
    #include <rdx/radix/Strategy.hpp>

namespace rdx::radix {

class TuningTable;

/**
 * @brief What the driver knows about a partition when it selects.
 */
struct PartitionInfo {
    core::usize length          = 0;
    core::usize remainingDigits = 0;
    core::usize depth           = 0;     ///< Recursion depth, 0 at the root.
    bool        uniform         = false; ///< Only meaningful when the scan ran.
};

/**
 * @brief Strategy selector used by the MSD driver.
 *
 * Called concurrently from worker threads, so implementations must be
 * thread-safe.  Any answer is memory-safe: kSkip and kMsdRecurse on a
 * partition with no remaining digits are treated as kDone.  A selector
 * that ends a partition early, or skips a non-uniform digit, leaves it in
 * unspecified order.
 */
class ITuner {
public:
    virtual ~ITuner() = default;

    /// @brief Whether the driver should scan for a uniform digit before
    ///        calling pick().
    [[nodiscard]] virtual bool wantsUniformScan(const TuningTable &tuning, const PartitionInfo &info) const;

    [[nodiscard]] virtual Strategy pick(const TuningTable &tuning, const PartitionInfo &info) const = 0;
};

/**
 * @brief The built-in rules of pickStrategy().  Ignores the depth.
 */
class DefaultTuner final : public ITuner {
public:
    [[nodiscard]] Strategy pick(const TuningTable &tuning, const PartitionInfo &info) const override;

    /// @brief Shared stateless instance used when no tuner is given.
    [[nodiscard]] static const DefaultTuner &instance() noexcept;
};

} // namespace rdx::radix

#endif // RDX_RADIX_TUNER_HPP
