// /////////////////////////////////////////////////////////////////////////////
/// @file TuningTable.hpp
/// @brief Sort engine thresholds (Builder pattern).
///
/// Immutable set of size and digit-count cutoffs consulted by the strategy
/// selector and the parallel dispatcher.  Defaults come from
/// rdx/core/Constants.hpp; benchmarking tooling can produce a tuning file
/// (`key = value` lines, `#` comments) that fromFile() loads.
// /////////////////////////////////////////////////////////////////////////////
#pragma once

#include <rdx/core/Constants.hpp>
#include <rdx/core/Expected.hpp>
#include <rdx/core/Types.hpp>

#include <filesystem>
#include <string>
#include <string_view>

namespace rdx::radix {

/// @brief Immutable engine tuning.
class TuningTable
{
public:
    /// @brief Hard cap on counting_sort_threshold; bounds scratch memory.
    static constexpr core::usize kMaxCountingSortThreshold = core::kMaxCountingSortThreshold;

    /// @brief Fluent builder for TuningTable.
    class Builder
    {
    public:
        Builder() = default;

        /// @brief Starts from an existing table instead of the defaults.
        explicit Builder(const TuningTable& base) noexcept;

        Builder& smallSortThreshold(core::usize n) noexcept;
        Builder& countingSortThreshold(core::usize n) noexcept;
        Builder& countingSortMaxDigits(core::usize n) noexcept;
        Builder& parallelSplitThreshold(core::usize n) noexcept;
        Builder& parallelCountThreshold(core::usize n) noexcept;
        Builder& parallelCountChunksPerWorker(core::usize n) noexcept;
        Builder& taskBudgetPerWorker(core::usize n) noexcept;
        Builder& maxParallelDepth(core::usize n) noexcept;

        [[nodiscard]] TuningTable build() const noexcept;

    private:
        core::usize smallSortThreshold_{core::kSmallSortThreshold};
        core::usize countingSortThreshold_{core::kCountingSortThreshold};
        core::usize countingSortMaxDigits_{core::kCountingSortMaxDigits};
        core::usize parallelSplitThreshold_{core::kParallelSplitThreshold};
        core::usize parallelCountThreshold_{core::kParallelCountThreshold};
        core::usize parallelCountChunksPerWorker_{core::kParallelCountChunksPerWorker};
        core::usize taskBudgetPerWorker_{core::kTaskBudgetPerWorker};
        core::usize maxParallelDepth_{core::kMaxParallelDepth};
    };

    /// @brief Process-wide default table, built once from Constants.hpp.
    [[nodiscard]] static const TuningTable& defaults() noexcept;

    /// @brief Parses a tuning file body.  Keys not present keep their
    ///        default value.
    [[nodiscard]] static core::Expected<TuningTable> fromString(std::string_view text);

    /// @brief Reads and parses a tuning file.
    [[nodiscard]] static core::Expected<TuningTable> fromFile(const std::filesystem::path& path);

    /// @brief Serialises every key in the format fromString() accepts.
    [[nodiscard]] std::string toString() const;

    /// @brief Checks the cross-field limits.
    [[nodiscard]] core::ExpectedVoid validate() const;

    [[nodiscard]] core::usize smallSortThreshold()           const noexcept { return smallSortThreshold_; }
    [[nodiscard]] core::usize countingSortThreshold()        const noexcept { return countingSortThreshold_; }
    [[nodiscard]] core::usize countingSortMaxDigits()        const noexcept { return countingSortMaxDigits_; }
    [[nodiscard]] core::usize parallelSplitThreshold()       const noexcept { return parallelSplitThreshold_; }
    [[nodiscard]] core::usize parallelCountThreshold()       const noexcept { return parallelCountThreshold_; }
    [[nodiscard]] core::usize parallelCountChunksPerWorker() const noexcept { return parallelCountChunksPerWorker_; }
    [[nodiscard]] core::usize taskBudgetPerWorker()          const noexcept { return taskBudgetPerWorker_; }
    [[nodiscard]] core::usize maxParallelDepth()             const noexcept { return maxParallelDepth_; }

private:
    friend class Builder;

    core::usize smallSortThreshold_{core::kSmallSortThreshold};
    core::usize countingSortThreshold_{core::kCountingSortThreshold};
    core::usize countingSortMaxDigits_{core::kCountingSortMaxDigits};
    core::usize parallelSplitThreshold_{core::kParallelSplitThreshold};
    core::usize parallelCountThreshold_{core::kParallelCountThreshold};
    core::usize parallelCountChunksPerWorker_{core::kParallelCountChunksPerWorker};
    core::usize taskBudgetPerWorker_{core::kTaskBudgetPerWorker};
    core::usize maxParallelDepth_{core::kMaxParallelDepth};
};

} // namespace rdx::radix
