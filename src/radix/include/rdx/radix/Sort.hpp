/**
 * @file Sort.hpp
 * @brief Public entry points of the radix sort engine.
 *
 * Unstable, in-place MSD radix sort.  Items end up in non-decreasing
 * lexicographic order of the byte sequence the extractor yields; items
 * with equal sequences end up adjacent in unspecified relative order.
 *
 * @par Usage
 * @code
 *   std::vector<rdx::core::u32> values = load();
 *   rdx::radix::sort(values);
 *
 *   rdx::concurrency::JobSystem pool{8};
 *   auto byId = rdx::radix::makeExtractor(4, [](const Record &r, rdx::core::usize i) {
 *       return rdx::radix::RadixKeyTraits<rdx::core::u32>::digitAt(r.id, i);
 *   });
 *   rdx::radix::sort(records, byId, &pool);
 * @endcode
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef RDX_RADIX_SORT_HPP
    #define RDX_RADIX_SORT_HPP

    #include <rdx/concurrency/JobSystem.hpp>
    #include <rdx/core/Concepts.hpp>
    #include <rdx/core/Expected.hpp>
    #include <rdx/core/Log.hpp>
    #include <rdx/radix/RadixKey.hpp>
    #include <rdx/radix/Sorter.hpp>
    #include <rdx/radix/Tuner.hpp>
    #include <rdx/radix/TuningTable.hpp>

    #include <format>
    #include <new>
    #include <source_location>
    #include <span>
    #include <string>
    #include <system_error>
    #include <vector>

namespace rdx::radix {

/**
 * @brief Sort @p items in place by the keys @p extractor yields.
 *
 * @param items     Sequence to sort.
 * @param extractor Key extractor; called concurrently when @p pool is set.
 * @param pool      Job system to fan out on, or nullptr for the calling
 *                  thread only.  Ignored when threading is compiled out.
 * @param tuning    Thresholds.
 * @param tuner     Strategy selector; DefaultTuner applies @p tuning's
 *                  thresholds.
 * @throws std::bad_alloc if a counting scratch buffer cannot be allocated;
 *         the sequence is then left in an unspecified permutation.
 */
template <core::Permutable T, typename E>
    requires KeyExtractor<E, T>
void sort(
    std::span<T> items,
    const E &extractor,
    concurrency::JobSystem *pool = nullptr,
    const TuningTable &tuning = TuningTable::defaults(),
    const ITuner &tuner = DefaultTuner::instance()
) {
    if (items.size() < 2)
        return;

    Sorter<T, E> sorter{items, extractor, tuning, tuner, pool};
    sorter.run();
}

/// @brief Sort items that have a RadixKeyTraits specialisation.
template <core::Permutable T>
    requires HasRadixKey<T>
void sort(
    std::span<T> items,
    concurrency::JobSystem *pool = nullptr,
    const TuningTable &tuning = TuningTable::defaults(),
    const ITuner &tuner = DefaultTuner::instance()
) {
    radix::sort(items, TraitsExtractor<T>{}, pool, tuning, tuner);
}

template <core::Permutable T, typename E>
    requires KeyExtractor<E, T>
void sort(
    std::vector<T> &items,
    const E &extractor,
    concurrency::JobSystem *pool = nullptr,
    const TuningTable &tuning = TuningTable::defaults(),
    const ITuner &tuner = DefaultTuner::instance()
) {
    radix::sort(std::span<T>{items}, extractor, pool, tuning, tuner);
}

template <core::Permutable T>
    requires HasRadixKey<T>
void sort(
    std::vector<T> &items,
    concurrency::JobSystem *pool = nullptr,
    const TuningTable &tuning = TuningTable::defaults(),
    const ITuner &tuner = DefaultTuner::instance()
) {
    radix::sort(std::span<T>{items}, TraitsExtractor<T>{}, pool, tuning, tuner);
}

namespace detail {

[[nodiscard]] inline core::Unexpected sortFailure(
    core::ErrorCode code,
    std::string message,
    std::source_location loc = std::source_location::current()
) {
    core::Log::error("rdx", std::format("sort failed ({}): {}", core::toString(code), message));
    return core::makeError(code, std::move(message), loc);
}

} // namespace detail

/**
 * @brief Error-returning variant of sort().
 *
 * Validates @p tuning first, then converts resource failures into errors:
 * std::bad_alloc becomes kOutOfMemory and std::system_error from the job
 * system becomes kThreadSpawnFailed.  Exceptions thrown by the extractor
 * itself are not intercepted.
 */
template <core::Permutable T, typename E>
    requires KeyExtractor<E, T>
[[nodiscard]] core::ExpectedVoid trySort(
    std::span<T> items,
    const E &extractor,
    concurrency::JobSystem *pool = nullptr,
    const TuningTable &tuning = TuningTable::defaults(),
    const ITuner &tuner = DefaultTuner::instance()
) {
    RDX_TRY_VOID(tuning.validate());

    try {
        radix::sort(items, extractor, pool, tuning, tuner);
    } catch (const std::bad_alloc &) {
        return detail::sortFailure(core::ErrorCode::kOutOfMemory,
                                   std::format("out of memory while sorting {} items", items.size()));
    } catch (const std::system_error &e) {
        return detail::sortFailure(core::ErrorCode::kThreadSpawnFailed, e.what());
    }
    return {};
}

template <core::Permutable T>
    requires HasRadixKey<T>
[[nodiscard]] core::ExpectedVoid trySort(
    std::span<T> items,
    concurrency::JobSystem *pool = nullptr,
    const TuningTable &tuning = TuningTable::defaults(),
    const ITuner &tuner = DefaultTuner::instance()
) {
    return radix::trySort(items, TraitsExtractor<T>{}, pool, tuning, tuner);
}

template <core::Permutable T, typename E>
    requires KeyExtractor<E, T>
[[nodiscard]] core::ExpectedVoid trySort(
    std::vector<T> &items,
    const E &extractor,
    concurrency::JobSystem *pool = nullptr,
    const TuningTable &tuning = TuningTable::defaults(),
    const ITuner &tuner = DefaultTuner::instance()
) {
    return radix::trySort(std::span<T>{items}, extractor, pool, tuning, tuner);
}

template <core::Permutable T>
    requires HasRadixKey<T>
[[nodiscard]] core::ExpectedVoid trySort(
    std::vector<T> &items,
    concurrency::JobSystem *pool = nullptr,
    const TuningTable &tuning = TuningTable::defaults(),
    const ITuner &tuner = DefaultTuner::instance()
) {
    return radix::trySort(std::span<T>{items}, TraitsExtractor<T>{}, pool, tuning, tuner);
}

} // namespace rdx::radix

#endif // RDX_RADIX_SORT_HPP
