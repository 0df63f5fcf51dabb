// /////////////////////////////////////////////////////////////////////////////
/// @file TuningTable.cpp
/// @brief TuningTable::Builder and tuning file (de)serialisation.
// /////////////////////////////////////////////////////////////////////////////

#include <rdx/radix/TuningTable.hpp>
#include <rdx/core/Log.hpp>

#include <array>
#include <charconv>
#include <format>
#include <fstream>
#include <sstream>

namespace rdx::radix {

namespace {

using Setter = TuningTable::Builder& (TuningTable::Builder::*)(core::usize) noexcept;
using Getter = core::usize (TuningTable::*)() const noexcept;

struct KeyEntry
{
    std::string_view name;
    Setter           set;
    Getter           get;
};

constexpr std::array<KeyEntry, 8> kKeys{{
    {"small_sort_threshold",             &TuningTable::Builder::smallSortThreshold,           &TuningTable::smallSortThreshold},
    {"counting_sort_threshold",          &TuningTable::Builder::countingSortThreshold,        &TuningTable::countingSortThreshold},
    {"counting_sort_max_digits",         &TuningTable::Builder::countingSortMaxDigits,        &TuningTable::countingSortMaxDigits},
    {"parallel_split_threshold",         &TuningTable::Builder::parallelSplitThreshold,       &TuningTable::parallelSplitThreshold},
    {"parallel_count_threshold",         &TuningTable::Builder::parallelCountThreshold,       &TuningTable::parallelCountThreshold},
    {"parallel_count_chunks_per_worker", &TuningTable::Builder::parallelCountChunksPerWorker, &TuningTable::parallelCountChunksPerWorker},
    {"task_budget_per_worker",           &TuningTable::Builder::taskBudgetPerWorker,          &TuningTable::taskBudgetPerWorker},
    {"max_parallel_depth",               &TuningTable::Builder::maxParallelDepth,             &TuningTable::maxParallelDepth},
}};

std::string_view trim(std::string_view s)
{
    constexpr std::string_view kBlank = " \t\r";
    const auto first = s.find_first_not_of(kBlank);
    if (first == std::string_view::npos)
    {
        return {};
    }
    const auto last = s.find_last_not_of(kBlank);
    return s.substr(first, last - first + 1);
}

} // anonymous namespace

// -------------------------------------------------------------------------- //
//  Builder                                                                   //
// -------------------------------------------------------------------------- //

TuningTable::Builder::Builder(const TuningTable& base) noexcept
    : smallSortThreshold_(base.smallSortThreshold_)
    , countingSortThreshold_(base.countingSortThreshold_)
    , countingSortMaxDigits_(base.countingSortMaxDigits_)
    , parallelSplitThreshold_(base.parallelSplitThreshold_)
    , parallelCountThreshold_(base.parallelCountThreshold_)
    , parallelCountChunksPerWorker_(base.parallelCountChunksPerWorker_)
    , taskBudgetPerWorker_(base.taskBudgetPerWorker_)
    , maxParallelDepth_(base.maxParallelDepth_)
{
}

TuningTable::Builder& TuningTable::Builder::smallSortThreshold(core::usize n) noexcept
{
    smallSortThreshold_ = n;
    return *this;
}

TuningTable::Builder& TuningTable::Builder::countingSortThreshold(core::usize n) noexcept
{
    countingSortThreshold_ = n;
    return *this;
}

TuningTable::Builder& TuningTable::Builder::countingSortMaxDigits(core::usize n) noexcept
{
    countingSortMaxDigits_ = n;
    return *this;
}

TuningTable::Builder& TuningTable::Builder::parallelSplitThreshold(core::usize n) noexcept
{
    parallelSplitThreshold_ = n;
    return *this;
}

TuningTable::Builder& TuningTable::Builder::parallelCountThreshold(core::usize n) noexcept
{
    parallelCountThreshold_ = n;
    return *this;
}

TuningTable::Builder& TuningTable::Builder::parallelCountChunksPerWorker(core::usize n) noexcept
{
    parallelCountChunksPerWorker_ = n;
    return *this;
}

TuningTable::Builder& TuningTable::Builder::taskBudgetPerWorker(core::usize n) noexcept
{
    taskBudgetPerWorker_ = n;
    return *this;
}

TuningTable::Builder& TuningTable::Builder::maxParallelDepth(core::usize n) noexcept
{
    maxParallelDepth_ = n;
    return *this;
}

TuningTable TuningTable::Builder::build() const noexcept
{
    TuningTable table;
    table.smallSortThreshold_           = smallSortThreshold_;
    table.countingSortThreshold_        = countingSortThreshold_;
    table.countingSortMaxDigits_        = countingSortMaxDigits_;
    table.parallelSplitThreshold_       = parallelSplitThreshold_;
    table.parallelCountThreshold_       = parallelCountThreshold_;
    table.parallelCountChunksPerWorker_ = parallelCountChunksPerWorker_;
    table.taskBudgetPerWorker_          = taskBudgetPerWorker_;
    table.maxParallelDepth_             = maxParallelDepth_;
    return table;
}

// -------------------------------------------------------------------------- //
//  TuningTable                                                               //
// -------------------------------------------------------------------------- //

const TuningTable& TuningTable::defaults() noexcept
{
    static const TuningTable kDefaults = Builder{}.build();
    return kDefaults;
}

core::ExpectedVoid TuningTable::validate() const
{
    if (parallelCountChunksPerWorker_ == 0)
    {
        return core::makeError(core::ErrorCode::kInvalidArgument,
                               "parallel_count_chunks_per_worker must be at least 1");
    }

    if (countingSortThreshold_ > kMaxCountingSortThreshold)
    {
        return core::makeError(core::ErrorCode::kOutOfRange,
                               std::format("counting_sort_threshold {} exceeds the limit of {}",
                                           countingSortThreshold_, kMaxCountingSortThreshold));
    }

    return {};
}

core::Expected<TuningTable> TuningTable::fromString(std::string_view text)
{
    Builder builder;
    core::usize lineNumber = 0;

    while (!text.empty())
    {
        const auto newline = text.find('\n');
        std::string_view line = text.substr(0, newline);
        text = (newline == std::string_view::npos) ? std::string_view{} : text.substr(newline + 1);
        ++lineNumber;

        if (const auto hash = line.find('#'); hash != std::string_view::npos)
        {
            line = line.substr(0, hash);
        }
        line = trim(line);
        if (line.empty())
        {
            continue;
        }

        const auto eq = line.find('=');
        if (eq == std::string_view::npos)
        {
            return core::makeError(core::ErrorCode::kParseError,
                                   std::format("line {}: expected 'key = value'", lineNumber));
        }

        const std::string_view key   = trim(line.substr(0, eq));
        const std::string_view value = trim(line.substr(eq + 1));

        const KeyEntry* entry = nullptr;
        for (const auto& candidate : kKeys)
        {
            if (candidate.name == key)
            {
                entry = &candidate;
                break;
            }
        }
        if (entry == nullptr)
        {
            return core::makeError(core::ErrorCode::kInvalidArgument,
                                   std::format("line {}: unknown key '{}'", lineNumber, key));
        }

        core::usize number = 0;
        const auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), number);
        if (value.empty() || ec != std::errc{} || ptr != value.data() + value.size())
        {
            return core::makeError(core::ErrorCode::kParseError,
                                   std::format("line {}: '{}' is not a non-negative integer", lineNumber, value));
        }

        (builder.*(entry->set))(number);
    }

    TuningTable table = builder.build();
    RDX_TRY_VOID(table.validate());
    return table;
}

core::Expected<TuningTable> TuningTable::fromFile(const std::filesystem::path& path)
{
    std::ifstream in{path};
    if (!in)
    {
        return core::makeError(core::ErrorCode::kIoError,
                               std::format("cannot open tuning file '{}'", path.string()));
    }

    std::ostringstream buffer;
    buffer << in.rdbuf();
    if (in.bad())
    {
        return core::makeError(core::ErrorCode::kIoError,
                               std::format("cannot read tuning file '{}'", path.string()));
    }

    TuningTable table = RDX_TRY(fromString(buffer.str()));
    core::Log::info("TUNE", std::format("loaded tuning table from '{}'", path.string()));
    return table;
}

std::string TuningTable::toString() const
{
    std::string out = "# rdx tuning table\n";
    for (const auto& entry : kKeys)
    {
        out += std::format("{} = {}\n", entry.name, (this->*(entry.get))());
    }
    return out;
}

} // namespace rdx::radix
