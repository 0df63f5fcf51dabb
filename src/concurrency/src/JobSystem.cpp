// /////////////////////////////////////////////////////////////////////////////
/// @file JobSystem.cpp
/// @brief Work-stealing job system implementation.
// /////////////////////////////////////////////////////////////////////////////

#include <rdx/concurrency/JobSystem.hpp>
#include <rdx/core/Assert.hpp>
#include <rdx/core/Log.hpp>
#include <rdx/core/Platform.hpp>

#include <chrono>
#include <format>
#include <random>
#include <system_error>

namespace rdx::concurrency {

namespace {

constexpr core::u32 kSpinRounds  = 64;
constexpr core::u32 kYieldRounds = 1024;
constexpr auto      kIdleSleep   = std::chrono::microseconds{100};

thread_local const JobSystem* tlsOwner       = nullptr;
thread_local core::u32        tlsWorkerIndex = 0;

void backoff(core::u32 idleRounds)
{
    if (idleRounds < kSpinRounds)
    {
        RDX_CPU_PAUSE();
    }
    else if (idleRounds < kYieldRounds)
    {
        std::this_thread::yield();
    }
    else
    {
        std::this_thread::sleep_for(kIdleSleep);
    }
}

} // anonymous namespace

// -------------------------------------------------------------------------- //
//  Construction / Destruction                                                //
// -------------------------------------------------------------------------- //

JobSystem::JobSystem(core::u32 workerCount)
{
    core::u32 count = (workerCount == 0)
        ? static_cast<core::u32>(std::thread::hardware_concurrency())
        : workerCount;

    if (count == 0)
    {
        count = 1;
    }

    workerData_.reserve(count);
    for (core::u32 i = 0; i < count; ++i)
    {
        workerData_.push_back(std::make_unique<WorkerData>());
    }
    workers_.reserve(count);

    try
    {
        for (core::u32 i = 0; i < count; ++i)
        {
            workers_.emplace_back(&JobSystem::workerLoop, this, i);
        }
    }
    catch (const std::system_error&)
    {
        stopping_.store(true, std::memory_order_release);
        for (auto& w : workers_)
        {
            w.join();
        }
        throw;
    }

    core::Log::debug("JOB", std::format("JobSystem started with {} workers", count));
}

core::Expected<std::unique_ptr<JobSystem>> JobSystem::create(core::u32 workerCount)
{
    try
    {
        return std::make_unique<JobSystem>(workerCount);
    }
    catch (const std::system_error& e)
    {
        core::Log::error("JOB", std::format("cannot start workers: {}", e.what()));
        return core::makeError(core::ErrorCode::kThreadSpawnFailed, e.what());
    }
}

JobSystem::~JobSystem()
{
    stopping_.store(true, std::memory_order_release);

    for (auto& w : workers_)
    {
        if (w.joinable())
        {
            w.join();
        }
    }
}

// -------------------------------------------------------------------------- //
//  Public API                                                                //
// -------------------------------------------------------------------------- //

void JobSystem::kickJob(std::function<void()> job, JobHandle& handle)
{
    core::u32 target = 0;

    if (isWorkerThread())
    {
        target = tlsWorkerIndex;
    }
    else
    {
        thread_local static std::mt19937 rng{std::random_device{}()};
        target = rng() % static_cast<core::u32>(workerData_.size());
    }

    handle.counter.fetch_add(1, std::memory_order_acq_rel);

    try
    {
        std::lock_guard<std::mutex> lock{workerData_[target]->mutex};
        workerData_[target]->localQueue.emplace_back(std::move(job), &handle);
    }
    catch (...)
    {
        handle.counter.fetch_sub(1, std::memory_order_acq_rel);
        throw;
    }
}

void JobSystem::waitForCounter(JobHandle& handle, core::i32 targetValue)
{
    drainCounter(handle, targetValue);

    std::exception_ptr error;
    {
        std::lock_guard<std::mutex> lock{handle.errorMutex};
        error = std::exchange(handle.error, nullptr);
    }

    if (error)
    {
        std::rethrow_exception(error);
    }
}

void JobSystem::drainCounter(JobHandle& handle, core::i32 targetValue) noexcept
{
    core::u32 idleRounds = 0;

    while (handle.counter.load(std::memory_order_acquire) != targetValue)
    {
        if (tryRunPendingJob())
        {
            idleRounds = 0;
            continue;
        }
        backoff(idleRounds++);
    }
}

bool JobSystem::tryRunPendingJob() noexcept
{
    Job job{nullptr, nullptr};

    const core::u32 self = isWorkerThread()
        ? tlsWorkerIndex
        : static_cast<core::u32>(workerData_.size());

    if (self < workerData_.size() && popLocal(self, job))
    {
        execute(job);
        return true;
    }

    if (trySteal(self, job))
    {
        execute(job);
        return true;
    }

    return false;
}

core::u32 JobSystem::workerCount() const noexcept
{
    return static_cast<core::u32>(workers_.size());
}

bool JobSystem::isWorkerThread() const noexcept
{
    return tlsOwner == this;
}

// -------------------------------------------------------------------------- //
//  Private                                                                   //
// -------------------------------------------------------------------------- //

void JobSystem::workerLoop(core::u32 workerIndex)
{
    tlsOwner       = this;
    tlsWorkerIndex = workerIndex;

    core::u32 idleRounds = 0;

    while (!stopping_.load(std::memory_order_acquire))
    {
        Job job{nullptr, nullptr};

        if (!popLocal(workerIndex, job) && !trySteal(workerIndex, job))
        {
            backoff(idleRounds++);
            continue;
        }

        idleRounds = 0;
        execute(job);
    }

    tlsOwner = nullptr;
}

bool JobSystem::popLocal(core::u32 workerIndex, Job& outJob)
{
    auto& data = *workerData_[workerIndex];

    std::lock_guard<std::mutex> lock{data.mutex};
    if (data.localQueue.empty())
    {
        return false;
    }

    outJob = std::move(data.localQueue.back());
    data.localQueue.pop_back();
    return true;
}

bool JobSystem::trySteal(core::u32 thiefIndex, Job& outJob)
{
    const auto count    = static_cast<core::u32>(workerData_.size());
    const bool external = thiefIndex >= count;

    for (core::u32 offset = external ? 0 : 1; offset < count; ++offset)
    {
        const core::u32 victimIndex = external ? offset : (thiefIndex + offset) % count;
        auto& victim = *workerData_[victimIndex];

        std::lock_guard<std::mutex> lock{victim.mutex};
        if (!victim.localQueue.empty())
        {
            outJob = std::move(victim.localQueue.front());
            victim.localQueue.pop_front();
            return true;
        }
    }

    return false;
}

void JobSystem::execute(Job& job) noexcept
{
    RDX_ASSERT(job.first && job.second != nullptr);

    JobHandle& handle = *job.second;

    try
    {
        job.first();
    }
    catch (...)
    {
        std::lock_guard<std::mutex> lock{handle.errorMutex};
        if (!handle.error)
        {
            handle.error = std::current_exception();
        }
    }

    job.first = nullptr;
    handle.counter.fetch_sub(1, std::memory_order_acq_rel);
}

} // namespace rdx::concurrency
