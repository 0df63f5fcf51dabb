// /////////////////////////////////////////////////////////////////////////////
/// @file JobSystem.hpp
/// @brief Work-stealing job system with per-thread deques and counters.
// /////////////////////////////////////////////////////////////////////////////

#pragma once

#include <rdx/core/Types.hpp>
#include <rdx/core/NonCopyable.hpp>
#include <rdx/core/Expected.hpp>
#include <rdx/core/Platform.hpp>

#include <atomic>
#include <deque>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>
#include <utility>
#include <vector>

namespace rdx::concurrency {

// /////////////////////////////////////////////////////////////////////////////
/// @struct JobHandle
/// @brief Handle used to join a group of jobs via an atomic counter.
///
/// The first exception escaping any job of the group is kept here and
/// rethrown by JobSystem::waitForCounter.
// /////////////////////////////////////////////////////////////////////////////
struct JobHandle
{
    std::atomic<core::i32> counter{0};
    std::mutex             errorMutex;
    std::exception_ptr     error;
};

// /////////////////////////////////////////////////////////////////////////////
/// @class JobSystem
/// @brief Work-stealing scheduler (one locked deque per worker).
///
/// A worker pushes the jobs it kicks to the back of its own deque and pops
/// from the back (newest first); idle workers steal from the front of the
/// other deques (oldest, usually largest, first).  Jobs kicked from a
/// thread outside the pool go to a random deque.
///
/// Waiting is cooperative: a thread blocked in @ref waitForCounter runs
/// pending jobs, so jobs may kick and join sub-jobs without deadlocking the
/// pool.
///
/// @par Usage
/// @code
///   JobSystem js{4};
///   JobHandle handle{};
///   js.kickJob([](){ /* work */ }, handle);
///   js.kickJob([](){ /* work */ }, handle);
///   js.waitForCounter(handle);
/// @endcode
// /////////////////////////////////////////////////////////////////////////////
class JobSystem final : public core::NonCopyable<JobSystem>
{
public:
    /// @brief Creates a job system with the given number of worker threads.
    /// @param workerCount Number of workers (0 = hardware_concurrency).
    /// @throws std::system_error if a worker thread cannot be started.
    explicit JobSystem(core::u32 workerCount = 0);

    /// @brief Non-throwing factory.
    /// @return The job system, or kThreadSpawnFailed.
    [[nodiscard]] static core::Expected<std::unique_ptr<JobSystem>>
        create(core::u32 workerCount = 0);

    /// @brief Stops and joins all workers.  Every handle must have been
    ///        joined before destruction.
    ~JobSystem();

    // --------------------------------------------------------------------- //
    //  Job submission                                                        //
    // --------------------------------------------------------------------- //

    /// @brief Submits a job and increments the handle counter.
    /// @param job Callable to execute.
    /// @param handle Associated handle whose counter is decremented on
    ///        completion.
    void kickJob(std::function<void()> job, JobHandle& handle);

    /// @brief Runs pending jobs until @p handle.counter reaches
    ///        @p targetValue, then rethrows the first error captured by the
    ///        group, if any.
    void waitForCounter(JobHandle& handle, core::i32 targetValue = 0);

    /// @brief Same as @ref waitForCounter but never throws; the captured
    ///        error stays on the handle.
    void drainCounter(JobHandle& handle, core::i32 targetValue = 0) noexcept;

    /// @brief Runs at most one pending job on the calling thread.
    /// @return True if a job was executed.
    bool tryRunPendingJob() noexcept;

    /// @brief Returns the worker thread count.
    [[nodiscard]] core::u32 workerCount() const noexcept;

    /// @brief True if the calling thread is one of this system's workers.
    [[nodiscard]] bool isWorkerThread() const noexcept;

private:
    using Job = std::pair<std::function<void()>, JobHandle*>;

    struct alignas(core::kCacheLineSize) WorkerData
    {
        std::deque<Job> localQueue;
        std::mutex      mutex;
    };

    void workerLoop(core::u32 workerIndex);

    bool popLocal(core::u32 workerIndex, Job& outJob);

    bool trySteal(core::u32 thiefIndex, Job& outJob);

    static void execute(Job& job) noexcept;

    std::vector<std::thread>                     workers_;
    std::vector<std::unique_ptr<WorkerData>>     workerData_;
    std::atomic<bool>                            stopping_{false};
};

} // namespace rdx::concurrency
