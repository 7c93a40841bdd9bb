#pragma once

/// @file job_scheduler.hpp
/// @brief GameJobScheduler: the worker pool shared by decision dispatch and
///        state validation, built on kcenon thread_system.

#include "gsim/foundation/game_result.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <thread>

namespace gsim::foundation {

/// Priority levels for scheduled jobs.
///
/// Maps to kcenon::thread::job_priority internally:
///   Critical -> highest, High -> high, Normal -> normal, Low -> low
enum class JobPriority { Critical, High, Normal, Low };

/// Fixed-size worker pool with per-job completion tracking.
///
/// @code
///   GameJobScheduler scheduler(4);
///   auto id = scheduler.schedule([] { validateEconomy(); }, JobPriority::High);
///   scheduler.wait(id.value());
/// @endcode
class GameJobScheduler {
public:
    using JobId = uint64_t;
    using JobFunc = std::function<void()>;

    /// @p numThreads of zero is treated as one worker.
    explicit GameJobScheduler(std::size_t numThreads = std::thread::hardware_concurrency());

    /// Stops the pool after running jobs finish.
    ~GameJobScheduler();

    GameJobScheduler(const GameJobScheduler&) = delete;
    GameJobScheduler& operator=(const GameJobScheduler&) = delete;
    GameJobScheduler(GameJobScheduler&&) noexcept;
    GameJobScheduler& operator=(GameJobScheduler&&) noexcept;

    /// @return The assigned JobId, or JobScheduleFailed when the pool has
    ///         been shut down or refuses the job.
    GameResult<JobId> schedule(JobFunc job, JobPriority priority = JobPriority::Normal);

    /// Fire-and-forget variant: the job is not tracked and cannot be waited
    /// on. An exception escaping @p job is logged under LogCategory::Core.
    GameResult<void> post(JobFunc job, JobPriority priority = JobPriority::Normal);

    /// Block until the job completes and forget it.
    /// @return ThreadError if the job threw, JobNotFound for unknown ids.
    GameResult<void> wait(JobId id);

    /// As wait(), but gives up after @p timeout with JobTimeout. The job
    /// stays tracked on timeout so it can be waited on again.
    GameResult<void> waitFor(JobId id, std::chrono::milliseconds timeout);

    /// Request cancellation of a job that has not started yet.
    /// Already-completed jobs return JobCancelled as a no-op error.
    GameResult<void> cancel(JobId id);

    /// Stop accepting jobs and join the workers. Idempotent.
    void shutdown();

    [[nodiscard]] std::size_t workerCount() const noexcept;

    /// Jobs scheduled but not yet waited on.
    [[nodiscard]] std::size_t trackedJobs() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

}  // namespace gsim::foundation
