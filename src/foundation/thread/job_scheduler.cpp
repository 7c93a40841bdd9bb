/// @file job_scheduler.cpp
/// @brief GameJobScheduler implementation wrapping kcenon thread_system.

#include "gsim/foundation/job_scheduler.hpp"

#include "gsim/foundation/game_logger.hpp"

#include <kcenon/thread/core/thread_pool.h>
#include <kcenon/thread/core/thread_worker.h>
#include <kcenon/thread/core/job_builder.h>

#include <algorithm>
#include <atomic>
#include <exception>
#include <future>
#include <mutex>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>

namespace gsim::foundation {

static kcenon::thread::job_priority mapPriority(JobPriority p) {
    switch (p) {
        case JobPriority::Critical: return kcenon::thread::job_priority::highest;
        case JobPriority::High:     return kcenon::thread::job_priority::high;
        case JobPriority::Normal:   return kcenon::thread::job_priority::normal;
        case JobPriority::Low:      return kcenon::thread::job_priority::low;
    }
    return kcenon::thread::job_priority::normal;
}

// ---------------------------------------------------------------------------
// Impl
// ---------------------------------------------------------------------------
struct GameJobScheduler::Impl {
    struct Tracked {
        std::shared_future<void> future;
        std::shared_ptr<std::atomic<bool>> cancelled;
    };

    std::shared_ptr<kcenon::thread::thread_pool> pool;
    std::size_t workers = 0;
    std::atomic<uint64_t> nextJobId{1};
    std::atomic<bool> stopped{false};

    std::unordered_map<JobId, Tracked> jobs;
    mutable std::mutex mutex;

    GameResult<void> collect(JobId id, std::shared_future<void> future) {
        try {
            future.get();
        } catch (const std::exception& e) {
            return GameResult<void>::err(
                GameError(ErrorCode::ThreadError,
                          "job " + std::to_string(id) + " failed: " + e.what()));
        } catch (...) {
            return GameResult<void>::err(
                GameError(ErrorCode::ThreadError,
                          "job " + std::to_string(id) + " failed with a non-standard exception"));
        }
        return GameResult<void>::ok();
    }
};

GameJobScheduler::GameJobScheduler(std::size_t numThreads)
    : impl_(std::make_unique<Impl>())
{
    impl_->workers = std::max<std::size_t>(numThreads, 1);
    impl_->pool = std::make_shared<kcenon::thread::thread_pool>("gsim_workers");

    std::vector<std::unique_ptr<kcenon::thread::thread_worker>> workers;
    workers.reserve(impl_->workers);
    for (std::size_t i = 0; i < impl_->workers; ++i) {
        workers.push_back(std::make_unique<kcenon::thread::thread_worker>());
    }
    impl_->pool->enqueue_batch(std::move(workers));
    impl_->pool->start();
}

GameJobScheduler::~GameJobScheduler() {
    if (impl_) {
        shutdown();
    }
}

GameJobScheduler::GameJobScheduler(GameJobScheduler&&) noexcept = default;
GameJobScheduler& GameJobScheduler::operator=(GameJobScheduler&&) noexcept = default;

// ---------------------------------------------------------------------------
// schedule()
// ---------------------------------------------------------------------------
GameResult<GameJobScheduler::JobId> GameJobScheduler::schedule(
    JobFunc job, JobPriority priority)
{
    if (impl_->stopped.load(std::memory_order_acquire)) {
        return GameResult<JobId>::err(
            GameError(ErrorCode::JobScheduleFailed, "scheduler is shut down"));
    }

    auto id = impl_->nextJobId.fetch_add(1, std::memory_order_relaxed);
    auto cancelFlag = std::make_shared<std::atomic<bool>>(false);
    auto promise = std::make_shared<std::promise<void>>();
    auto future = promise->get_future().share();

    // Track before enqueueing so a fast worker cannot finish an untracked job.
    {
        std::lock_guard lock(impl_->mutex);
        impl_->jobs[id] = Impl::Tracked{future, cancelFlag};
    }

    auto threadJob = kcenon::thread::job_builder()
        .name("gsim_job_" + std::to_string(id))
        .priority(mapPriority(priority))
        .work([fn = std::move(job), cancelFlag, promise]()
              -> kcenon::common::VoidResult {
            // The exception is handed to whoever waits on the job.
            try {
                if (!cancelFlag->load(std::memory_order_acquire)) {
                    fn();
                }
                promise->set_value();
            } catch (...) {
                promise->set_exception(std::current_exception());
            }
            return kcenon::common::VoidResult::ok(std::monostate{});
        })
        .build();

    auto enqResult = impl_->pool->enqueue(std::move(threadJob));
    if (enqResult.is_err()) {
        std::lock_guard lock(impl_->mutex);
        impl_->jobs.erase(id);
        return GameResult<JobId>::err(
            GameError(ErrorCode::JobScheduleFailed, "failed to enqueue job"));
    }

    return GameResult<JobId>::ok(id);
}

// ---------------------------------------------------------------------------
// post()
// ---------------------------------------------------------------------------
GameResult<void> GameJobScheduler::post(JobFunc job, JobPriority priority) {
    if (impl_->stopped.load(std::memory_order_acquire)) {
        return GameResult<void>::err(
            GameError(ErrorCode::JobScheduleFailed, "scheduler is shut down"));
    }

    auto id = impl_->nextJobId.fetch_add(1, std::memory_order_relaxed);
    auto threadJob = kcenon::thread::job_builder()
        .name("gsim_post_" + std::to_string(id))
        .priority(mapPriority(priority))
        .work([fn = std::move(job), id]() -> kcenon::common::VoidResult {
            try {
                fn();
            } catch (const std::exception& e) {
                GSIM_LOG_ERROR(LogCategory::Core,
                               "posted job " + std::to_string(id) + " threw: " + e.what());
            } catch (...) {
                GSIM_LOG_ERROR(LogCategory::Core,
                               "posted job " + std::to_string(id) +
                               " threw a non-standard exception");
            }
            return kcenon::common::VoidResult::ok(std::monostate{});
        })
        .build();

    if (impl_->pool->enqueue(std::move(threadJob)).is_err()) {
        return GameResult<void>::err(
            GameError(ErrorCode::JobScheduleFailed, "failed to enqueue job"));
    }
    return GameResult<void>::ok();
}

// ---------------------------------------------------------------------------
// wait() / waitFor()
// ---------------------------------------------------------------------------
GameResult<void> GameJobScheduler::wait(JobId id) {
    std::shared_future<void> future;
    {
        std::lock_guard lock(impl_->mutex);
        auto it = impl_->jobs.find(id);
        if (it == impl_->jobs.end()) {
            return GameResult<void>::err(
                GameError(ErrorCode::JobNotFound, "job not found"));
        }
        future = it->second.future;
        impl_->jobs.erase(it);
    }
    return impl_->collect(id, std::move(future));
}

GameResult<void> GameJobScheduler::waitFor(JobId id, std::chrono::milliseconds timeout) {
    std::shared_future<void> future;
    {
        std::lock_guard lock(impl_->mutex);
        auto it = impl_->jobs.find(id);
        if (it == impl_->jobs.end()) {
            return GameResult<void>::err(
                GameError(ErrorCode::JobNotFound, "job not found"));
        }
        future = it->second.future;
    }

    if (future.wait_for(timeout) != std::future_status::ready) {
        return GameResult<void>::err(
            GameError(ErrorCode::JobTimeout, "job " + std::to_string(id) + " timed out"));
    }

    {
        std::lock_guard lock(impl_->mutex);
        impl_->jobs.erase(id);
    }
    return impl_->collect(id, std::move(future));
}

// ---------------------------------------------------------------------------
// cancel()
// ---------------------------------------------------------------------------
GameResult<void> GameJobScheduler::cancel(JobId id) {
    std::lock_guard lock(impl_->mutex);

    auto it = impl_->jobs.find(id);
    if (it == impl_->jobs.end()) {
        return GameResult<void>::err(
            GameError(ErrorCode::JobNotFound, "job not found"));
    }

    auto status = it->second.future.wait_for(std::chrono::seconds(0));
    if (status == std::future_status::ready) {
        return GameResult<void>::err(
            GameError(ErrorCode::JobCancelled, "job already completed"));
    }

    it->second.cancelled->store(true, std::memory_order_release);
    return GameResult<void>::ok();
}

void GameJobScheduler::shutdown() {
    if (impl_->stopped.exchange(true, std::memory_order_acq_rel)) {
        return;
    }
    if (impl_->pool) {
        impl_->pool->stop(false);
    }
}

std::size_t GameJobScheduler::workerCount() const noexcept {
    return impl_->workers;
}

std::size_t GameJobScheduler::trackedJobs() const {
    std::lock_guard lock(impl_->mutex);
    return impl_->jobs.size();
}

} // namespace gsim::foundation
