#pragma once

#include <coloc/core/clock.hpp>
#include <coloc/core/core_set.hpp>
#include <coloc/core/job.hpp>
#include <coloc/core/job_runner.hpp>
#include <coloc/core/jobs_timer.hpp>

#include <cstddef>
#include <cstdint>
#include <deque>
#include <optional>
#include <vector>

namespace coloc::core {

/// @brief Bookkeeping for a job that has been started.
/// @ingroup core_jobs
struct RunningJob {
    JobId id;
    JobHandle handle;
    CoreSet cores;      ///< Cores as last successfully assigned.
    uint32_t threads{0};
    std::size_t slot{0}; ///< Index of the job slot the job occupies.
    bool paused{false};
};

/// @brief A job that left the running set.
/// @ingroup core_jobs
struct FinishedJob {
    JobId id;
    JobState state;  ///< JobState::Completed or JobState::Failed.
};

/// @brief Pending queue, running set and completed set of batch jobs.
/// @ingroup core_jobs
///
/// The queue is filled once, in static priority order, and drained
/// first-in-first-out. A job is in at most one of {pending, running,
/// completed}; between dequeue_next_ready() and record_start() it is in
/// none of them. return_to_front() puts a job whose launch failed back at
/// the head of the queue; record_start_failure() retires it instead.
///
/// The running set preserves start order, which the controller uses as its
/// eviction tie-break. Per-job timers are kept in a JobsTimer.
class JobQueue {
public:
    /// @param clock Time source for the job timers (not owned).
    explicit JobQueue(const Clock& clock);

    /// @brief Populate the pending queue.
    /// @throws InvalidStateError if a job is already known to the queue.
    void enqueue_all(const std::vector<JobId>& jobs);

    /// @brief Pop the head of the pending queue.
    /// @return The next job, or std::nullopt when nothing is pending.
    [[nodiscard]] std::optional<JobId> dequeue_next_ready();

    /// @brief Put a dequeued job back at the head of the pending queue.
    /// @throws InvalidStateError if the job is pending, running or completed.
    void return_to_front(JobId job);

    /// @brief Record a successful launch and start the job's timer.
    /// @throws InvalidStateError if the job is pending, running or completed.
    void record_start(JobId job, JobHandle handle, const CoreSet& cores,
                      uint32_t threads, std::size_t slot);

    /// @brief Move a dequeued job that could not be launched to the completed set.
    ///
    /// The job ends as JobState::Failed and never gets a timer, so it does
    /// not count towards total_elapsed().
    /// @throws InvalidStateError if the job is pending, running or completed.
    void record_start_failure(JobId job);

    /// @brief Move a running job to the completed set and stop its timer.
    /// @param final_state JobState::Completed or JobState::Failed.
    /// @return The job's last running bookkeeping.
    /// @throws InvalidStateError if the job is not running or the state is not final.
    RunningJob record_completion(JobId job, JobState final_state);

    /// @throws InvalidStateError if the job is not running or already paused.
    void record_pause(JobId job);

    /// @throws InvalidStateError if the job is not paused.
    void record_resume(JobId job);

    /// @brief Replace a running job's recorded cores.
    /// @throws InvalidStateError if the job is not running.
    void update_cores(JobId job, const CoreSet& cores);

    [[nodiscard]] const std::deque<JobId>& pending() const noexcept { return pending_; }
    [[nodiscard]] const std::vector<RunningJob>& running() const noexcept { return running_; }
    [[nodiscard]] const std::vector<FinishedJob>& completed() const noexcept { return completed_; }

    /// @return The running entry of @p job, or nullptr.
    [[nodiscard]] const RunningJob* find_running(JobId job) const;

    /// @return Where the job currently is, or std::nullopt if it is in transit or unknown.
    [[nodiscard]] std::optional<JobState> state_of(JobId job) const;

    /// @brief True when nothing is pending and nothing is running.
    [[nodiscard]] bool drained() const noexcept { return pending_.empty() && running_.empty(); }

    [[nodiscard]] const JobsTimer& timer() const noexcept { return timer_; }

    /// @brief First job start to last job completion.
    /// @throws InvalidStateError if no started job has completed.
    [[nodiscard]] Duration total_elapsed() const { return timer_.total_elapsed(); }

private:
    RunningJob& running_entry(JobId job, const char* operation);
    [[nodiscard]] bool known(JobId job) const;

    std::deque<JobId> pending_;
    std::vector<RunningJob> running_;
    std::vector<FinishedJob> completed_;
    JobsTimer timer_;
};

} // namespace coloc::core
