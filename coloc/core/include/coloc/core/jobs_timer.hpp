#pragma once

#include <coloc/core/clock.hpp>
#include <coloc/core/job.hpp>
#include <coloc/core/types.hpp>

#include <map>
#include <optional>

namespace coloc::core {

/// @brief Per-job wall-clock timers that exclude paused intervals.
/// @ingroup core_jobs
///
/// Every operation must match the job's timer state: stopping a timer that
/// was never started, starting one twice, or resuming one that is not paused
/// are programming errors and throw InvalidStateError.
///
/// The run-wide elapsed time spans from the first timer start to the latest
/// timer stop. All readings come from Clock::monotonic_now().
class JobsTimer {
public:
    /// @param clock Time source (not owned, must outlive the timer).
    explicit JobsTimer(const Clock& clock);

    /// @throws InvalidStateError if the job's timer was already started.
    void start(JobId job);

    /// @throws InvalidStateError if the timer is not running or already paused.
    void pause(JobId job);

    /// @throws InvalidStateError if the timer is not paused.
    void resume(JobId job);

    /// @brief Stop the timer; a paused timer is resumed first.
    /// @throws InvalidStateError if the timer is not running.
    void stop(JobId job);

    /// @brief Active (non-paused) time between start and stop.
    /// @throws InvalidStateError if the timer has not been stopped.
    [[nodiscard]] Duration job_time(JobId job) const;

    /// @brief Time between the first start and the last stop.
    /// @throws InvalidStateError if no timer has been both started and stopped.
    [[nodiscard]] Duration total_elapsed() const;

    /// @brief True once some timer has been both started and stopped.
    [[nodiscard]] bool has_total() const noexcept { return first_start_ && last_end_; }

    [[nodiscard]] bool started(JobId job) const { return timers_.count(job) != 0; }
    [[nodiscard]] bool paused(JobId job) const;
    [[nodiscard]] bool stopped(JobId job) const;

private:
    struct Entry {
        TimePoint start;
        Duration accumulated_pause{};
        std::optional<TimePoint> pause_start;
        std::optional<TimePoint> end;
    };

    Entry& running_entry(JobId job, const char* operation);

    const Clock& clock_;  // NOLINT(cppcoreguidelines-avoid-const-or-ref-data-members)
    std::map<JobId, Entry> timers_;
    std::optional<TimePoint> first_start_;
    std::optional<TimePoint> last_end_;
};

} // namespace coloc::core
