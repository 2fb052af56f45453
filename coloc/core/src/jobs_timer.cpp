#include <coloc/core/jobs_timer.hpp>
#include <coloc/core/error.hpp>

#include <string>

namespace coloc::core {

JobsTimer::JobsTimer(const Clock& clock)
    : clock_(clock) {}

JobsTimer::Entry& JobsTimer::running_entry(JobId job, const char* operation) {
    auto iter = timers_.find(job);
    if (iter == timers_.end()) {
        throw InvalidStateError(std::string(operation) + ": timer of job " +
                                std::to_string(job.index()) + " was never started");
    }
    if (iter->second.end) {
        throw InvalidStateError(std::string(operation) + ": timer of job " +
                                std::to_string(job.index()) + " is already stopped");
    }
    return iter->second;
}

void JobsTimer::start(JobId job) {
    if (timers_.count(job) != 0) {
        throw InvalidStateError("start: timer of job " + std::to_string(job.index()) +
                                " was already started");
    }
    auto now = clock_.monotonic_now();
    timers_.emplace(job, Entry{now, Duration::zero(), std::nullopt, std::nullopt});
    if (!first_start_) {
        first_start_ = now;
    }
}

void JobsTimer::pause(JobId job) {
    auto& entry = running_entry(job, "pause");
    if (entry.pause_start) {
        throw InvalidStateError("pause: timer of job " + std::to_string(job.index()) +
                                " is already paused");
    }
    entry.pause_start = clock_.monotonic_now();
}

void JobsTimer::resume(JobId job) {
    auto& entry = running_entry(job, "resume");
    if (!entry.pause_start) {
        throw InvalidStateError("resume: timer of job " + std::to_string(job.index()) +
                                " is not paused");
    }
    entry.accumulated_pause += clock_.monotonic_now() - *entry.pause_start;
    entry.pause_start.reset();
}

void JobsTimer::stop(JobId job) {
    auto& entry = running_entry(job, "stop");
    if (entry.pause_start) {
        resume(job);
    }
    auto now = clock_.monotonic_now();
    entry.end = now;
    if (!last_end_ || *last_end_ < now) {
        last_end_ = now;
    }
}

Duration JobsTimer::job_time(JobId job) const {
    auto iter = timers_.find(job);
    if (iter == timers_.end() || !iter->second.end) {
        throw InvalidStateError("job_time: timer of job " + std::to_string(job.index()) +
                                " has not been stopped");
    }
    const auto& entry = iter->second;
    return (*entry.end - entry.start) - entry.accumulated_pause;
}

Duration JobsTimer::total_elapsed() const {
    if (!first_start_ || !last_end_) {
        throw InvalidStateError("total_elapsed: no job has been started and stopped");
    }
    return *last_end_ - *first_start_;
}

bool JobsTimer::paused(JobId job) const {
    auto iter = timers_.find(job);
    return iter != timers_.end() && iter->second.pause_start.has_value();
}

bool JobsTimer::stopped(JobId job) const {
    auto iter = timers_.find(job);
    return iter != timers_.end() && iter->second.end.has_value();
}

} // namespace coloc::core
