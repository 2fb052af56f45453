#include <coloc/core/job_queue.hpp>
#include <coloc/core/error.hpp>

#include <algorithm>
#include <string>

namespace coloc::core {

JobQueue::JobQueue(const Clock& clock)
    : timer_(clock) {}

bool JobQueue::known(JobId job) const {
    if (std::find(pending_.begin(), pending_.end(), job) != pending_.end()) {
        return true;
    }
    if (find_running(job) != nullptr) {
        return true;
    }
    return std::any_of(completed_.begin(), completed_.end(),
                       [job](const FinishedJob& f) { return f.id == job; });
}

void JobQueue::enqueue_all(const std::vector<JobId>& jobs) {
    for (auto job : jobs) {
        if (known(job)) {
            throw InvalidStateError("enqueue_all: job " + std::to_string(job.index()) +
                                    " is already queued, running or completed");
        }
        pending_.push_back(job);
    }
}

std::optional<JobId> JobQueue::dequeue_next_ready() {
    if (pending_.empty()) {
        return std::nullopt;
    }
    auto job = pending_.front();
    pending_.pop_front();
    return job;
}

void JobQueue::return_to_front(JobId job) {
    if (known(job)) {
        throw InvalidStateError("return_to_front: job " + std::to_string(job.index()) +
                                " was not dequeued");
    }
    pending_.push_front(job);
}

void JobQueue::record_start(JobId job, JobHandle handle, const CoreSet& cores,
                            uint32_t threads, std::size_t slot) {
    if (known(job)) {
        throw InvalidStateError("record_start: job " + std::to_string(job.index()) +
                                " was not dequeued");
    }
    if (cores.empty()) {
        throw InvalidStateError("record_start: job " + std::to_string(job.index()) +
                                " started with no cores");
    }
    timer_.start(job);
    running_.push_back(RunningJob{job, handle, cores, threads, slot, false});
}

void JobQueue::record_start_failure(JobId job) {
    if (known(job)) {
        throw InvalidStateError("record_start_failure: job " + std::to_string(job.index()) +
                                " was not dequeued");
    }
    completed_.push_back(FinishedJob{job, JobState::Failed});
}

RunningJob JobQueue::record_completion(JobId job, JobState final_state) {
    if (final_state != JobState::Completed && final_state != JobState::Failed) {
        throw InvalidStateError("record_completion: '" + std::string(to_string(final_state)) +
                                "' is not a final state");
    }
    auto iter = std::find_if(running_.begin(), running_.end(),
                             [job](const RunningJob& r) { return r.id == job; });
    if (iter == running_.end()) {
        throw InvalidStateError("record_completion: job " + std::to_string(job.index()) +
                                " is not running");
    }
    timer_.stop(job);
    RunningJob finished = *iter;
    running_.erase(iter);
    completed_.push_back(FinishedJob{job, final_state});
    return finished;
}

RunningJob& JobQueue::running_entry(JobId job, const char* operation) {
    auto iter = std::find_if(running_.begin(), running_.end(),
                             [job](const RunningJob& r) { return r.id == job; });
    if (iter == running_.end()) {
        throw InvalidStateError(std::string(operation) + ": job " +
                                std::to_string(job.index()) + " is not running");
    }
    return *iter;
}

void JobQueue::record_pause(JobId job) {
    auto& entry = running_entry(job, "record_pause");
    if (entry.paused) {
        throw InvalidStateError("record_pause: job " + std::to_string(job.index()) +
                                " is already paused");
    }
    timer_.pause(job);
    entry.paused = true;
}

void JobQueue::record_resume(JobId job) {
    auto& entry = running_entry(job, "record_resume");
    if (!entry.paused) {
        throw InvalidStateError("record_resume: job " + std::to_string(job.index()) +
                                " is not paused");
    }
    timer_.resume(job);
    entry.paused = false;
}

void JobQueue::update_cores(JobId job, const CoreSet& cores) {
    auto& entry = running_entry(job, "update_cores");
    if (cores.empty()) {
        throw InvalidStateError("update_cores: job " + std::to_string(job.index()) +
                                " cannot run on no cores");
    }
    entry.cores = cores;
}

const RunningJob* JobQueue::find_running(JobId job) const {
    auto iter = std::find_if(running_.begin(), running_.end(),
                             [job](const RunningJob& r) { return r.id == job; });
    return iter == running_.end() ? nullptr : &*iter;
}

std::optional<JobState> JobQueue::state_of(JobId job) const {
    if (std::find(pending_.begin(), pending_.end(), job) != pending_.end()) {
        return JobState::Queued;
    }
    if (const auto* entry = find_running(job)) {
        return entry->paused ? JobState::Paused : JobState::Running;
    }
    for (const auto& finished : completed_) {
        if (finished.id == job) {
            return finished.state;
        }
    }
    return std::nullopt;
}

} // namespace coloc::core
