#include <coloc/core/controller.hpp>
#include <coloc/core/error.hpp>

#include <algorithm>
#include <exception>
#include <iomanip>
#include <sstream>
#include <string>
#include <utility>

namespace coloc::core {

namespace {

// Seconds with millisecond precision, as used in the timing notes.
std::string format_seconds(Duration duration) {
    std::ostringstream out;
    out << std::fixed << std::setprecision(3) << duration.seconds();
    return out.str();
}

std::string describe(const Error& error) {
    return std::string(to_string(error.kind)) + ": " + error.message;
}

// Slice of the inter-tick sleep between two checks of the stop flag.
constexpr Duration kSleepSlice = duration_from_milliseconds(50);

} // anonymous namespace

std::string_view to_string(TickAction action) noexcept {
    switch (action) {
        case TickAction::None:           return "none";
        case TickAction::SampleFailed:   return "sample_failed";
        case TickAction::ServiceMissing: return "service_missing";
        case TickAction::ScaledUp:       return "scaled_up";
        case TickAction::ScaledDown:     return "scaled_down";
        case TickAction::Evicted:        return "evicted";
        case TickAction::Isolated:       return "isolated";
        case TickAction::Readmitted:     return "readmitted";
        case TickAction::ActionFailed:   return "action_failed";
    }
    return "unknown";
}

ColocationController::ColocationController(ControllerConfig config, const JobCatalog& catalog,
                                           UsageMonitor& monitor, AffinityController& affinity,
                                           JobRunner& runner, EventLog& log, Clock& clock)
    : config_(std::move(config))
    , catalog_(catalog)
    , monitor_(monitor)
    , affinity_(affinity)
    , runner_(runner)
    , log_(log)
    , clock_(clock)
    , queue_(clock) {
    config_.validate();
    if (monitor_.core_count() != config_.layout.core_count) {
        throw OutOfRangeError("usage monitor covers " + std::to_string(monitor_.core_count()) +
                              " cores, layout expects " +
                              std::to_string(config_.layout.core_count));
    }
    slot_owner_.resize(config_.layout.slots.size());
}

// ============================================================================
// Lifecycle
// ============================================================================

void ColocationController::start() {
    if (started_) {
        throw InvalidStateError("start: controller already started");
    }
    started_ = true;
    log_.set_tick(tick_);
    ensure_service_pinned();
    queue_.enqueue_all(catalog_.ids());
    fill_idle_slots();
}

TickReport ColocationController::tick() {
    if (!started_ || ended_) {
        throw InvalidStateError("tick: controller is not running");
    }
    ++tick_;
    log_.set_tick(tick_);

    TickReport report;
    report.tick = tick_;

    ensure_service_pinned();
    if (!service_pinned_) {
        report.action = TickAction::ServiceMissing;
    } else {
        auto sample = monitor_.sample();
        if (!sample) {
            log_.note(SchedulerSubject{}, "sample_failed " + describe(sample.error()),
                      NoteLevel::Warning);
            report.action = TickAction::SampleFailed;
        } else if (sample.value().size() != config_.layout.core_count) {
            log_.note(SchedulerSubject{},
                      "sample_failed: got " + std::to_string(sample.value().size()) +
                          " cores, expected " + std::to_string(config_.layout.core_count),
                      NoteLevel::Warning);
            report.action = TickAction::SampleFailed;
        } else {
            double usage = home_usage(sample.value());
            report.utilization = usage;
            report.action = evaluate(usage);
        }
    }

    bookkeeping();
    report.state = state_;
    return report;
}

RunOutcome ColocationController::run(const std::atomic<bool>& stop_requested) {
    if (!started_) {
        start();
    }
    while (!finished() && !stop_requested.load()) {
        try {
            tick();
        } catch (const std::exception& e) {
            log_.note(SchedulerSubject{},
                      "tick " + std::to_string(tick_) + " failed: " + e.what(),
                      NoteLevel::Error);
        }
        if (finished()) {
            break;
        }
        auto remaining = config_.tick_interval;
        while (remaining > Duration::zero() && !stop_requested.load()) {
            auto step = remaining < kSleepSlice ? remaining : kSleepSlice;
            clock_.sleep_for(step);
            remaining -= step;
        }
    }

    if (finished()) {
        finish();
        return RunOutcome::Drained;
    }
    return shutdown() ? RunOutcome::Interrupted : RunOutcome::InterruptedIncomplete;
}

bool ColocationController::shutdown() {
    if (ended_) {
        return true;
    }
    ended_ = true;

    bool clean = true;
    const auto running = queue_.running();
    for (const auto& job : running) {
        try {
            auto status = runner_.stop(job.handle);
            if (!status) {
                clean = false;
                log_.note(job.id, "stop_failed " + describe(status.error()), NoteLevel::Error);
                continue;
            }
            queue_.record_completion(job.id, JobState::Failed);
            log_.job_end(job.id, "stopped");
            release(job);
            slot_owner_[job.slot].reset();
            drop_evicted(job.id);
        } catch (const std::exception& e) {
            clean = false;
            log_.note(job.id, std::string("stop_failed: ") + e.what(), NoteLevel::Error);
        }
    }
    if (!queue_.pending().empty()) {
        log_.note(SchedulerSubject{},
                  "shutdown_with_" + std::to_string(queue_.pending().size()) + "_pending_jobs",
                  NoteLevel::Warning);
    }
    log_.close();
    return clean;
}

void ColocationController::finish() {
    ended_ = true;
    if (queue_.timer().has_total()) {
        log_.note(SchedulerSubject{},
                  "total_execution_time_" + format_seconds(queue_.total_elapsed()) + "_seconds");
    }
    log_.close();
}

Status ColocationController::pause_job(JobId job) {
    const auto* entry = queue_.find_running(job);
    if (entry == nullptr) {
        return Status::failure(ErrorKind::Permanent, "job '" + catalog_.name(job) + "' is not running");
    }
    if (entry->paused) {
        return Status::failure(ErrorKind::Permanent, "job '" + catalog_.name(job) + "' is already paused");
    }
    auto status = runner_.pause(entry->handle);
    if (!status) {
        log_.note(job, "pause_failed " + describe(status.error()), NoteLevel::Error);
        return status;
    }
    queue_.record_pause(job);
    log_.job_pause(job);
    return {};
}

Status ColocationController::resume_job(JobId job) {
    const auto* entry = queue_.find_running(job);
    if (entry == nullptr || !entry->paused) {
        return Status::failure(ErrorKind::Permanent, "job '" + catalog_.name(job) + "' is not paused");
    }
    auto status = runner_.resume(entry->handle);
    if (!status) {
        log_.note(job, "resume_failed " + describe(status.error()), NoteLevel::Error);
        return status;
    }
    queue_.record_resume(job);
    log_.job_resume(job);
    return {};
}

// ============================================================================
// Evaluation
// ============================================================================

double ColocationController::home_usage(const UtilizationSample& sample) const {
    double usage = 0.0;
    for (auto core : config_.layout.home) {
        usage = std::max(usage, sample[core]);
    }
    return usage;
}

TickAction ColocationController::evaluate(double usage) {
    const auto& layout = config_.layout;
    switch (state_) {
        case ColocationState::SoloCore:
            if (usage > config_.thresholds.high) {
                return resize_service(layout.home.unite(layout.shared),
                                      ColocationState::Colocated, usage);
            }
            return TickAction::None;
        case ColocationState::Colocated:
            return evaluate_colocated(usage);
        case ColocationState::Isolated:
            return evaluate_isolated(usage);
    }
    return TickAction::None;
}

TickAction ColocationController::evaluate_colocated(double usage) {
    const auto& thresholds = config_.thresholds;
    if (usage > thresholds.eviction) {
        if (const auto* job = first_colocated_job()) {
            return evict(*job, usage);
        }
        enter_isolated(usage);
        return TickAction::Isolated;
    }
    if (!evicted_.empty()) {
        if (usage < thresholds.restore) {
            return readmit(evicted_.back(), usage);
        }
        return TickAction::None;
    }
    if (usage < thresholds.low) {
        return resize_service(config_.layout.home, ColocationState::SoloCore, usage);
    }
    return TickAction::None;
}

TickAction ColocationController::evaluate_isolated(double usage) {
    if (!(usage < config_.thresholds.restore)) {
        return TickAction::None;
    }
    if (!evicted_.empty()) {
        return readmit(evicted_.back(), usage);
    }
    return resize_service(config_.layout.home, ColocationState::SoloCore, usage);
}

TickAction ColocationController::resize_service(const CoreSet& cores, ColocationState next,
                                                double usage) {
    auto status = affinity_.set_affinity(config_.service_process, cores);
    if (!status) {
        const auto level = status.error().kind == ErrorKind::NotFound ? NoteLevel::Warning
                                                                      : NoteLevel::Error;
        log_.note(ServiceSubject{}, "set_affinity_failed " + describe(status.error()), level);
        return TickAction::ActionFailed;
    }

    const auto previous = state_;
    service_cores_ = cores;
    state_ = next;
    log_.cores_updated(ServiceSubject{}, cores, usage);
    transition(previous, usage);
    return next == ColocationState::SoloCore ? TickAction::ScaledDown : TickAction::ScaledUp;
}

TickAction ColocationController::evict(const RunningJob& job, double usage) {
    const auto id = job.id;
    const auto target = job.cores.subtract(config_.layout.shared);
    auto status = runner_.reassign_cores(job.handle, target);
    if (!status) {
        log_.note(id, "eviction_failed " + describe(status.error()), NoteLevel::Error);
        return TickAction::ActionFailed;
    }

    queue_.update_cores(id, target);
    evicted_.push_back(id);
    log_.cores_updated(id, target, usage);
    if (first_colocated_job() == nullptr) {
        enter_isolated(usage);
    }
    return TickAction::Evicted;
}

void ColocationController::enter_isolated(double usage) {
    const auto previous = state_;
    state_ = ColocationState::Isolated;
    transition(previous, usage);
}

TickAction ColocationController::readmit(JobId job, double usage) {
    const auto* entry = queue_.find_running(job);
    if (entry == nullptr) {
        throw InvalidStateError("readmit: evicted job '" + catalog_.name(job) + "' is not running");
    }
    const auto& slot_cores = config_.layout.slots[entry->slot];
    const auto target = entry->cores.unite(slot_cores.intersect(config_.layout.shared));
    auto status = runner_.reassign_cores(entry->handle, target);
    if (!status) {
        log_.note(job, "readmission_failed " + describe(status.error()), NoteLevel::Error);
        return TickAction::ActionFailed;
    }

    queue_.update_cores(job, target);
    evicted_.pop_back();
    const auto previous = state_;
    if (state_ == ColocationState::Isolated) {
        state_ = ColocationState::Colocated;
    }
    log_.cores_updated(job, target, usage);
    if (previous != state_) {
        transition(previous, usage);
    }
    return TickAction::Readmitted;
}

void ColocationController::transition(ColocationState previous, double usage) {
    std::ostringstream note;
    note << "state " << to_string(previous) << " -> " << to_string(state_)
         << " at " << std::fixed << std::setprecision(1) << usage << "%";
    log_.note(SchedulerSubject{}, note.str());
}

const RunningJob* ColocationController::first_colocated_job() const {
    const auto& running = queue_.running();
    auto iter = std::find_if(running.begin(), running.end(), [this](const RunningJob& job) {
        return job.cores.intersects(config_.layout.shared);
    });
    return iter == running.end() ? nullptr : &*iter;
}

bool ColocationController::shared_reserved() const noexcept {
    return state_ == ColocationState::Isolated ||
           (state_ == ColocationState::Colocated && !evicted_.empty());
}

// ============================================================================
// Bookkeeping
// ============================================================================

void ColocationController::ensure_service_pinned() {
    if (service_pinned_) {
        return;
    }
    const auto& home = config_.layout.home;
    auto status = affinity_.set_affinity(config_.service_process, home);
    if (!status) {
        const auto level = status.error().kind == ErrorKind::NotFound ? NoteLevel::Warning
                                                                      : NoteLevel::Error;
        log_.note(ServiceSubject{}, "pin_failed " + describe(status.error()), level);
        return;
    }
    service_pinned_ = true;
    service_cores_ = home;

    uint32_t threads = 0;
    auto count = affinity_.thread_count(config_.service_process);
    if (count) {
        threads = count.value();
    } else {
        log_.note(ServiceSubject{}, "thread_count_failed " + describe(count.error()),
                  NoteLevel::Warning);
    }
    log_.job_start(ServiceSubject{}, service_cores_, threads);
}

void ColocationController::bookkeeping() {
    const auto running = queue_.running();
    for (const auto& job : running) {
        switch (runner_.status(job.handle)) {
            case RunStatus::Running:
            case RunStatus::Paused:
                break;
            case RunStatus::Completed:
                retire(job, JobState::Completed, "completed");
                break;
            case RunStatus::Failed:
                retire(job, JobState::Failed, "failed");
                break;
            case RunStatus::Unknown:
                log_.note(job.id, "runner lost track of the job", NoteLevel::Warning);
                retire(job, JobState::Failed, "failed");
                break;
        }
    }
    fill_idle_slots();
}

void ColocationController::retire(const RunningJob& job, JobState final_state,
                                  std::string_view status) {
    queue_.record_completion(job.id, final_state);
    log_.job_end(job.id, status);
    log_.note(job.id, "execution_time_" + format_seconds(queue_.timer().job_time(job.id)) +
                          "_seconds");
    release(job);
    slot_owner_[job.slot].reset();
    drop_evicted(job.id);
}

void ColocationController::release(const RunningJob& job) {
    auto status = runner_.release(job.handle);
    if (!status) {
        log_.note(job.id, "release_failed " + describe(status.error()), NoteLevel::Warning);
    }
}

void ColocationController::fill_idle_slots() {
    for (std::size_t slot = 0; slot < slot_owner_.size(); ++slot) {
        auto outcome = StartOutcome::Abandoned;
        while (!slot_owner_[slot] && outcome == StartOutcome::Abandoned) {
            auto job = queue_.dequeue_next_ready();
            if (!job) {
                return;
            }
            outcome = start_job(*job, slot);
        }
        // A requeued job keeps its place at the head; try again next tick.
        if (outcome == StartOutcome::Requeued) {
            return;
        }
    }
}

ColocationController::StartOutcome ColocationController::start_job(JobId job, std::size_t slot) {
    const auto& spec = catalog_.spec(job);
    const auto& slot_cores = config_.layout.slots[slot];
    const bool displaced = shared_reserved() && slot_cores.intersects(config_.layout.shared);
    const auto cores = displaced ? slot_cores.subtract(config_.layout.shared) : slot_cores;
    const auto threads = spec.threads.value_or(static_cast<uint32_t>(slot_cores.size()));

    auto handle = runner_.start(spec, cores, threads);
    if (!handle) {
        return handle_start_failure(job, handle.error());
    }

    queue_.record_start(job, handle.value(), cores, threads, slot);
    slot_owner_[slot] = job;
    if (displaced) {
        evicted_.push_back(job);
    }
    log_.job_start(job, cores, threads);
    if (displaced) {
        log_.note(job, "displaced_from_shared_cores");
    }
    start_attempts_.erase(job);
    return StartOutcome::Started;
}

ColocationController::StartOutcome ColocationController::handle_start_failure(JobId job,
                                                                              const Error& error) {
    log_.note(job, "start_failed " + describe(error), NoteLevel::Error);

    const auto attempts = ++start_attempts_[job];
    bool give_up = false;
    switch (error.kind) {
        case ErrorKind::Permanent:
            give_up = true;
            break;
        case ErrorKind::Transient:
        case ErrorKind::NotFound:
            give_up = attempts >= config_.max_start_attempts;
            break;
    }

    if (!give_up) {
        queue_.return_to_front(job);
        return StartOutcome::Requeued;
    }
    start_attempts_.erase(job);
    queue_.record_start_failure(job);
    log_.note(job, "start_abandoned_after_" + std::to_string(attempts) + "_attempts",
              NoteLevel::Error);
    log_.job_end(job, "failed");
    return StartOutcome::Abandoned;
}

void ColocationController::drop_evicted(JobId job) {
    evicted_.erase(std::remove(evicted_.begin(), evicted_.end(), job), evicted_.end());
}

} // namespace coloc::core
