#pragma once

#include <coloc/core/affinity_controller.hpp>
#include <coloc/core/clock.hpp>
#include <coloc/core/colocation.hpp>
#include <coloc/core/core_set.hpp>
#include <coloc/core/event_log.hpp>
#include <coloc/core/job.hpp>
#include <coloc/core/job_queue.hpp>
#include <coloc/core/job_runner.hpp>
#include <coloc/core/result.hpp>
#include <coloc/core/usage_monitor.hpp>

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string_view>
#include <vector>

namespace coloc::core {

/// @brief What a single tick did.
/// @ingroup core_controller
enum class TickAction : uint8_t {
    None,            ///< Sample taken, no threshold crossed.
    SampleFailed,    ///< Monitor failed; evaluation skipped.
    ServiceMissing,  ///< Service not pinned yet; evaluation skipped.
    ScaledUp,        ///< SoloCore -> Colocated.
    ScaledDown,      ///< Colocated or Isolated -> SoloCore.
    Evicted,         ///< One job moved off the shared cores.
    Isolated,        ///< Colocated -> Isolated with no job left to move.
    Readmitted,      ///< One evicted job moved back onto the shared cores.
    ActionFailed     ///< A threshold was crossed but the collaborator call failed.
};

/// @brief Lowercase name of a TickAction.
[[nodiscard]] std::string_view to_string(TickAction action) noexcept;

/// @brief Summary of one tick, for callers and tests.
/// @ingroup core_controller
struct TickReport {
    uint64_t tick{0};
    ColocationState state{ColocationState::SoloCore};  ///< State after the tick.
    std::optional<double> utilization;                 ///< Home-core usage, if sampled.
    TickAction action{TickAction::None};
};

/// @brief How run() ended.
/// @ingroup core_controller
enum class RunOutcome : uint8_t {
    Drained,               ///< Every job finished.
    Interrupted,           ///< Stop requested; every running job was stopped.
    InterruptedIncomplete  ///< Stop requested; some job could not be stopped.
};

/// @brief Threshold-driven controller sharing cores between a service and batch jobs.
/// @ingroup core_controller
///
/// The controller is the single owner of the core-to-owner mapping. Each
/// tick samples utilization, evaluates at most one colocation transition on
/// the service's home-core usage, then polls the running jobs, retires the
/// finished ones and fills idle slots from the queue.
///
/// Every transition computes the new core set, calls the collaborator,
/// updates the internal state and then logs the change. A failed call leaves
/// the state exactly as it was and is retried by the next tick's evaluation.
///
/// A job whose launch fails permanently, or fails max_start_attempts times,
/// ends as failed without ever holding cores and the slot goes to the next
/// queued job.
///
/// Jobs evicted from the shared cores, and jobs started while the shared
/// cores are reserved for the service, are kept on a LIFO stack and
/// re-admitted most-recent first.
///
/// All collaborators are borrowed and must outlive the controller.
///
/// @see ControllerConfig, JobQueue, EventLog
class ColocationController {
public:
    /// @throws OutOfRangeError if the configuration is invalid or the
    ///         monitor covers a different number of cores.
    ColocationController(ControllerConfig config, const JobCatalog& catalog,
                         UsageMonitor& monitor, AffinityController& affinity,
                         JobRunner& runner, EventLog& log, Clock& clock);

    ColocationController(const ColocationController&) = delete;
    ColocationController& operator=(const ColocationController&) = delete;
    ColocationController(ColocationController&&) = delete;
    ColocationController& operator=(ColocationController&&) = delete;

    /// @brief Pin the service, queue every job and fill the slots.
    /// @throws InvalidStateError if called twice.
    void start();

    /// @brief Run one sample -> evaluate -> bookkeeping iteration.
    /// @throws InvalidStateError before start() or after the run ended.
    TickReport tick();

    /// @brief Loop until every job finished or @p stop_requested is set.
    ///
    /// Calls start() if needed. An exception escaping a tick is logged with
    /// the tick number and the loop continues. On drain the total execution
    /// time is logged; on interrupt every running job is stopped. The event
    /// log is closed before returning in both cases.
    RunOutcome run(const std::atomic<bool>& stop_requested);

    /// @brief Stop every running job and close the event log.
    /// @return True if every job was stopped.
    bool shutdown();

    /// @brief Pause a running job without releasing its cores.
    [[nodiscard]] Status pause_job(JobId job);

    /// @brief Resume a paused job.
    [[nodiscard]] Status resume_job(JobId job);

    /// @brief True once the queue and the running set are both empty.
    [[nodiscard]] bool finished() const noexcept { return started_ && queue_.drained(); }

    [[nodiscard]] ColocationState state() const noexcept { return state_; }
    [[nodiscard]] const CoreSet& service_cores() const noexcept { return service_cores_; }
    [[nodiscard]] bool service_pinned() const noexcept { return service_pinned_; }
    [[nodiscard]] const JobQueue& queue() const noexcept { return queue_; }
    [[nodiscard]] uint64_t tick_count() const noexcept { return tick_; }
    [[nodiscard]] const ControllerConfig& config() const noexcept { return config_; }

    /// @brief Evicted and displaced jobs, oldest first; back() is re-admitted next.
    [[nodiscard]] const std::vector<JobId>& evicted() const noexcept { return evicted_; }

private:
    // Evaluation
    TickAction evaluate(double usage);
    TickAction evaluate_colocated(double usage);
    TickAction evaluate_isolated(double usage);
    TickAction resize_service(const CoreSet& cores, ColocationState next, double usage);
    TickAction evict(const RunningJob& job, double usage);
    TickAction readmit(JobId job, double usage);
    void enter_isolated(double usage);
    [[nodiscard]] double home_usage(const UtilizationSample& sample) const;

    // Bookkeeping
    void ensure_service_pinned();
    void bookkeeping();
    void retire(const RunningJob& job, JobState final_state, std::string_view status);
    void release(const RunningJob& job);
    enum class StartOutcome : uint8_t { Started, Requeued, Abandoned };

    void fill_idle_slots();
    StartOutcome start_job(JobId job, std::size_t slot);
    StartOutcome handle_start_failure(JobId job, const Error& error);
    [[nodiscard]] bool shared_reserved() const noexcept;
    [[nodiscard]] const RunningJob* first_colocated_job() const;
    void finish();
    void drop_evicted(JobId job);
    void transition(ColocationState previous, double usage);

    ControllerConfig config_;
    const JobCatalog& catalog_;      // NOLINT(cppcoreguidelines-avoid-const-or-ref-data-members)
    UsageMonitor& monitor_;          // NOLINT(cppcoreguidelines-avoid-const-or-ref-data-members)
    AffinityController& affinity_;   // NOLINT(cppcoreguidelines-avoid-const-or-ref-data-members)
    JobRunner& runner_;              // NOLINT(cppcoreguidelines-avoid-const-or-ref-data-members)
    EventLog& log_;                  // NOLINT(cppcoreguidelines-avoid-const-or-ref-data-members)
    Clock& clock_;                   // NOLINT(cppcoreguidelines-avoid-const-or-ref-data-members)

    JobQueue queue_;
    ColocationState state_{ColocationState::SoloCore};
    CoreSet service_cores_;
    std::vector<JobId> evicted_;
    std::vector<std::optional<JobId>> slot_owner_;
    std::map<JobId, uint32_t> start_attempts_;  ///< Failed launches per job.
    uint64_t tick_{0};
    bool started_{false};
    bool service_pinned_{false};
    bool ended_{false};
};

} // namespace coloc::core
