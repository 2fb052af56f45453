#pragma once

#include <coloc/core/core_set.hpp>
#include <coloc/core/job.hpp>
#include <coloc/core/result.hpp>

#include <compare>
#include <cstdint>
#include <string_view>

namespace coloc::core {

/// @brief Opaque reference to a job launched by a JobRunner.
/// @ingroup core_collaborators
struct JobHandle {
    uint64_t value{0};

    constexpr auto operator<=>(const JobHandle&) const noexcept = default;
    constexpr bool operator==(const JobHandle&) const noexcept = default;
};

/// @brief Execution status reported by a JobRunner.
/// @ingroup core_collaborators
enum class RunStatus : uint8_t {
    Running,
    Paused,
    Completed,  ///< Exited successfully.
    Failed,     ///< Exited with an error, or was killed.
    Unknown     ///< The runner has no record of the handle.
};

/// @brief Lowercase name of a RunStatus.
[[nodiscard]] constexpr std::string_view to_string(RunStatus status) noexcept {
    switch (status) {
        case RunStatus::Running:   return "running";
        case RunStatus::Paused:    return "paused";
        case RunStatus::Completed: return "completed";
        case RunStatus::Failed:    return "failed";
        case RunStatus::Unknown:   return "unknown";
    }
    return "unknown";
}

/// @brief Abstract execution substrate for isolated batch jobs.
/// @ingroup core_collaborators
///
/// All calls are synchronous acknowledgments: they return once the request
/// has been applied, not when the job finishes. None of them blocks longer
/// than the runner's configured command timeout, except stop(), which may
/// wait for its grace period.
///
/// The runner keeps no record of core ownership; it applies exactly the
/// reassignment it is asked for.
class JobRunner {
public:
    virtual ~JobRunner() = default;

    /// @brief Launch @p spec pinned to @p cores with @p threads workers.
    /// @return Handle of the running job, or the reason the launch failed.
    [[nodiscard]] virtual Result<JobHandle> start(const JobSpec& spec, const CoreSet& cores,
                                                  uint32_t threads) = 0;

    /// @brief Change the affinity of the job's whole execution context.
    ///
    /// Valid for running and paused jobs; rejected with
    /// ErrorKind::Permanent once the job has finished.
    [[nodiscard]] virtual Status reassign_cores(JobHandle handle, const CoreSet& cores) = 0;

    /// @brief Freeze the job without releasing its cores.
    [[nodiscard]] virtual Status pause(JobHandle handle) = 0;

    /// @brief Unfreeze a paused job.
    [[nodiscard]] virtual Status resume(JobHandle handle) = 0;

    /// @brief Terminate the job: graceful request, grace period, then forced.
    ///
    /// Idempotent: stopping a job that has already finished or been stopped
    /// succeeds without side effects.
    [[nodiscard]] virtual Status stop(JobHandle handle) = 0;

    /// @brief Current status of the job. Never waits for the job itself.
    ///
    /// An implementation that has to ask an external tool may wait for its
    /// answer, bounded by a timeout shorter than a controller tick (see
    /// RunnerSettings::status_timeout). A query that fails or times out
    /// reports the last known status rather than an error.
    [[nodiscard]] virtual RunStatus status(JobHandle handle) = 0;

    /// @brief Release the runner's resources for a finished job.
    ///
    /// Called once after the job reached Completed or Failed, or was stopped.
    [[nodiscard]] virtual Status release(JobHandle handle) = 0;
};

} // namespace coloc::core
