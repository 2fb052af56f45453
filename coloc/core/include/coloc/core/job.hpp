#pragma once

#include <compare>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace coloc::core {

class JobCatalog;

/// @brief Identity of a batch job.
/// @ingroup core_jobs
///
/// JobIds are issued by JobCatalog when the configuration is loaded; the
/// control loop never resolves names, so an unknown job cannot turn into a
/// silent no-op at run time. A default-constructed JobId is not issued by any
/// catalog.
///
/// @see JobCatalog
class JobId {
    friend class JobCatalog;

public:
    JobId() = default;

    /// @brief Position of the job in the catalog (configuration order).
    [[nodiscard]] uint32_t index() const noexcept { return index_; }

    constexpr auto operator<=>(const JobId&) const noexcept = default;
    constexpr bool operator==(const JobId&) const noexcept = default;

private:
    explicit JobId(uint32_t index) : index_(index) {}

    uint32_t index_{UINT32_MAX};
};

/// @brief Lifecycle state of a batch job.
/// @ingroup core_jobs
enum class JobState : uint8_t {
    Queued,
    Running,
    Paused,
    Completed,
    Failed
};

/// @brief Lowercase name of a JobState (`"queued"`, `"running"`, ...).
[[nodiscard]] std::string_view to_string(JobState state) noexcept;

/// @brief Static description of a batch job, as configured.
/// @ingroup core_jobs
struct JobSpec {
    std::string name;                  ///< Unique job name (event-log subject).
    std::vector<std::string> command;  ///< argv; may contain `{threads}` / `{cores}`.
    std::string image;                 ///< Container image, for the container runner.
    std::optional<uint32_t> threads;   ///< Worker threads; defaults to the slot size.
};

/// @brief Ordered, immutable set of configured batch jobs.
/// @ingroup core_jobs
///
/// The catalog is built once at configuration time. Its order is the static
/// priority order in which jobs are queued.
class JobCatalog {
public:
    JobCatalog() = default;

    /// @brief Build a catalog from job specifications.
    /// @param specs Jobs in priority order.
    /// @throws InvalidStateError if two jobs share a name or a name is empty.
    explicit JobCatalog(std::vector<JobSpec> specs);

    [[nodiscard]] std::size_t size() const noexcept { return specs_.size(); }
    [[nodiscard]] bool empty() const noexcept { return specs_.empty(); }

    /// @brief Look up a job by name.
    /// @return The job's id, or std::nullopt if no job has that name.
    [[nodiscard]] std::optional<JobId> find(std::string_view name) const;

    /// @brief Access a job's specification.
    /// @throws OutOfRangeError if @p id was not issued by this catalog.
    [[nodiscard]] const JobSpec& spec(JobId id) const;

    /// @brief Shorthand for `spec(id).name`.
    [[nodiscard]] const std::string& name(JobId id) const { return spec(id).name; }

    /// @brief All ids in priority order.
    [[nodiscard]] std::vector<JobId> ids() const;

private:
    std::vector<JobSpec> specs_;
};

/// @brief Event subject: the latency-critical service.
struct ServiceSubject {
    bool operator==(const ServiceSubject&) const = default;
};

/// @brief Event subject: the controller itself.
struct SchedulerSubject {
    bool operator==(const SchedulerSubject&) const = default;
};

/// @brief Who an event or an action refers to.
/// @ingroup core_jobs
using Subject = std::variant<ServiceSubject, SchedulerSubject, JobId>;

/// @brief Event-log name of a subject (`"service"`, `"scheduler"` or the job name).
[[nodiscard]] std::string subject_name(const Subject& subject, const JobCatalog& catalog);

} // namespace coloc::core
