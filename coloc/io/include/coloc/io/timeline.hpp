#pragma once

/// @file timeline.hpp
/// @brief Reconstruction of core allocations from a recorded event stream.
///
/// Replays `job_start`, `cores_updated` and `job_end` records into the
/// intervals during which each subject held a given core set, checks that
/// every `cores_updated` record continues from the cores its subject held
/// before, and derives per-job execution spans.
///
/// @ingroup io_timeline

#include <coloc/io/event_writers.hpp>

#include <coloc/core/core_set.hpp>

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace coloc::io {

/// @brief A period during which one subject held one core set.
/// @ingroup io_timeline
struct AllocationInterval {
    std::string subject;
    core::CoreSet cores;
    double start{0.0};          ///< Seconds since the Unix epoch.
    std::optional<double> end;  ///< Unset while the allocation is still live.
};

/// @brief Start and end of one job, as recorded.
/// @ingroup io_timeline
struct JobSpan {
    std::string subject;
    double start{0.0};
    std::optional<double> end;
    std::string status;  ///< `job_end` status; empty while running.
};

/// @brief A record that does not continue from the reconstructed state.
/// @ingroup io_timeline
struct Discontinuity {
    std::size_t record_index{0};
    std::string subject;
    std::string reason;
};

/// @brief Reconstructed allocation history of a run.
/// @ingroup io_timeline
struct Timeline {
    std::vector<AllocationInterval> intervals;  ///< In order of their start.
    std::vector<JobSpan> jobs;                  ///< Batch jobs, in start order.
    std::vector<Discontinuity> discontinuities;

    [[nodiscard]] bool continuous() const noexcept { return discontinuities.empty(); }

    /// @brief First batch job start to last batch job end, in seconds.
    /// @return std::nullopt if no batch job has ended.
    [[nodiscard]] std::optional<double> total_elapsed() const;

    /// @brief Intervals of @p subject, in order.
    [[nodiscard]] std::vector<AllocationInterval> intervals_of(std::string_view subject) const;
};

/// @brief Replay @p records into a Timeline.
///
/// The subjects `service` and `scheduler` are not batch jobs: the service
/// gets allocation intervals but no JobSpan, and scheduler records are
/// ignored.
[[nodiscard]] Timeline build_timeline(const std::vector<EventRecord>& records);

/// @brief Load an event log written by JsonEventWriter.
///
/// Array values are read as core sets, non-negative integers as integers.
///
/// @throws LoaderError  If the file cannot be read or is not a JSON array of objects.
[[nodiscard]] std::vector<EventRecord> load_event_log(const std::filesystem::path& path);

/// @brief Load an event log from a JSON string.
/// @throws LoaderError  If the JSON is malformed.
[[nodiscard]] std::vector<EventRecord> load_event_log_from_string(std::string_view json);

} // namespace coloc::io
