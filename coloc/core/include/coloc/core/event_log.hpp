#pragma once

#include <coloc/core/clock.hpp>
#include <coloc/core/core_set.hpp>
#include <coloc/core/event_writer.hpp>
#include <coloc/core/job.hpp>

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace coloc::core {

/// @brief Severity attached to free-text notes.
enum class NoteLevel : uint8_t { Info, Warning, Error };

/// @brief Typed, ordered front end of the controller's event stream.
/// @ingroup core
///
/// EventLog turns controller actions into EventWriter records, stamping each
/// with the clock's time and the current tick number. It remembers the last
/// core set recorded for every subject so that each `cores_updated` record
/// carries the `old_cores` it replaces; replaying the stream therefore yields
/// a gap-free allocation timeline.
///
/// The log does not own the writer or the clock.
///
/// @see EventWriter
class EventLog {
public:
    EventLog(EventWriter& writer, const Clock& clock, const JobCatalog& catalog);

    EventLog(const EventLog&) = delete;
    EventLog& operator=(const EventLog&) = delete;
    EventLog(EventLog&&) = delete;
    EventLog& operator=(EventLog&&) = delete;

    /// @brief Set the tick number stamped on subsequent records.
    void set_tick(uint64_t tick) noexcept { tick_ = tick; }

    /// @brief Record that a subject started on @p cores with @p threads.
    void job_start(const Subject& subject, const CoreSet& cores, uint32_t threads);

    /// @brief Record that a subject ended.
    /// @param status `"completed"`, `"failed"` or `"stopped"`.
    void job_end(const Subject& subject, std::string_view status);

    /// @brief Record a core reassignment.
    /// @param utilization Home-core utilization that triggered it, if any.
    void cores_updated(const Subject& subject, const CoreSet& cores,
                       std::optional<double> utilization = std::nullopt);

    void job_pause(const Subject& subject);
    void job_resume(const Subject& subject);

    /// @brief Record a free-text note.
    void note(const Subject& subject, std::string_view text, NoteLevel level = NoteLevel::Info);

    /// @brief Close the underlying writer.
    ///
    /// Safe to call more than once; only the first call reaches the writer.
    void close();

    [[nodiscard]] bool closed() const noexcept { return closed_; }

    /// @brief Number of records written so far.
    [[nodiscard]] uint64_t record_count() const noexcept { return records_; }

    /// @brief Core set most recently recorded for @p subject, if it is live.
    [[nodiscard]] std::optional<CoreSet> recorded_cores(const Subject& subject) const;

private:
    void open_record(std::string_view kind, const std::string& subject);
    void close_record();

    EventWriter& writer_;      // NOLINT(cppcoreguidelines-avoid-const-or-ref-data-members)
    const Clock& clock_;       // NOLINT(cppcoreguidelines-avoid-const-or-ref-data-members)
    const JobCatalog& catalog_; // NOLINT(cppcoreguidelines-avoid-const-or-ref-data-members)
    std::map<std::string, CoreSet> live_cores_;
    uint64_t tick_{0};
    uint64_t records_{0};
    bool closed_{false};
};

} // namespace coloc::core
