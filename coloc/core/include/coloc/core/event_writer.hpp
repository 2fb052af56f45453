#pragma once

#include <coloc/core/core_set.hpp>
#include <coloc/core/types.hpp>

#include <cstdint>
#include <string_view>

namespace coloc::core {

/// @brief Abstract sink for controller events.
/// @ingroup core
///
/// Implementations of EventWriter serialise events to a specific format
/// (JSON array, scheduler log lines, memory buffer, etc.).
/// Each record is built incrementally:
///   1. begin() -- opens a new record at a given wall-clock time
///   2. kind()  -- sets the event kind (e.g. `"job_start"`)
///   3. field() -- (repeated) adds key/value data fields
///   4. end()   -- closes and optionally flushes the record
///
/// Records must be persisted in the order end() is called; the offline
/// consumers of the stream rely on that order.
///
/// @see EventLog
class EventWriter {
public:
    /// @brief Virtual destructor for safe polymorphic deletion.
    virtual ~EventWriter() = default;

    /// @brief Begin a new record at the given time.
    /// @param time Wall-clock time at which the event occurs.
    virtual void begin(TimePoint time) = 0;

    /// @brief Set the event kind for the current record.
    /// @param name One of `job_start`, `job_end`, `cores_updated`,
    ///        `job_pause`, `job_resume`, `custom_note`.
    virtual void kind(std::string_view name) = 0;

    /// @brief Add a floating-point field to the current record.
    virtual void field(std::string_view key, double value) = 0;

    /// @brief Add an unsigned integer field to the current record.
    virtual void field(std::string_view key, uint64_t value) = 0;

    /// @brief Add a string field to the current record.
    virtual void field(std::string_view key, std::string_view value) = 0;

    /// @brief Add a core-list field to the current record.
    virtual void field(std::string_view key, const CoreSet& value) = 0;

    /// @brief End the current record.
    virtual void end() = 0;

    /// @brief Flush buffered output and release the sink.
    ///
    /// Called exactly once by EventLog::close(). No record may be written
    /// afterwards.
    virtual void close() = 0;

protected:
    EventWriter() = default;
    EventWriter(const EventWriter&) = default;
    EventWriter& operator=(const EventWriter&) = default;
    EventWriter(EventWriter&&) = default;
    EventWriter& operator=(EventWriter&&) = default;
};

} // namespace coloc::core
