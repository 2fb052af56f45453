#pragma once

/// @file event_writers.hpp
/// @brief Concrete EventWriter implementations for the controller's event stream.
///
/// Provides a no-op writer, a JSON array writer for the persisted event log,
/// an in-memory buffer for tests and offline analysis, the line format of
/// the scheduler log (also used for the console mirror), and a tee that
/// fans records out to several writers. make_event_writer() picks the
/// persisted log's writer from its format name.
///
/// @ingroup io_writers

#include <coloc/core/core_set.hpp>
#include <coloc/core/event_writer.hpp>
#include <coloc/core/types.hpp>

#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace coloc::io {

/// @brief Event writer that silently discards all records.
/// @ingroup io_writers
class NullEventWriter : public core::EventWriter {
public:
    void begin(core::TimePoint time) override;
    void kind(std::string_view name) override;
    void field(std::string_view key, double value) override;
    void field(std::string_view key, uint64_t value) override;
    void field(std::string_view key, std::string_view value) override;
    void field(std::string_view key, const core::CoreSet& value) override;
    void end() override;
    void close() override;
};

/// @brief Event writer that streams a JSON array, one object per record.
///
/// `time` is written in seconds since the Unix epoch and core sets as arrays
/// of integers. Every record is flushed as soon as it ends so that the log
/// survives a crash of the controller up to the last complete record.
///
/// Non-copyable and non-movable because it holds a reference to the
/// output stream.
///
/// @ingroup io_writers
/// @see load_event_log
class JsonEventWriter : public core::EventWriter {
public:
    /// @param output  Destination stream (must outlive this writer).
    explicit JsonEventWriter(std::ostream& output);

    /// @brief Destructor; closes the array if close() was not called.
    ~JsonEventWriter() override;

    JsonEventWriter(const JsonEventWriter&) = delete;
    JsonEventWriter& operator=(const JsonEventWriter&) = delete;
    JsonEventWriter(JsonEventWriter&&) = delete;
    JsonEventWriter& operator=(JsonEventWriter&&) = delete;

    void begin(core::TimePoint time) override;
    void kind(std::string_view name) override;
    void field(std::string_view key, double value) override;
    void field(std::string_view key, uint64_t value) override;
    void field(std::string_view key, std::string_view value) override;
    void field(std::string_view key, const core::CoreSet& value) override;
    void end() override;

    /// @brief Write the closing bracket and flush. Later calls do nothing.
    void close() override;

    /// @brief Escape @p str for use inside a JSON string literal.
    static std::string escape_json_string(std::string_view str);

private:
    void write_key(std::string_view key);

    std::ostream& output_;  // NOLINT(cppcoreguidelines-avoid-const-or-ref-data-members)
    bool first_record_{true};
    bool closed_{false};
};

/// @brief Value of one event field.
using FieldValue = std::variant<double, uint64_t, std::string, core::CoreSet>;

/// @brief A single event record stored in memory.
///
/// @ingroup io_writers
/// @see MemoryEventWriter, build_timeline
struct EventRecord {
    double time{0.0};  ///< Seconds since the Unix epoch.
    std::string kind;  ///< `job_start`, `cores_updated`, ...
    std::map<std::string, FieldValue> fields;

    /// @brief String field @p key, or std::nullopt if absent or of another type.
    [[nodiscard]] std::optional<std::string> text(const std::string& key) const;

    /// @brief Integer field @p key, or std::nullopt if absent or of another type.
    [[nodiscard]] std::optional<uint64_t> integer(const std::string& key) const;

    /// @brief Numeric field @p key (integer or floating point).
    [[nodiscard]] std::optional<double> number(const std::string& key) const;

    /// @brief Core-list field @p key, or std::nullopt if absent or of another type.
    [[nodiscard]] std::optional<core::CoreSet> cores(const std::string& key) const;
};

/// @brief Event writer that buffers every record in memory.
///
/// @ingroup io_writers
/// @see EventRecord
class MemoryEventWriter : public core::EventWriter {
public:
    void begin(core::TimePoint time) override;
    void kind(std::string_view name) override;
    void field(std::string_view key, double value) override;
    void field(std::string_view key, uint64_t value) override;
    void field(std::string_view key, std::string_view value) override;
    void field(std::string_view key, const core::CoreSet& value) override;
    void end() override;
    void close() override { ++close_count_; }

    [[nodiscard]] const std::vector<EventRecord>& records() const { return records_; }

    /// @brief How many times close() was called.
    [[nodiscard]] int close_count() const noexcept { return close_count_; }

    void clear() { records_.clear(); }

private:
    std::vector<EventRecord> records_;
    EventRecord current_;
    int close_count_{0};
};

/// @brief Format @p time as UTC ISO-8601 with microseconds (`2025-05-14T10:29:28.123456`).
[[nodiscard]] std::string format_iso8601(core::TimePoint time);

/// @brief Event writer producing the line format of the scheduler log.
///
/// One line per record: `<time> <event> <subject> [<args>]`, where the
/// record kinds map to the events `start`, `end`, `update_cores`, `pause`,
/// `unpause` and `custom`. For example:
///
///     2025-05-14T10:29:28.123456 start blackscholes [1,2,3] 3
///     2025-05-14T10:29:29.000000 update_cores service [0,1]
///     2025-05-14T10:29:31.500000 custom scheduler state solo_core -> colocated at 93.0%
///
/// With colour enabled, warning and error notes are highlighted with ANSI
/// escapes.
///
/// Non-copyable and non-movable because it holds a reference to the
/// output stream.
///
/// @ingroup io_writers
class SchedulerLogWriter : public core::EventWriter {
public:
    /// @param output         Destination stream (must outlive this writer).
    /// @param color_enabled  If true, emit ANSI escape codes for warnings and errors.
    explicit SchedulerLogWriter(std::ostream& output, bool color_enabled = false);

    SchedulerLogWriter(const SchedulerLogWriter&) = delete;
    SchedulerLogWriter& operator=(const SchedulerLogWriter&) = delete;
    SchedulerLogWriter(SchedulerLogWriter&&) = delete;
    SchedulerLogWriter& operator=(SchedulerLogWriter&&) = delete;

    void begin(core::TimePoint time) override;
    void kind(std::string_view name) override;
    void field(std::string_view key, double value) override;
    void field(std::string_view key, uint64_t value) override;
    void field(std::string_view key, std::string_view value) override;
    void field(std::string_view key, const core::CoreSet& value) override;
    void end() override;
    void close() override;

private:
    [[nodiscard]] std::string value_of(const std::string& key) const;

    std::ostream& output_;  // NOLINT(cppcoreguidelines-avoid-const-or-ref-data-members)
    bool color_enabled_;
    core::TimePoint current_time_;
    std::string current_kind_;
    std::map<std::string, std::string> current_fields_;
};

/// @brief Event writer that forwards every call to several writers, in order.
///
/// The tee does not own its sinks.
///
/// @ingroup io_writers
class TeeEventWriter : public core::EventWriter {
public:
    explicit TeeEventWriter(std::vector<core::EventWriter*> sinks);

    void begin(core::TimePoint time) override;
    void kind(std::string_view name) override;
    void field(std::string_view key, double value) override;
    void field(std::string_view key, uint64_t value) override;
    void field(std::string_view key, std::string_view value) override;
    void field(std::string_view key, const core::CoreSet& value) override;
    void end() override;
    void close() override;

private:
    std::vector<core::EventWriter*> sinks_;
};

// =============================================================================
// Format selection
// =============================================================================

/// @brief On-disk format of the persisted event log.
/// @ingroup io_writers
enum class EventFormat : uint8_t {
    Json,  ///< JsonEventWriter, readable by load_event_log().
    Log,   ///< SchedulerLogWriter lines.
    Null   ///< NullEventWriter; nothing is written.
};

/// @brief Parse `"json"`, `"log"` or `"null"`.
/// @return The format, or std::nullopt for any other name.
[[nodiscard]] std::optional<EventFormat> parse_event_format(std::string_view name) noexcept;

/// @brief Writer producing @p format on @p output.
///
/// @p output must outlive the writer. A Null writer never touches it.
[[nodiscard]] std::unique_ptr<core::EventWriter> make_event_writer(EventFormat format,
                                                                   std::ostream& output);

} // namespace coloc::io
