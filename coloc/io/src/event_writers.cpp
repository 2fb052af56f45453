#include <coloc/io/event_writers.hpp>

#include <ctime>
#include <iomanip>
#include <sstream>
#include <utility>

namespace coloc::io {

namespace {

std::string format_number(double value) {
    std::ostringstream oss;
    oss << std::setprecision(15) << value;
    return oss.str();
}

std::string format_cores_list(const core::CoreSet& cores) {
    return cores.to_string();
}

constexpr const char* kYellow = "\033[33m";
constexpr const char* kRed = "\033[31m";
constexpr const char* kReset = "\033[0m";

} // anonymous namespace

// =============================================================================
// NullEventWriter
// =============================================================================

void NullEventWriter::begin(core::TimePoint /*time*/) {}
void NullEventWriter::kind(std::string_view /*name*/) {}
void NullEventWriter::field(std::string_view /*key*/, double /*value*/) {}
void NullEventWriter::field(std::string_view /*key*/, uint64_t /*value*/) {}
void NullEventWriter::field(std::string_view /*key*/, std::string_view /*value*/) {}
void NullEventWriter::field(std::string_view /*key*/, const core::CoreSet& /*value*/) {}
void NullEventWriter::end() {}
void NullEventWriter::close() {}

// =============================================================================
// JsonEventWriter
// =============================================================================

JsonEventWriter::JsonEventWriter(std::ostream& output)
    : output_(output) {
    output_ << "[\n";
}

JsonEventWriter::~JsonEventWriter() {
    close();
}

void JsonEventWriter::begin(core::TimePoint time) {
    if (!first_record_) {
        output_ << ",\n";
    }
    first_record_ = false;
    output_ << "  {\"time\": " << std::fixed << std::setprecision(6)
            << core::time_to_seconds(time) << std::defaultfloat;
}

void JsonEventWriter::kind(std::string_view name) {
    output_ << ", \"kind\": \"" << escape_json_string(name) << "\"";
}

void JsonEventWriter::write_key(std::string_view key) {
    output_ << ", \"" << escape_json_string(key) << "\": ";
}

std::string JsonEventWriter::escape_json_string(std::string_view str) {
    std::ostringstream oss;
    for (char c : str) {
        switch (c) {
            case '"':  oss << "\\\""; break;
            case '\\': oss << "\\\\"; break;
            case '\b': oss << "\\b"; break;
            case '\f': oss << "\\f"; break;
            case '\n': oss << "\\n"; break;
            case '\r': oss << "\\r"; break;
            case '\t': oss << "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    oss << "\\u" << std::hex << std::setfill('0')
                        << std::setw(4) << static_cast<int>(c);
                } else {
                    oss << c;
                }
        }
    }
    return oss.str();
}

void JsonEventWriter::field(std::string_view key, double value) {
    write_key(key);
    output_ << format_number(value);
}

void JsonEventWriter::field(std::string_view key, uint64_t value) {
    write_key(key);
    output_ << value;
}

void JsonEventWriter::field(std::string_view key, std::string_view value) {
    write_key(key);
    output_ << "\"" << escape_json_string(value) << "\"";
}

void JsonEventWriter::field(std::string_view key, const core::CoreSet& value) {
    write_key(key);
    output_ << format_cores_list(value);
}

void JsonEventWriter::end() {
    output_ << "}";
    output_.flush();
}

void JsonEventWriter::close() {
    if (closed_) {
        return;
    }
    if (!first_record_) {
        output_ << "\n";
    }
    output_ << "]\n";
    output_.flush();
    closed_ = true;
}

// =============================================================================
// EventRecord / MemoryEventWriter
// =============================================================================

std::optional<std::string> EventRecord::text(const std::string& key) const {
    auto iter = fields.find(key);
    if (iter == fields.end() || !std::holds_alternative<std::string>(iter->second)) {
        return std::nullopt;
    }
    return std::get<std::string>(iter->second);
}

std::optional<uint64_t> EventRecord::integer(const std::string& key) const {
    auto iter = fields.find(key);
    if (iter == fields.end() || !std::holds_alternative<uint64_t>(iter->second)) {
        return std::nullopt;
    }
    return std::get<uint64_t>(iter->second);
}

std::optional<double> EventRecord::number(const std::string& key) const {
    auto iter = fields.find(key);
    if (iter == fields.end()) {
        return std::nullopt;
    }
    if (const auto* real = std::get_if<double>(&iter->second)) {
        return *real;
    }
    if (const auto* whole = std::get_if<uint64_t>(&iter->second)) {
        return static_cast<double>(*whole);
    }
    return std::nullopt;
}

std::optional<core::CoreSet> EventRecord::cores(const std::string& key) const {
    auto iter = fields.find(key);
    if (iter == fields.end() || !std::holds_alternative<core::CoreSet>(iter->second)) {
        return std::nullopt;
    }
    return std::get<core::CoreSet>(iter->second);
}

void MemoryEventWriter::begin(core::TimePoint time) {
    current_ = EventRecord{};
    current_.time = core::time_to_seconds(time);
}

void MemoryEventWriter::kind(std::string_view name) {
    current_.kind = std::string(name);
}

void MemoryEventWriter::field(std::string_view key, double value) {
    current_.fields[std::string(key)] = value;
}

void MemoryEventWriter::field(std::string_view key, uint64_t value) {
    current_.fields[std::string(key)] = value;
}

void MemoryEventWriter::field(std::string_view key, std::string_view value) {
    current_.fields[std::string(key)] = std::string(value);
}

void MemoryEventWriter::field(std::string_view key, const core::CoreSet& value) {
    current_.fields[std::string(key)] = value;
}

void MemoryEventWriter::end() {
    records_.push_back(std::move(current_));
    current_ = EventRecord{};
}

// =============================================================================
// SchedulerLogWriter
// =============================================================================

std::string format_iso8601(core::TimePoint time) {
    const auto ns = time.time_since_epoch().nanoseconds();
    auto seconds = static_cast<std::time_t>(ns / 1'000'000'000);
    auto micros = (ns % 1'000'000'000) / 1'000;
    if (micros < 0) {
        --seconds;
        micros += 1'000'000;
    }

    std::tm utc{};
    gmtime_r(&seconds, &utc);
    std::ostringstream oss;
    oss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(6) << std::setfill('0')
        << micros;
    return oss.str();
}

SchedulerLogWriter::SchedulerLogWriter(std::ostream& output, bool color_enabled)
    : output_(output)
    , color_enabled_(color_enabled) {}

void SchedulerLogWriter::begin(core::TimePoint time) {
    current_time_ = time;
    current_kind_.clear();
    current_fields_.clear();
}

void SchedulerLogWriter::kind(std::string_view name) {
    current_kind_ = std::string(name);
}

void SchedulerLogWriter::field(std::string_view key, double value) {
    current_fields_[std::string(key)] = format_number(value);
}

void SchedulerLogWriter::field(std::string_view key, uint64_t value) {
    current_fields_[std::string(key)] = std::to_string(value);
}

void SchedulerLogWriter::field(std::string_view key, std::string_view value) {
    current_fields_[std::string(key)] = std::string(value);
}

void SchedulerLogWriter::field(std::string_view key, const core::CoreSet& value) {
    current_fields_[std::string(key)] = format_cores_list(value);
}

std::string SchedulerLogWriter::value_of(const std::string& key) const {
    auto iter = current_fields_.find(key);
    return iter == current_fields_.end() ? std::string{} : iter->second;
}

void SchedulerLogWriter::end() {
    // Format: <iso time> <event> <subject> [args]
    std::string event = current_kind_;
    std::string args;
    const char* color = nullptr;

    if (current_kind_ == "job_start") {
        event = "start";
        args = value_of("cores") + " " + value_of("threads");
    } else if (current_kind_ == "job_end") {
        event = "end";
        args = value_of("status");
    } else if (current_kind_ == "cores_updated") {
        event = "update_cores";
        args = value_of("cores");
    } else if (current_kind_ == "job_pause") {
        event = "pause";
    } else if (current_kind_ == "job_resume") {
        event = "unpause";
    } else if (current_kind_ == "custom_note") {
        event = "custom";
        args = value_of("note");
        auto level = value_of("level");
        if (level == "warning") {
            color = kYellow;
        } else if (level == "error") {
            color = kRed;
        }
    }

    if (color_enabled_ && color != nullptr) {
        output_ << color;
    }
    output_ << format_iso8601(current_time_) << " " << event << " " << value_of("subject");
    if (!args.empty()) {
        output_ << " " << args;
    }
    if (color_enabled_ && color != nullptr) {
        output_ << kReset;
    }
    output_ << "\n";
}

void SchedulerLogWriter::close() {
    output_.flush();
}

// =============================================================================
// TeeEventWriter
// =============================================================================

TeeEventWriter::TeeEventWriter(std::vector<core::EventWriter*> sinks)
    : sinks_(std::move(sinks)) {}

void TeeEventWriter::begin(core::TimePoint time) {
    for (auto* sink : sinks_) {
        sink->begin(time);
    }
}

void TeeEventWriter::kind(std::string_view name) {
    for (auto* sink : sinks_) {
        sink->kind(name);
    }
}

void TeeEventWriter::field(std::string_view key, double value) {
    for (auto* sink : sinks_) {
        sink->field(key, value);
    }
}

void TeeEventWriter::field(std::string_view key, uint64_t value) {
    for (auto* sink : sinks_) {
        sink->field(key, value);
    }
}

void TeeEventWriter::field(std::string_view key, std::string_view value) {
    for (auto* sink : sinks_) {
        sink->field(key, value);
    }
}

void TeeEventWriter::field(std::string_view key, const core::CoreSet& value) {
    for (auto* sink : sinks_) {
        sink->field(key, value);
    }
}

void TeeEventWriter::end() {
    for (auto* sink : sinks_) {
        sink->end();
    }
}

void TeeEventWriter::close() {
    for (auto* sink : sinks_) {
        sink->close();
    }
}

// =============================================================================
// Format selection
// =============================================================================

std::optional<EventFormat> parse_event_format(std::string_view name) noexcept {
    if (name == "json") {
        return EventFormat::Json;
    }
    if (name == "log") {
        return EventFormat::Log;
    }
    if (name == "null") {
        return EventFormat::Null;
    }
    return std::nullopt;
}

std::unique_ptr<core::EventWriter> make_event_writer(EventFormat format, std::ostream& output) {
    switch (format) {
        case EventFormat::Json: return std::make_unique<JsonEventWriter>(output);
        case EventFormat::Log:  return std::make_unique<SchedulerLogWriter>(output);
        case EventFormat::Null: return std::make_unique<NullEventWriter>();
    }
    return std::make_unique<NullEventWriter>();
}

} // namespace coloc::io
