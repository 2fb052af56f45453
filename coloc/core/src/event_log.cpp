#include <coloc/core/event_log.hpp>
#include <coloc/core/error.hpp>

namespace coloc::core {

namespace {

std::string_view level_name(NoteLevel level) {
    switch (level) {
        case NoteLevel::Info:    return "info";
        case NoteLevel::Warning: return "warning";
        case NoteLevel::Error:   return "error";
    }
    return "info";
}

} // anonymous namespace

EventLog::EventLog(EventWriter& writer, const Clock& clock, const JobCatalog& catalog)
    : writer_(writer)
    , clock_(clock)
    , catalog_(catalog) {}

void EventLog::open_record(std::string_view kind, const std::string& subject) {
    if (closed_) {
        throw InvalidStateError("event log is closed; cannot record '" + std::string(kind) + "'");
    }
    writer_.begin(clock_.now());
    writer_.kind(kind);
    writer_.field("tick", tick_);
    writer_.field("subject", std::string_view{subject});
}

void EventLog::close_record() {
    writer_.end();
    ++records_;
}

void EventLog::job_start(const Subject& subject, const CoreSet& cores, uint32_t threads) {
    auto name = subject_name(subject, catalog_);
    open_record("job_start", name);
    writer_.field("cores", cores);
    writer_.field("threads", uint64_t{threads});
    close_record();
    live_cores_[name] = cores;
}

void EventLog::job_end(const Subject& subject, std::string_view status) {
    auto name = subject_name(subject, catalog_);
    open_record("job_end", name);
    writer_.field("status", status);
    close_record();
    live_cores_.erase(name);
}

void EventLog::cores_updated(const Subject& subject, const CoreSet& cores,
                             std::optional<double> utilization) {
    auto name = subject_name(subject, catalog_);
    auto iter = live_cores_.find(name);
    CoreSet old_cores = iter != live_cores_.end() ? iter->second : CoreSet{};

    open_record("cores_updated", name);
    writer_.field("cores", cores);
    writer_.field("old_cores", old_cores);
    if (utilization) {
        writer_.field("utilization", *utilization);
    }
    close_record();
    live_cores_[name] = cores;
}

void EventLog::job_pause(const Subject& subject) {
    open_record("job_pause", subject_name(subject, catalog_));
    close_record();
}

void EventLog::job_resume(const Subject& subject) {
    open_record("job_resume", subject_name(subject, catalog_));
    close_record();
}

void EventLog::note(const Subject& subject, std::string_view text, NoteLevel level) {
    open_record("custom_note", subject_name(subject, catalog_));
    writer_.field("note", text);
    if (level != NoteLevel::Info) {
        writer_.field("level", level_name(level));
    }
    close_record();
}

void EventLog::close() {
    if (closed_) {
        return;
    }
    closed_ = true;
    writer_.close();
}

std::optional<CoreSet> EventLog::recorded_cores(const Subject& subject) const {
    auto iter = live_cores_.find(subject_name(subject, catalog_));
    if (iter == live_cores_.end()) {
        return std::nullopt;
    }
    return iter->second;
}

} // namespace coloc::core
