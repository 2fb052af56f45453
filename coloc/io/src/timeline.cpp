#include <coloc/io/timeline.hpp>
#include <coloc/io/error.hpp>

#include <rapidjson/document.h>
#include <rapidjson/error/en.h>

#include <algorithm>
#include <fstream>
#include <iterator>
#include <map>
#include <set>
#include <sstream>
#include <utility>

namespace coloc::io {

namespace {

constexpr std::string_view kService = "service";
constexpr std::string_view kScheduler = "scheduler";

class Replay {
public:
    explicit Replay(Timeline& timeline)
        : timeline_(timeline) {}

    void apply(std::size_t index, const EventRecord& record) {
        auto subject = record.text("subject").value_or("");
        if (subject.empty() || subject == kScheduler) {
            return;
        }
        if (record.kind == "job_start") {
            start(index, subject, record);
        } else if (record.kind == "cores_updated") {
            update(index, subject, record);
        } else if (record.kind == "job_end") {
            finish(index, subject, record);
        }
    }

private:
    void start(std::size_t index, const std::string& subject, const EventRecord& record) {
        if (live_.count(subject) != 0) {
            flag(index, subject, "started while already holding cores");
            close(subject, record.time);
        }
        open(subject, record.cores("cores").value_or(core::CoreSet{}), record.time);
        started_.insert(subject);
        if (subject != kService) {
            spans_[subject] = timeline_.jobs.size();
            timeline_.jobs.push_back(JobSpan{subject, record.time, std::nullopt, ""});
        }
    }

    void update(std::size_t index, const std::string& subject, const EventRecord& record) {
        auto held = current(subject);
        auto old_cores = record.cores("old_cores");
        if (!old_cores) {
            flag(index, subject, "cores_updated without old_cores");
        } else if (*old_cores != held) {
            flag(index, subject,
                 "old_cores " + old_cores->to_string() + " but held " + held.to_string());
        }
        close(subject, record.time);
        open(subject, record.cores("cores").value_or(core::CoreSet{}), record.time);
    }

    void finish(std::size_t index, const std::string& subject, const EventRecord& record) {
        // A job that never launched ends as failed without having held cores.
        const bool never_started =
            started_.count(subject) == 0 && record.text("status").value_or("") == "failed";
        if (live_.count(subject) == 0 && !never_started) {
            flag(index, subject, "ended while holding no cores");
        }
        close(subject, record.time);
        auto span = spans_.find(subject);
        if (span != spans_.end()) {
            auto& job = timeline_.jobs[span->second];
            job.end = record.time;
            job.status = record.text("status").value_or("");
            spans_.erase(span);
        }
    }

    [[nodiscard]] core::CoreSet current(const std::string& subject) const {
        auto iter = live_.find(subject);
        if (iter == live_.end()) {
            return {};
        }
        return timeline_.intervals[iter->second].cores;
    }

    void open(const std::string& subject, core::CoreSet cores, double time) {
        live_[subject] = timeline_.intervals.size();
        timeline_.intervals.push_back(AllocationInterval{subject, std::move(cores), time, std::nullopt});
    }

    void close(const std::string& subject, double time) {
        auto iter = live_.find(subject);
        if (iter == live_.end()) {
            return;
        }
        timeline_.intervals[iter->second].end = time;
        live_.erase(iter);
    }

    void flag(std::size_t index, const std::string& subject, std::string reason) {
        timeline_.discontinuities.push_back(Discontinuity{index, subject, std::move(reason)});
    }

    Timeline& timeline_;  // NOLINT(cppcoreguidelines-avoid-const-or-ref-data-members)
    std::map<std::string, std::size_t> live_;
    std::map<std::string, std::size_t> spans_;
    std::set<std::string> started_;
};

} // anonymous namespace

std::optional<double> Timeline::total_elapsed() const {
    std::optional<double> first_start;
    std::optional<double> last_end;
    for (const auto& job : jobs) {
        first_start = first_start ? std::min(*first_start, job.start) : job.start;
        if (job.end) {
            last_end = last_end ? std::max(*last_end, *job.end) : *job.end;
        }
    }
    if (!first_start || !last_end) {
        return std::nullopt;
    }
    return *last_end - *first_start;
}

std::vector<AllocationInterval> Timeline::intervals_of(std::string_view subject) const {
    std::vector<AllocationInterval> out;
    std::copy_if(intervals.begin(), intervals.end(), std::back_inserter(out),
                 [subject](const AllocationInterval& interval) {
                     return interval.subject == subject;
                 });
    return out;
}

Timeline build_timeline(const std::vector<EventRecord>& records) {
    Timeline timeline;
    Replay replay(timeline);
    for (std::size_t idx = 0; idx < records.size(); ++idx) {
        replay.apply(idx, records[idx]);
    }
    return timeline;
}

// =============================================================================
// JSON event log loading
// =============================================================================

std::vector<EventRecord> load_event_log(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file) {
        throw LoaderError("cannot open file", path.string());
    }

    std::ostringstream oss;
    oss << file.rdbuf();
    return load_event_log_from_string(oss.str());
}

std::vector<EventRecord> load_event_log_from_string(std::string_view json) {
    rapidjson::Document doc;
    doc.Parse(json.data(), json.size());

    if (doc.HasParseError()) {
        throw LoaderError(
            std::string("JSON parse error: ") + rapidjson::GetParseError_En(doc.GetParseError()),
            "at offset " + std::to_string(doc.GetErrorOffset()));
    }

    if (!doc.IsArray()) {
        throw LoaderError("event log must be a JSON array", "event log");
    }

    std::vector<EventRecord> records;
    records.reserve(doc.Size());

    for (rapidjson::SizeType idx = 0; idx < doc.Size(); ++idx) {
        const auto& obj = doc[idx];
        if (!obj.IsObject()) {
            throw LoaderError("record must be an object", "event log[" + std::to_string(idx) + "]");
        }
        EventRecord record;

        if (obj.HasMember("time") && obj["time"].IsNumber()) {
            record.time = obj["time"].GetDouble();
        }
        if (obj.HasMember("kind") && obj["kind"].IsString()) {
            record.kind = obj["kind"].GetString();
        }

        for (auto iter = obj.MemberBegin(); iter != obj.MemberEnd(); ++iter) {
            std::string key = iter->name.GetString();
            if (key == "time" || key == "kind") {
                continue;
            }
            const auto& value = iter->value;
            if (value.IsUint64()) {
                record.fields[key] = value.GetUint64();
            } else if (value.IsNumber()) {
                record.fields[key] = value.GetDouble();
            } else if (value.IsString()) {
                record.fields[key] = std::string(value.GetString());
            } else if (value.IsArray()) {
                std::vector<core::CoreId> cores;
                for (rapidjson::SizeType c = 0; c < value.Size(); ++c) {
                    if (!value[c].IsUint()) {
                        throw LoaderError("core lists must hold non-negative integers",
                                          "event log[" + std::to_string(idx) + "]." + key);
                    }
                    cores.push_back(value[c].GetUint());
                }
                record.fields[key] = core::CoreSet{std::move(cores)};
            }
        }

        records.push_back(std::move(record));
    }

    return records;
}

} // namespace coloc::io
