#pragma once

// Scripted collaborators for driving the controller deterministically.

#include <coloc/core/affinity_controller.hpp>
#include <coloc/core/clock.hpp>
#include <coloc/core/event_writer.hpp>
#include <coloc/core/job_runner.hpp>
#include <coloc/core/usage_monitor.hpp>

#include <deque>
#include <functional>
#include <initializer_list>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace coloc::test {

using namespace coloc::core;

// ============================================================================
// Clock
// ============================================================================

class ManualClock : public Clock {
public:
    explicit ManualClock(TimePoint start = time_from_seconds(1000.0))
        : now_(start)
        , monotonic_(start) {}

    [[nodiscard]] TimePoint now() const override { return now_; }
    [[nodiscard]] TimePoint monotonic_now() const override { return monotonic_; }

    void sleep_for(Duration duration) override {
        advance(duration);
        slept_ += duration;
        if (on_sleep) {
            on_sleep();
        }
    }

    void advance(Duration duration) {
        now_ += duration;
        monotonic_ += duration;
    }

    /// Step the wall clock only, as an NTP correction or a manual `date` would.
    void step_wall_clock(Duration offset) { now_ += offset; }

    [[nodiscard]] Duration slept() const { return slept_; }

    std::function<void()> on_sleep;

private:
    TimePoint now_;
    TimePoint monotonic_;
    Duration slept_{};
};

// ============================================================================
// Usage monitor
// ============================================================================

class ScriptedMonitor : public UsageMonitor {
public:
    explicit ScriptedMonitor(uint32_t cores, double fallback = 70.0)
        : cores_(cores)
        , fallback_(fallback) {}

    /// Queue a sample whose core 0 reads @p usage.
    void push_home(double usage) {
        UtilizationSample sample(cores_, 50.0);
        sample[0] = usage;
        script_.emplace_back(std::move(sample));
    }

    void push_home(std::initializer_list<double> usages) {
        for (double usage : usages) {
            push_home(usage);
        }
    }

    void push(UtilizationSample sample) { script_.emplace_back(std::move(sample)); }

    void push_failure(ErrorKind kind) { script_.emplace_back(Error{kind, "scripted failure"}); }

    void throw_next() { throw_next_ = true; }

    void set_fallback(double usage) { fallback_ = usage; }

    Result<UtilizationSample> sample() override {
        ++calls_;
        if (throw_next_) {
            throw_next_ = false;
            throw std::runtime_error("monitor exploded");
        }
        if (script_.empty()) {
            UtilizationSample sample(cores_, 50.0);
            sample[0] = fallback_;
            return sample;
        }
        auto next = std::move(script_.front());
        script_.pop_front();
        return next;
    }

    [[nodiscard]] uint32_t core_count() const override { return cores_; }
    [[nodiscard]] int calls() const { return calls_; }

private:
    uint32_t cores_;
    double fallback_;
    std::deque<Result<UtilizationSample>> script_;
    bool throw_next_{false};
    int calls_{0};
};

// ============================================================================
// Affinity controller
// ============================================================================

class FakeAffinityController : public AffinityController {
public:
    explicit FakeAffinityController(std::string process, uint32_t threads = 4)
        : process_(std::move(process))
        , threads_(threads) {}

    void set_present(bool present) { present_ = present; }
    void fail_next(ErrorKind kind) { failures_.push_back(Error{kind, "scripted failure"}); }

    Result<CoreSet> get_affinity(const std::string& target) override {
        if (!present_ || target != process_) {
            return Error{ErrorKind::NotFound, "no process named " + target};
        }
        return cores_;
    }

    Status set_affinity(const std::string& target, const CoreSet& cores) override {
        ++set_calls_;
        if (!present_ || target != process_) {
            return Error{ErrorKind::NotFound, "no process named " + target};
        }
        if (!failures_.empty()) {
            auto error = failures_.front();
            failures_.pop_front();
            return error;
        }
        cores_ = cores;
        return {};
    }

    Result<uint32_t> thread_count(const std::string& target) override {
        if (!present_ || target != process_) {
            return Error{ErrorKind::NotFound, "no process named " + target};
        }
        return threads_;
    }

    [[nodiscard]] const CoreSet& cores() const { return cores_; }
    [[nodiscard]] int set_calls() const { return set_calls_; }

private:
    std::string process_;
    uint32_t threads_;
    CoreSet cores_;
    bool present_{true};
    std::deque<Error> failures_;
    int set_calls_{0};
};

// ============================================================================
// Job runner
// ============================================================================

class FakeJobRunner : public JobRunner {
public:
    struct Launch {
        std::string name;
        CoreSet cores;
        uint32_t threads{0};
        RunStatus status{RunStatus::Running};
        TimePoint started;
        std::optional<Duration> duration;
        RunStatus final_status{RunStatus::Completed};
        int reassignments{0};
        int stops{0};
        bool released{false};
    };

    explicit FakeJobRunner(const Clock& clock)
        : clock_(clock) {}

    /// Jobs named @p name finish by themselves @p duration after they start.
    void complete_after(const std::string& name, Duration duration,
                        RunStatus final_status = RunStatus::Completed) {
        durations_[name] = {duration, final_status};
    }

    void fail_next_start(ErrorKind kind) { start_failures_.push_back(Error{kind, "scripted failure"}); }
    /// Every launch of @p name fails with @p kind.
    void fail_starts_of(const std::string& name, ErrorKind kind) {
        broken_[name] = Error{kind, "scripted failure of " + name};
    }
    void fail_next_reassign(ErrorKind kind) { reassign_failures_.push_back(Error{kind, "scripted failure"}); }
    void fail_stops(bool fail) { fail_stops_ = fail; }

    /// Mark the latest launch of @p name as finished.
    void finish(const std::string& name, RunStatus status = RunStatus::Completed) {
        launch_of(name).status = status;
    }

    Result<JobHandle> start(const JobSpec& spec, const CoreSet& cores, uint32_t threads) override {
        ++start_calls_;
        if (!start_failures_.empty()) {
            auto error = start_failures_.front();
            start_failures_.pop_front();
            return error;
        }
        if (auto broken = broken_.find(spec.name); broken != broken_.end()) {
            return broken->second;
        }
        Launch launch;
        launch.name = spec.name;
        launch.cores = cores;
        launch.threads = threads;
        launch.started = clock_.now();
        auto iter = durations_.find(spec.name);
        if (iter != durations_.end()) {
            launch.duration = iter->second.first;
            launch.final_status = iter->second.second;
        }
        JobHandle handle{next_handle_++};
        launches_.emplace(handle.value, std::move(launch));
        return handle;
    }

    Status reassign_cores(JobHandle handle, const CoreSet& cores) override {
        auto* launch = find(handle);
        if (launch == nullptr) {
            return Error{ErrorKind::NotFound, "unknown handle"};
        }
        if (launch->status == RunStatus::Completed || launch->status == RunStatus::Failed) {
            return Error{ErrorKind::Permanent, "job already finished"};
        }
        if (!reassign_failures_.empty()) {
            auto error = reassign_failures_.front();
            reassign_failures_.pop_front();
            return error;
        }
        launch->cores = cores;
        ++launch->reassignments;
        return {};
    }

    Status pause(JobHandle handle) override {
        auto* launch = find(handle);
        if (launch == nullptr || launch->status != RunStatus::Running) {
            return Error{ErrorKind::Permanent, "job is not running"};
        }
        launch->status = RunStatus::Paused;
        return {};
    }

    Status resume(JobHandle handle) override {
        auto* launch = find(handle);
        if (launch == nullptr || launch->status != RunStatus::Paused) {
            return Error{ErrorKind::Permanent, "job is not paused"};
        }
        launch->status = RunStatus::Running;
        return {};
    }

    Status stop(JobHandle handle) override {
        auto* launch = find(handle);
        if (launch == nullptr) {
            return Error{ErrorKind::NotFound, "unknown handle"};
        }
        if (launch->status == RunStatus::Completed || launch->status == RunStatus::Failed) {
            return {};
        }
        if (fail_stops_) {
            return Error{ErrorKind::Transient, "scripted stop failure"};
        }
        launch->status = RunStatus::Failed;
        ++launch->stops;
        return {};
    }

    RunStatus status(JobHandle handle) override {
        auto* launch = find(handle);
        if (launch == nullptr) {
            return RunStatus::Unknown;
        }
        if (launch->status == RunStatus::Running && launch->duration &&
            clock_.now() - launch->started >= *launch->duration) {
            launch->status = launch->final_status;
        }
        return launch->status;
    }

    Status release(JobHandle handle) override {
        auto* launch = find(handle);
        if (launch == nullptr) {
            return Error{ErrorKind::NotFound, "unknown handle"};
        }
        launch->released = true;
        return {};
    }

    [[nodiscard]] Launch& launch_of(const std::string& name) {
        Launch* latest = nullptr;
        for (auto& [handle, launch] : launches_) {
            if (launch.name == name) {
                latest = &launch;
            }
        }
        if (latest == nullptr) {
            throw std::out_of_range("no launch of " + name);
        }
        return *latest;
    }

    [[nodiscard]] bool launched(const std::string& name) const {
        for (const auto& [handle, launch] : launches_) {
            if (launch.name == name) {
                return true;
            }
        }
        return false;
    }

    [[nodiscard]] std::size_t launch_count() const { return launches_.size(); }
    [[nodiscard]] int start_calls() const { return start_calls_; }

private:
    Launch* find(JobHandle handle) {
        auto iter = launches_.find(handle.value);
        return iter == launches_.end() ? nullptr : &iter->second;
    }

    const Clock& clock_;  // NOLINT(cppcoreguidelines-avoid-const-or-ref-data-members)
    std::map<uint64_t, Launch> launches_;
    std::map<std::string, std::pair<Duration, RunStatus>> durations_;
    std::deque<Error> start_failures_;
    std::map<std::string, Error> broken_;
    std::deque<Error> reassign_failures_;
    bool fail_stops_{false};
    uint64_t next_handle_{1};
    int start_calls_{0};
};

// ============================================================================
// Event writer
// ============================================================================

class RecordingWriter : public EventWriter {
public:
    struct Record {
        TimePoint time;
        std::string kind;
        std::map<std::string, std::string> fields;

        [[nodiscard]] const std::string& at(const std::string& key) const { return fields.at(key); }
        [[nodiscard]] bool has(const std::string& key) const { return fields.count(key) != 0; }
    };

    void begin(TimePoint time) override {
        current_ = Record{};
        current_.time = time;
    }
    void kind(std::string_view name) override { current_.kind = std::string(name); }
    void field(std::string_view key, double value) override {
        current_.fields[std::string(key)] = std::to_string(value);
    }
    void field(std::string_view key, uint64_t value) override {
        current_.fields[std::string(key)] = std::to_string(value);
    }
    void field(std::string_view key, std::string_view value) override {
        current_.fields[std::string(key)] = std::string(value);
    }
    void field(std::string_view key, const CoreSet& value) override {
        current_.fields[std::string(key)] = value.to_string();
    }
    void end() override { records.push_back(current_); }
    void close() override { ++close_calls; }

    [[nodiscard]] std::vector<Record> of_kind(const std::string& kind) const {
        std::vector<Record> out;
        for (const auto& record : records) {
            if (record.kind == kind) {
                out.push_back(record);
            }
        }
        return out;
    }

    [[nodiscard]] std::vector<Record> for_subject(const std::string& subject) const {
        std::vector<Record> out;
        for (const auto& record : records) {
            if (record.fields.count("subject") != 0 && record.fields.at("subject") == subject) {
                out.push_back(record);
            }
        }
        return out;
    }

    [[nodiscard]] bool has_note_containing(const std::string& text) const {
        for (const auto& record : records) {
            if (record.kind == "custom_note" && record.at("note").find(text) != std::string::npos) {
                return true;
            }
        }
        return false;
    }

    std::vector<Record> records;
    int close_calls{0};

private:
    Record current_;
};

} // namespace coloc::test
