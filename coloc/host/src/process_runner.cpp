#include <coloc/host/process_runner.hpp>

#include <coloc/host/affinity.hpp>
#include <coloc/host/subprocess.hpp>

#include <signal.h>
#include <sys/wait.h>

#include <cerrno>
#include <cstring>
#include <string>
#include <utility>
#include <vector>

namespace coloc::host {

using core::Error;
using core::ErrorKind;
using core::JobHandle;
using core::RunStatus;
using core::Status;

namespace {

constexpr auto kStopPollInterval = core::duration_from_milliseconds(50);

RunStatus status_from_exit(int wait_status) {
    return exit_code_of(wait_status) == 0 ? RunStatus::Completed : RunStatus::Failed;
}

} // anonymous namespace

ProcessJobRunner::ProcessJobRunner(core::Clock& clock, RunnerSettings settings, ProcFs fs)
    : clock_(clock)
    , settings_(std::move(settings))
    , fs_(std::move(fs)) {}

ProcessJobRunner::~ProcessJobRunner() {
    for (auto& [handle, child] : children_) {
        if (finished(child)) {
            continue;
        }
        ::kill(-child.pid, SIGKILL);
        int wait_status = 0;
        while (::waitpid(child.pid, &wait_status, 0) < 0 && errno == EINTR) {
        }
    }
}

bool ProcessJobRunner::finished(const Child& child) noexcept {
    return child.status == RunStatus::Completed || child.status == RunStatus::Failed;
}

core::Result<ProcessJobRunner::Child*> ProcessJobRunner::lookup(JobHandle handle) {
    auto iter = children_.find(handle.value);
    if (iter == children_.end()) {
        return Error{ErrorKind::NotFound, "unknown job handle " + std::to_string(handle.value)};
    }
    return &iter->second;
}

void ProcessJobRunner::poll(Child& child) {
    if (finished(child)) {
        return;
    }
    int wait_status = 0;
    pid_t result = ::waitpid(child.pid, &wait_status, WNOHANG);
    if (result == child.pid) {
        child.status = status_from_exit(wait_status);
    } else if (result < 0 && errno == ECHILD) {
        // Reaped behind our back; its exit status is lost.
        child.status = RunStatus::Failed;
    }
}

Status ProcessJobRunner::signal_group(const Child& child, int signal) const {
    if (::kill(-child.pid, signal) != 0) {
        auto kind = errno == ESRCH ? ErrorKind::NotFound : ErrorKind::Permanent;
        return Error{kind, "kill(" + child.name + ", " + std::to_string(signal) +
                               "): " + std::strerror(errno)};
    }
    return {};
}

// ============================================================================
// Lifecycle
// ============================================================================

core::Result<JobHandle> ProcessJobRunner::start(const core::JobSpec& spec,
                                                const core::CoreSet& cores, uint32_t threads) {
    if (spec.command.empty()) {
        return Error{ErrorKind::Permanent, "job '" + spec.name + "' has no command"};
    }
    if (cores.empty()) {
        return Error{ErrorKind::Permanent, "job '" + spec.name + "' started on no cores"};
    }

    SpawnOptions options;
    options.cores = cores;
    options.new_process_group = true;
    if (settings_.output_dir) {
        options.output = *settings_.output_dir / (spec.name + ".log");
    }

    auto pid = spawn_process(expand_placeholders(spec.command, threads, cores), options);
    if (!pid) {
        return pid.error();
    }

    JobHandle handle{next_handle_++};
    children_.emplace(handle.value, Child{pid.value(), spec.name, RunStatus::Running});
    return handle;
}

Status ProcessJobRunner::reassign_cores(JobHandle handle, const core::CoreSet& cores) {
    auto child = lookup(handle);
    if (!child) {
        return child.error();
    }
    auto& job = *child.value();
    poll(job);
    if (finished(job)) {
        return Error{ErrorKind::Permanent, "job '" + job.name + "' has already finished"};
    }

    std::vector<pid_t> tree{job.pid};
    auto below = fs_.descendants(job.pid);
    tree.insert(tree.end(), below.begin(), below.end());
    return set_tree_affinity(fs_, tree, cores);
}

Status ProcessJobRunner::pause(JobHandle handle) {
    auto child = lookup(handle);
    if (!child) {
        return child.error();
    }
    auto& job = *child.value();
    poll(job);
    if (job.status != RunStatus::Running) {
        return Error{ErrorKind::Permanent, "cannot pause job '" + job.name + "' while " +
                                               std::string(core::to_string(job.status))};
    }
    auto sent = signal_group(job, SIGSTOP);
    if (sent) {
        job.status = RunStatus::Paused;
    }
    return sent;
}

Status ProcessJobRunner::resume(JobHandle handle) {
    auto child = lookup(handle);
    if (!child) {
        return child.error();
    }
    auto& job = *child.value();
    poll(job);
    if (job.status != RunStatus::Paused) {
        return Error{ErrorKind::Permanent, "cannot resume job '" + job.name + "' while " +
                                               std::string(core::to_string(job.status))};
    }
    auto sent = signal_group(job, SIGCONT);
    if (sent) {
        job.status = RunStatus::Running;
    }
    return sent;
}

Status ProcessJobRunner::stop(JobHandle handle) {
    auto child = lookup(handle);
    if (!child) {
        return child.error();
    }
    auto& job = *child.value();
    poll(job);
    if (finished(job)) {
        return {};
    }

    // A stopped group only sees SIGTERM once it is continued.
    auto term = signal_group(job, SIGTERM);
    if (!term && term.error().kind != ErrorKind::NotFound) {
        return term;
    }
    if (auto cont = signal_group(job, SIGCONT); !cont && cont.error().kind != ErrorKind::NotFound) {
        return cont;
    }

    const auto deadline = clock_.monotonic_now() + settings_.grace_period;
    while (clock_.monotonic_now() < deadline) {
        poll(job);
        if (finished(job)) {
            job.status = RunStatus::Failed;
            return {};
        }
        clock_.sleep_for(kStopPollInterval);
    }

    if (auto killed = signal_group(job, SIGKILL); !killed && killed.error().kind != ErrorKind::NotFound) {
        return killed;
    }
    int wait_status = 0;
    pid_t waited = 0;
    do {
        waited = ::waitpid(job.pid, &wait_status, 0);
    } while (waited < 0 && errno == EINTR);
    if (waited < 0 && errno != ECHILD) {
        return Error{ErrorKind::Transient,
                     "waitpid(" + job.name + "): " + std::strerror(errno)};
    }
    job.status = RunStatus::Failed;
    return {};
}

RunStatus ProcessJobRunner::status(JobHandle handle) {
    auto child = lookup(handle);
    if (!child) {
        return RunStatus::Unknown;
    }
    poll(*child.value());
    return child.value()->status;
}

Status ProcessJobRunner::release(JobHandle handle) {
    auto child = lookup(handle);
    if (!child) {
        return child.error();
    }
    poll(*child.value());
    if (!finished(*child.value())) {
        return Error{ErrorKind::Permanent,
                     "job '" + child.value()->name + "' is still running"};
    }
    children_.erase(handle.value);
    return {};
}

pid_t ProcessJobRunner::pid_of(JobHandle handle) const {
    auto iter = children_.find(handle.value);
    return iter == children_.end() ? -1 : iter->second.pid;
}

} // namespace coloc::host
