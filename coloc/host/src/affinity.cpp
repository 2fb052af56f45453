#include <coloc/host/affinity.hpp>

#include <sched.h>

#include <cerrno>
#include <cstring>
#include <string>
#include <utility>

namespace coloc::host {

using core::CoreSet;
using core::Error;
using core::ErrorKind;
using core::Status;

namespace {

Error errno_error(int err, const std::string& what) {
    auto kind = ErrorKind::Transient;
    if (err == ESRCH) {
        kind = ErrorKind::NotFound;
    } else if (err == EINVAL || err == EPERM) {
        kind = ErrorKind::Permanent;
    }
    return Error{kind, what + ": " + std::strerror(err)};
}

} // anonymous namespace

Status set_thread_affinity(pid_t tid, const CoreSet& cores) {
    if (cores.empty()) {
        return Error{ErrorKind::Permanent, "refusing to pin thread " + std::to_string(tid) +
                                               " to no cores"};
    }
    cpu_set_t set;
    CPU_ZERO(&set);
    for (auto cpu : cores) {
        if (cpu >= static_cast<core::CoreId>(CPU_SETSIZE)) {
            return Error{ErrorKind::Permanent, "core " + std::to_string(cpu) + " out of range"};
        }
        CPU_SET(cpu, &set);
    }
    if (sched_setaffinity(tid, sizeof(set), &set) != 0) {
        return errno_error(errno, "sched_setaffinity(" + std::to_string(tid) + ")");
    }
    return {};
}

core::Result<CoreSet> get_thread_affinity(pid_t tid) {
    cpu_set_t set;
    CPU_ZERO(&set);
    if (sched_getaffinity(tid, sizeof(set), &set) != 0) {
        return errno_error(errno, "sched_getaffinity(" + std::to_string(tid) + ")");
    }
    std::vector<core::CoreId> cores;
    for (int cpu = 0; cpu < CPU_SETSIZE; ++cpu) {
        if (CPU_ISSET(cpu, &set)) {
            cores.push_back(static_cast<core::CoreId>(cpu));
        }
    }
    return CoreSet{std::move(cores)};
}

Status set_tree_affinity(const ProcFs& fs, const std::vector<pid_t>& pids, const CoreSet& cores) {
    std::size_t updated = 0;
    for (auto pid : pids) {
        for (auto tid : fs.threads(pid)) {
            auto status = set_thread_affinity(tid, cores);
            if (status) {
                ++updated;
            } else if (status.error().kind != ErrorKind::NotFound) {
                return status;
            }
        }
    }
    if (updated == 0) {
        return Error{ErrorKind::NotFound, "no live thread to pin"};
    }
    return {};
}

// ============================================================================
// ProcessAffinityController
// ============================================================================

ProcessAffinityController::ProcessAffinityController(ProcFs fs)
    : fs_(std::move(fs)) {}

core::Result<pid_t> ProcessAffinityController::resolve(const std::string& target) const {
    auto pids = fs_.find_processes(target);
    if (pids.empty()) {
        return Error{ErrorKind::NotFound, "no process named '" + target + "'"};
    }
    return pids.front();
}

core::Result<CoreSet> ProcessAffinityController::get_affinity(const std::string& target) {
    auto pid = resolve(target);
    if (!pid) {
        return pid.error();
    }
    CoreSet cores;
    for (auto tid : fs_.threads(pid.value())) {
        auto thread_cores = get_thread_affinity(tid);
        if (thread_cores) {
            cores = cores.unite(thread_cores.value());
        } else if (thread_cores.error().kind != ErrorKind::NotFound) {
            return thread_cores.error();
        }
    }
    if (cores.empty()) {
        return Error{ErrorKind::NotFound, "process '" + target + "' exited"};
    }
    return cores;
}

Status ProcessAffinityController::set_affinity(const std::string& target, const CoreSet& cores) {
    auto pid = resolve(target);
    if (!pid) {
        return pid.error();
    }
    return set_tree_affinity(fs_, {pid.value()}, cores);
}

core::Result<uint32_t> ProcessAffinityController::thread_count(const std::string& target) {
    auto pid = resolve(target);
    if (!pid) {
        return pid.error();
    }
    auto threads = fs_.threads(pid.value());
    if (threads.empty()) {
        return Error{ErrorKind::NotFound, "process '" + target + "' exited"};
    }
    return static_cast<uint32_t>(threads.size());
}

} // namespace coloc::host
