#include <coloc/host/docker_runner.hpp>

#include <sstream>
#include <string_view>
#include <utility>

namespace coloc::host {

using core::Error;
using core::ErrorKind;
using core::JobHandle;
using core::RunStatus;
using core::Status;

namespace {

std::string trimmed(std::string_view text) {
    auto first = text.find_first_not_of(" \t\r\n");
    if (first == std::string_view::npos) {
        return {};
    }
    auto last = text.find_last_not_of(" \t\r\n");
    return std::string(text.substr(first, last - first + 1));
}

/// Classify a failed docker invocation from its stderr.
Error failure_of(const CommandOutput& output, const std::string& what) {
    auto message = what + " exited with " + std::to_string(output.exit_code);
    auto detail = trimmed(output.err);
    if (!detail.empty()) {
        message += ": " + detail;
    }
    if (detail.find("No such container") != std::string::npos ||
        detail.find("No such object") != std::string::npos) {
        return Error{ErrorKind::NotFound, message};
    }
    if (detail.find("Cannot connect to the Docker daemon") != std::string::npos) {
        return Error{ErrorKind::Transient, message};
    }
    return Error{ErrorKind::Permanent, message};
}

std::optional<RunStatus> parse_inspect(std::string_view text) {
    std::istringstream in{std::string(text)};
    std::string state;
    int exit_code = 0;
    if (!(in >> state >> exit_code)) {
        return std::nullopt;
    }
    if (state == "running" || state == "created" || state == "restarting") {
        return RunStatus::Running;
    }
    if (state == "paused") {
        return RunStatus::Paused;
    }
    if (state == "exited" || state == "dead") {
        return exit_code == 0 ? RunStatus::Completed : RunStatus::Failed;
    }
    return std::nullopt;
}

} // anonymous namespace

DockerJobRunner::DockerJobRunner(RunnerSettings settings, CommandExecutor executor)
    : settings_(std::move(settings))
    , executor_(std::move(executor)) {}

core::Result<DockerJobRunner::Container*> DockerJobRunner::lookup(JobHandle handle) {
    auto iter = containers_.find(handle.value);
    if (iter == containers_.end()) {
        return Error{ErrorKind::NotFound, "unknown job handle " + std::to_string(handle.value)};
    }
    return &iter->second;
}

core::Result<CommandOutput> DockerJobRunner::docker(std::vector<std::string> args,
                                                    core::Duration timeout) const {
    args.insert(args.begin(), settings_.docker_binary);
    return executor_(args, timeout);
}

Status DockerJobRunner::simple(std::vector<std::string> args) const {
    const auto what = "docker " + args.front();
    auto output = docker(std::move(args), settings_.command_timeout);
    if (!output) {
        return output.error();
    }
    if (output.value().exit_code != 0) {
        return failure_of(output.value(), what);
    }
    return {};
}

// ============================================================================
// Lifecycle
// ============================================================================

core::Result<JobHandle> DockerJobRunner::start(const core::JobSpec& spec,
                                               const core::CoreSet& cores, uint32_t threads) {
    if (spec.image.empty()) {
        return Error{ErrorKind::Permanent, "job '" + spec.name + "' has no container image"};
    }
    if (cores.empty()) {
        return Error{ErrorKind::Permanent, "job '" + spec.name + "' started on no cores"};
    }

    const auto name = container_name(spec.name);
    std::vector<std::string> args{"run", "-d", "--name", name, "--cpuset-cpus", cores.to_cpuset(),
                                  spec.image};
    for (auto& arg : expand_placeholders(spec.command, threads, cores)) {
        args.push_back(std::move(arg));
    }
    if (auto launched = simple(std::move(args)); !launched) {
        return launched.error();
    }

    JobHandle handle{next_handle_++};
    containers_.emplace(handle.value, Container{name, std::nullopt});
    return handle;
}

Status DockerJobRunner::reassign_cores(JobHandle handle, const core::CoreSet& cores) {
    auto container = lookup(handle);
    if (!container) {
        return container.error();
    }
    if (container.value()->final_status) {
        return Error{ErrorKind::Permanent,
                     "container " + container.value()->name + " has already finished"};
    }
    return simple({"update", "--cpuset-cpus", cores.to_cpuset(), container.value()->name});
}

Status DockerJobRunner::pause(JobHandle handle) {
    auto container = lookup(handle);
    if (!container) {
        return container.error();
    }
    return simple({"pause", container.value()->name});
}

Status DockerJobRunner::resume(JobHandle handle) {
    auto container = lookup(handle);
    if (!container) {
        return container.error();
    }
    return simple({"unpause", container.value()->name});
}

Status DockerJobRunner::stop(JobHandle handle) {
    auto container = lookup(handle);
    if (!container) {
        return container.error();
    }
    auto& record = *container.value();
    if (record.final_status) {
        return {};
    }

    const auto grace = std::to_string(settings_.grace_period.nanoseconds() / 1'000'000'000);
    auto output = docker({"stop", "-t", grace, record.name},
                         settings_.command_timeout + settings_.grace_period);
    if (!output) {
        return output.error();
    }
    if (output.value().exit_code != 0) {
        auto failure = failure_of(output.value(), "docker stop");
        if (failure.kind != ErrorKind::NotFound) {
            return failure;
        }
    }
    record.final_status = RunStatus::Failed;
    return {};
}

RunStatus DockerJobRunner::status(JobHandle handle) {
    auto container = lookup(handle);
    if (!container) {
        return RunStatus::Unknown;
    }
    auto& record = *container.value();
    if (record.final_status) {
        return *record.final_status;
    }

    auto output = docker({"inspect", "--format", "{{.State.Status}} {{.State.ExitCode}}",
                          record.name},
                         settings_.status_timeout);
    if (!output) {
        // The CLI failed or timed out; assume nothing changed and poll again next tick.
        return RunStatus::Running;
    }
    if (output.value().exit_code != 0) {
        return failure_of(output.value(), "docker inspect").kind == ErrorKind::NotFound
                   ? RunStatus::Unknown
                   : RunStatus::Running;
    }
    auto parsed = parse_inspect(output.value().out);
    if (!parsed) {
        return RunStatus::Running;
    }
    if (*parsed == RunStatus::Completed || *parsed == RunStatus::Failed) {
        record.final_status = parsed;
    }
    return *parsed;
}

Status DockerJobRunner::release(JobHandle handle) {
    auto container = lookup(handle);
    if (!container) {
        return container.error();
    }
    auto removed = simple({"rm", "-f", container.value()->name});
    if (!removed && removed.error().kind != ErrorKind::NotFound) {
        return removed;
    }
    containers_.erase(handle.value);
    return {};
}

Status DockerJobRunner::remove_leftovers() {
    auto output = docker({"ps", "-a", "--filter", "name=" + settings_.name_prefix, "--format",
                          "{{.Names}}"},
                         settings_.command_timeout);
    if (!output) {
        return output.error();
    }
    if (output.value().exit_code != 0) {
        return failure_of(output.value(), "docker ps");
    }

    std::istringstream names(output.value().out);
    std::string name;
    while (std::getline(names, name)) {
        name = trimmed(name);
        // The name filter matches substrings; only prefixed names are ours.
        if (name.rfind(settings_.name_prefix, 0) != 0) {
            continue;
        }
        auto removed = simple({"rm", "-f", name});
        if (!removed && removed.error().kind != ErrorKind::NotFound) {
            return removed;
        }
    }
    return {};
}

} // namespace coloc::host
