#pragma once

#include <coloc/core/job_runner.hpp>
#include <coloc/host/runner_settings.hpp>
#include <coloc/host/subprocess.hpp>

#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace coloc::host {

/// @brief Runs one command line to completion within a timeout.
///
/// run_command() is the production executor; tests substitute a script.
using CommandExecutor =
    std::function<core::Result<CommandOutput>(const std::vector<std::string>&, core::Duration)>;

/// @brief JobRunner that runs each job in a detached docker container.
/// @ingroup host
///
/// Containers are named `<name_prefix><job>` and pinned with
/// `--cpuset-cpus`; reassignment is `docker update`, which docker applies to
/// every process of the container. Every CLI call is bounded by the command
/// timeout; `docker stop` additionally gets the grace period.
class DockerJobRunner : public core::JobRunner {
public:
    /// @param settings docker_binary, name_prefix, grace_period and command_timeout are used.
    /// @param executor Command executor; defaults to run_command().
    explicit DockerJobRunner(RunnerSettings settings, CommandExecutor executor = run_command);

    [[nodiscard]] core::Result<core::JobHandle> start(const core::JobSpec& spec,
                                                      const core::CoreSet& cores,
                                                      uint32_t threads) override;
    [[nodiscard]] core::Status reassign_cores(core::JobHandle handle,
                                              const core::CoreSet& cores) override;
    [[nodiscard]] core::Status pause(core::JobHandle handle) override;
    [[nodiscard]] core::Status resume(core::JobHandle handle) override;
    [[nodiscard]] core::Status stop(core::JobHandle handle) override;
    [[nodiscard]] core::RunStatus status(core::JobHandle handle) override;
    [[nodiscard]] core::Status release(core::JobHandle handle) override;

    /// @brief Force-remove every container whose name carries the prefix.
    ///
    /// Run once at startup so that a crashed previous run cannot block the
    /// container names of this one.
    [[nodiscard]] core::Status remove_leftovers();

    /// @brief Container name used for job @p job_name.
    [[nodiscard]] std::string container_name(const std::string& job_name) const {
        return settings_.name_prefix + job_name;
    }

private:
    struct Container {
        std::string name;
        std::optional<core::RunStatus> final_status;
    };

    [[nodiscard]] core::Result<Container*> lookup(core::JobHandle handle);
    [[nodiscard]] core::Result<CommandOutput> docker(std::vector<std::string> args,
                                                     core::Duration timeout) const;
    [[nodiscard]] core::Status simple(std::vector<std::string> args) const;

    RunnerSettings settings_;
    CommandExecutor executor_;
    std::map<uint64_t, Container> containers_;
    uint64_t next_handle_{1};
};

} // namespace coloc::host
