#pragma once

#include <coloc/core/clock.hpp>
#include <coloc/core/job_runner.hpp>
#include <coloc/host/proc_fs.hpp>
#include <coloc/host/runner_settings.hpp>

#include <sys/types.h>

#include <cstdint>
#include <map>
#include <string>

namespace coloc::host {

/// @brief JobRunner that runs each job as a local child process.
/// @ingroup host
///
/// Every job becomes the leader of its own process group and is pinned to
/// its cores before `exec`, so nothing it forks ever runs elsewhere.
/// Reassignment re-pins every thread of the job's current process tree.
/// Pause, resume and stop signal the whole group.
///
/// Children still alive when the runner is destroyed are killed and reaped.
class ProcessJobRunner : public core::JobRunner {
public:
    /// @param clock    Clock used to pace the stop grace period (must outlive the runner).
    /// @param settings grace_period and output_dir are used.
    /// @param fs       procfs view used to find a job's descendants and threads.
    ProcessJobRunner(core::Clock& clock, RunnerSettings settings, ProcFs fs = ProcFs{});
    ~ProcessJobRunner() override;

    ProcessJobRunner(const ProcessJobRunner&) = delete;
    ProcessJobRunner& operator=(const ProcessJobRunner&) = delete;
    ProcessJobRunner(ProcessJobRunner&&) = delete;
    ProcessJobRunner& operator=(ProcessJobRunner&&) = delete;

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

    /// @brief Pid of the job's leader process, or -1 for an unknown handle.
    [[nodiscard]] pid_t pid_of(core::JobHandle handle) const;

    /// @brief Number of jobs the runner still holds a record for.
    [[nodiscard]] std::size_t tracked() const noexcept { return children_.size(); }

private:
    struct Child {
        pid_t pid{-1};
        std::string name;
        core::RunStatus status{core::RunStatus::Running};
    };

    [[nodiscard]] static bool finished(const Child& child) noexcept;
    [[nodiscard]] core::Result<Child*> lookup(core::JobHandle handle);
    [[nodiscard]] core::Status signal_group(const Child& child, int signal) const;
    void poll(Child& child);

    core::Clock& clock_;  // NOLINT(cppcoreguidelines-avoid-const-or-ref-data-members)
    RunnerSettings settings_;
    ProcFs fs_;
    std::map<uint64_t, Child> children_;
    uint64_t next_handle_{1};
};

} // namespace coloc::host
