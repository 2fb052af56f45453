#pragma once

#include <coloc/core/core_set.hpp>
#include <coloc/core/result.hpp>
#include <coloc/core/types.hpp>

#include <sys/types.h>

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace coloc::host {

/// @brief Captured result of a finished command.
/// @ingroup host
struct CommandOutput {
    int exit_code{0};  ///< Exit status, or 128 + signal number if it was killed.
    std::string out;   ///< Everything written to stdout.
    std::string err;   ///< Everything written to stderr.
};

/// @brief How spawn_process() sets up the child before `exec`.
/// @ingroup host
struct SpawnOptions {
    /// Pin the child to these cores before it executes anything.
    std::optional<core::CoreSet> cores;
    /// Make the child the leader of a new process group so that signals can
    /// reach everything it forks.
    bool new_process_group{true};
    /// Append stdout and stderr to this file; `/dev/null` when unset.
    std::optional<std::filesystem::path> output;
};

/// @brief Fork and exec @p argv without waiting for it.
///
/// Exec failures are detected before returning: the child reports its errno
/// over a close-on-exec pipe, so a missing binary is an error here rather
/// than a child that exits 127 later.
///
/// @return Pid of the running child; ErrorKind::Permanent if the program
///         cannot be executed or the output file cannot be opened,
///         ErrorKind::Transient if `fork` itself failed.
[[nodiscard]] core::Result<pid_t> spawn_process(const std::vector<std::string>& argv,
                                                const SpawnOptions& options = {});

/// @brief Run @p argv to completion, capturing its output.
///
/// The child is killed with SIGKILL and reaped if it outlives @p timeout.
///
/// @return The exit code and output; ErrorKind::Transient on timeout or if
///         the process could not be started for a transient reason.
[[nodiscard]] core::Result<CommandOutput> run_command(const std::vector<std::string>& argv,
                                                      core::Duration timeout);

/// @brief Exit code of a `waitpid` status: the exit status, or 128 + signal.
[[nodiscard]] int exit_code_of(int wait_status) noexcept;

/// @brief Substitute `{threads}` and `{cores}` in every argument.
///
/// `{cores}` expands to the cpuset form of @p cores (e.g. `"1,2,3"`).
[[nodiscard]] std::vector<std::string> expand_placeholders(const std::vector<std::string>& argv,
                                                           uint32_t threads,
                                                           const core::CoreSet& cores);

/// @brief Join @p argv with spaces, for diagnostics.
[[nodiscard]] std::string join_command(const std::vector<std::string>& argv);

} // namespace coloc::host
