#pragma once

#include <coloc/core/types.hpp>

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace coloc::host {

/// @brief Execution substrate for batch jobs.
/// @ingroup host
enum class RunnerKind : uint8_t {
    Process,  ///< Local fork/exec, see ProcessJobRunner.
    Docker    ///< Containers driven through the docker CLI, see DockerJobRunner.
};

/// @brief Lowercase name of a RunnerKind (`"process"` or `"docker"`).
[[nodiscard]] std::string_view to_string(RunnerKind kind) noexcept;

/// @brief Parse a runner kind name.
/// @return The kind, or std::nullopt if @p name is not a known runner.
[[nodiscard]] std::optional<RunnerKind> parse_runner_kind(std::string_view name) noexcept;

/// @brief Settings shared by every JobRunner implementation.
/// @ingroup host
struct RunnerSettings {
    RunnerKind kind{RunnerKind::Process};
    /// Time a job gets to exit after the graceful stop request.
    core::Duration grace_period{core::duration_from_seconds(10.0)};
    /// Upper bound on any single docker CLI invocation.
    core::Duration command_timeout{core::duration_from_seconds(30.0)};
    /// Upper bound on a status query, called once per running job each tick.
    core::Duration status_timeout{core::duration_from_milliseconds(500)};
    /// Prefix of container names; leftovers carrying it are removed at startup.
    std::string name_prefix{"coloc_"};
    std::string docker_binary{"docker"};
    /// Directory receiving `<job>.log` for process jobs; output is discarded when unset.
    std::optional<std::filesystem::path> output_dir;
};

} // namespace coloc::host
