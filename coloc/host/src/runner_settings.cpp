#include <coloc/host/runner_settings.hpp>

namespace coloc::host {

std::string_view to_string(RunnerKind kind) noexcept {
    switch (kind) {
        case RunnerKind::Process: return "process";
        case RunnerKind::Docker:  return "docker";
    }
    return "unknown";
}

std::optional<RunnerKind> parse_runner_kind(std::string_view name) noexcept {
    if (name == "process") {
        return RunnerKind::Process;
    }
    if (name == "docker") {
        return RunnerKind::Docker;
    }
    return std::nullopt;
}

} // namespace coloc::host
