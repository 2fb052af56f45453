#include <coloc/host/proc_fs.hpp>

#include <unistd.h>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <deque>
#include <fstream>
#include <map>
#include <sstream>
#include <system_error>
#include <utility>

namespace coloc::host {

using core::ErrorKind;

namespace {

bool all_digits(std::string_view text) {
    return !text.empty() &&
           std::all_of(text.begin(), text.end(), [](unsigned char c) { return std::isdigit(c) != 0; });
}

std::optional<pid_t> to_pid(std::string_view text) {
    pid_t value = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || ptr != text.data() + text.size()) {
        return std::nullopt;
    }
    return value;
}

} // anonymous namespace

uint64_t CpuTimes::total() const noexcept {
    return user + nice + system + idle + iowait + irq + softirq + steal;
}

core::Result<std::vector<CpuTimes>> parse_proc_stat(std::string_view text) {
    std::vector<CpuTimes> cores;
    std::istringstream in{std::string(text)};
    std::string line;
    while (std::getline(in, line)) {
        if (line.size() < 4 || line.compare(0, 3, "cpu") != 0 ||
            std::isdigit(static_cast<unsigned char>(line[3])) == 0) {
            continue;
        }
        std::istringstream fields(line);
        std::string label;
        CpuTimes times;
        fields >> label >> times.user >> times.nice >> times.system >> times.idle;
        if (!fields) {
            return core::Error{ErrorKind::Transient, "malformed /proc/stat line: " + line};
        }
        // iowait and later columns are absent on very old kernels
        fields >> times.iowait >> times.irq >> times.softirq >> times.steal;

        auto id = to_pid(std::string_view(label).substr(3));
        if (!id || *id < 0) {
            return core::Error{ErrorKind::Transient, "malformed /proc/stat label: " + label};
        }
        auto index = static_cast<std::size_t>(*id);
        if (cores.size() <= index) {
            cores.resize(index + 1);
        }
        cores[index] = times;
    }
    if (cores.empty()) {
        return core::Error{ErrorKind::Transient, "no per-core lines in /proc/stat"};
    }
    return cores;
}

core::UtilizationSample utilization_between(const std::vector<CpuTimes>& before,
                                            const std::vector<CpuTimes>& after, uint32_t cores) {
    core::UtilizationSample sample(cores, 0.0);
    for (uint32_t i = 0; i < cores; ++i) {
        if (i >= before.size() || i >= after.size()) {
            continue;
        }
        const auto total_before = before[i].total();
        const auto total_after = after[i].total();
        const auto busy_before = before[i].busy();
        const auto busy_after = after[i].busy();
        if (total_after <= total_before || busy_after < busy_before) {
            continue;
        }
        const auto total = static_cast<double>(total_after - total_before);
        const auto busy = static_cast<double>(busy_after - busy_before);
        sample[i] = std::clamp(100.0 * busy / total, 0.0, 100.0);
    }
    return sample;
}

std::optional<std::string> parse_stat_comm(std::string_view stat) {
    auto open = stat.find('(');
    auto close = stat.rfind(')');
    if (open == std::string_view::npos || close == std::string_view::npos || close < open) {
        return std::nullopt;
    }
    return std::string(stat.substr(open + 1, close - open - 1));
}

std::optional<pid_t> parse_stat_ppid(std::string_view stat) {
    auto close = stat.rfind(')');
    if (close == std::string_view::npos) {
        return std::nullopt;
    }
    std::istringstream rest{std::string(stat.substr(close + 1))};
    std::string state;
    pid_t ppid = 0;
    if (!(rest >> state >> ppid)) {
        return std::nullopt;
    }
    return ppid;
}

core::Result<std::string> read_text_file(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file) {
        return core::Error{ErrorKind::NotFound, "cannot open " + path.string()};
    }
    std::ostringstream contents;
    contents << file.rdbuf();
    return contents.str();
}

uint32_t online_core_count() noexcept {
    long count = ::sysconf(_SC_NPROCESSORS_ONLN);
    return count > 0 ? static_cast<uint32_t>(count) : 1U;
}

// ============================================================================
// ProcFs
// ============================================================================

ProcFs::ProcFs(std::filesystem::path root)
    : root_(std::move(root)) {}

core::Result<std::vector<CpuTimes>> ProcFs::cpu_times() const {
    auto text = read_text_file(root_ / "stat");
    if (!text) {
        return core::Error{ErrorKind::Transient, text.error().message};
    }
    return parse_proc_stat(text.value());
}

std::vector<pid_t> ProcFs::numeric_entries(const std::filesystem::path& dir) const {
    std::vector<pid_t> out;
    std::error_code ec;
    std::filesystem::directory_iterator iter(dir, ec);
    if (ec) {
        return out;
    }
    for (const auto& entry : iter) {
        auto name = entry.path().filename().string();
        if (!all_digits(name)) {
            continue;
        }
        if (auto pid = to_pid(name)) {
            out.push_back(*pid);
        }
    }
    std::sort(out.begin(), out.end());
    return out;
}

std::vector<pid_t> ProcFs::find_processes(std::string_view comm) const {
    std::vector<pid_t> out;
    for (auto pid : numeric_entries(root_)) {
        auto stat = read_text_file(root_ / std::to_string(pid) / "stat");
        if (!stat) {
            continue;
        }
        auto name = parse_stat_comm(stat.value());
        if (name && *name == comm) {
            out.push_back(pid);
        }
    }
    return out;
}

std::vector<pid_t> ProcFs::threads(pid_t pid) const {
    return numeric_entries(root_ / std::to_string(pid) / "task");
}

std::vector<pid_t> ProcFs::descendants(pid_t pid) const {
    std::map<pid_t, std::vector<pid_t>> children;
    for (auto candidate : numeric_entries(root_)) {
        auto stat = read_text_file(root_ / std::to_string(candidate) / "stat");
        if (!stat) {
            continue;
        }
        if (auto parent = parse_stat_ppid(stat.value())) {
            children[*parent].push_back(candidate);
        }
    }

    std::vector<pid_t> out;
    std::deque<pid_t> pending{pid};
    while (!pending.empty()) {
        auto current = pending.front();
        pending.pop_front();
        auto iter = children.find(current);
        if (iter == children.end()) {
            continue;
        }
        for (auto child : iter->second) {
            out.push_back(child);
            pending.push_back(child);
        }
    }
    return out;
}

} // namespace coloc::host
