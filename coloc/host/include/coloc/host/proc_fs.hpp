#pragma once

#include <coloc/core/result.hpp>
#include <coloc/core/usage_monitor.hpp>

#include <sys/types.h>

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace coloc::host {

/// @brief Cumulative CPU time of one core, in clock ticks, as listed in `/proc/stat`.
/// @ingroup host
struct CpuTimes {
    uint64_t user{0};
    uint64_t nice{0};
    uint64_t system{0};
    uint64_t idle{0};
    uint64_t iowait{0};
    uint64_t irq{0};
    uint64_t softirq{0};
    uint64_t steal{0};

    [[nodiscard]] uint64_t total() const noexcept;

    /// @brief Time not spent idle or waiting for I/O.
    [[nodiscard]] uint64_t busy() const noexcept { return total() - idle - iowait; }
};

/// @brief Parse the per-core `cpuN` lines of `/proc/stat`.
///
/// The aggregate `cpu` line and all non-cpu lines are skipped. The result is
/// indexed by core id; ids missing from the text (offline cores) read as
/// zero.
///
/// @return Per-core counters, or ErrorKind::Transient if a cpu line is malformed.
[[nodiscard]] core::Result<std::vector<CpuTimes>> parse_proc_stat(std::string_view text);

/// @brief Busy percentage of each of the first @p cores cores between two readings.
///
/// A core with no elapsed time, a core missing from either reading, or a
/// counter that went backwards reads as 0.
[[nodiscard]] core::UtilizationSample utilization_between(const std::vector<CpuTimes>& before,
                                                          const std::vector<CpuTimes>& after,
                                                          uint32_t cores);

/// @brief Command name of a `/proc/<pid>/stat` line (the text between the parentheses).
[[nodiscard]] std::optional<std::string> parse_stat_comm(std::string_view stat);

/// @brief Parent pid of a `/proc/<pid>/stat` line.
[[nodiscard]] std::optional<pid_t> parse_stat_ppid(std::string_view stat);

/// @brief Read a whole text file.
/// @return The contents, or ErrorKind::NotFound if the file cannot be opened.
[[nodiscard]] core::Result<std::string> read_text_file(const std::filesystem::path& path);

/// @brief Number of online cores, from `sysconf(_SC_NPROCESSORS_ONLN)`; at least 1.
[[nodiscard]] uint32_t online_core_count() noexcept;

/// @brief Read-only view of a procfs tree.
/// @ingroup host
///
/// The root defaults to `/proc`; tests point it at a directory laid out the
/// same way. Processes and threads that vanish during a scan are skipped.
class ProcFs {
public:
    explicit ProcFs(std::filesystem::path root = "/proc");

    [[nodiscard]] const std::filesystem::path& root() const noexcept { return root_; }

    /// @brief Per-core counters from `<root>/stat`.
    [[nodiscard]] core::Result<std::vector<CpuTimes>> cpu_times() const;

    /// @brief Pids whose command name is @p comm, in ascending order.
    [[nodiscard]] std::vector<pid_t> find_processes(std::string_view comm) const;

    /// @brief Thread ids of @p pid (from `<root>/<pid>/task`), ascending.
    [[nodiscard]] std::vector<pid_t> threads(pid_t pid) const;

    /// @brief Every process below @p pid in the process tree, breadth first.
    [[nodiscard]] std::vector<pid_t> descendants(pid_t pid) const;

private:
    [[nodiscard]] std::vector<pid_t> numeric_entries(const std::filesystem::path& dir) const;

    std::filesystem::path root_;
};

} // namespace coloc::host
