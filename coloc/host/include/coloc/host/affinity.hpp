#pragma once

#include <coloc/core/affinity_controller.hpp>
#include <coloc/core/core_set.hpp>
#include <coloc/core/result.hpp>
#include <coloc/host/proc_fs.hpp>

#include <sys/types.h>

#include <cstdint>
#include <string>
#include <vector>

namespace coloc::host {

/// @brief Restrict one thread to @p cores with `sched_setaffinity`.
///
/// A thread that no longer exists is reported as ErrorKind::NotFound; cores
/// the kernel rejects (offline, outside the cgroup) as ErrorKind::Permanent.
[[nodiscard]] core::Status set_thread_affinity(pid_t tid, const core::CoreSet& cores);

/// @brief Cores one thread may run on, from `sched_getaffinity`.
[[nodiscard]] core::Result<core::CoreSet> get_thread_affinity(pid_t tid);

/// @brief Apply @p cores to every thread of every process in @p pids.
///
/// Threads that exit while the set is applied are skipped. Threads already
/// updated keep their new affinity if a later one fails.
///
/// @return Success if at least one thread was updated and none failed;
///         ErrorKind::NotFound if every thread had vanished.
[[nodiscard]] core::Status set_tree_affinity(const ProcFs& fs, const std::vector<pid_t>& pids,
                                             const core::CoreSet& cores);

/// @brief AffinityController for a local process found by its command name.
/// @ingroup host
///
/// The target is resolved through procfs on every call. When several
/// processes share the name, the one with the lowest pid is used.
class ProcessAffinityController : public core::AffinityController {
public:
    explicit ProcessAffinityController(ProcFs fs = ProcFs{});

    [[nodiscard]] core::Result<core::CoreSet> get_affinity(const std::string& target) override;
    [[nodiscard]] core::Status set_affinity(const std::string& target,
                                            const core::CoreSet& cores) override;
    [[nodiscard]] core::Result<uint32_t> thread_count(const std::string& target) override;

private:
    [[nodiscard]] core::Result<pid_t> resolve(const std::string& target) const;

    ProcFs fs_;
};

} // namespace coloc::host
