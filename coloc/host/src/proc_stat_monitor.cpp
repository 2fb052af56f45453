#include <coloc/host/proc_stat_monitor.hpp>

#include <coloc/core/error.hpp>

#include <string>

namespace coloc::host {

ProcStatMonitor::ProcStatMonitor(const ProcFs& fs, core::Clock& clock, core::Duration interval,
                                 uint32_t cores)
    : fs_(fs)
    , clock_(clock)
    , interval_(interval)
    , cores_(cores) {
    if (interval_ <= core::Duration::zero()) {
        throw core::OutOfRangeError("sampling interval must be positive");
    }
    if (cores_ == 0) {
        throw core::OutOfRangeError("monitor must cover at least one core");
    }
}

core::Result<core::UtilizationSample> ProcStatMonitor::sample() {
    auto before = fs_.cpu_times();
    if (!before) {
        return before.error();
    }
    clock_.sleep_for(interval_);
    auto after = fs_.cpu_times();
    if (!after) {
        return after.error();
    }
    if (before.value().size() < cores_ || after.value().size() < cores_) {
        return core::Error{core::ErrorKind::Transient,
                           "/proc/stat lists fewer than " + std::to_string(cores_) + " cores"};
    }
    return utilization_between(before.value(), after.value(), cores_);
}

} // namespace coloc::host
