#pragma once

#include <coloc/core/clock.hpp>
#include <coloc/core/types.hpp>
#include <coloc/core/usage_monitor.hpp>
#include <coloc/host/proc_fs.hpp>

#include <cstdint>

namespace coloc::host {

/// @brief UsageMonitor that differences two `/proc/stat` readings.
/// @ingroup host
///
/// Each sample() reads the per-core counters, sleeps for the sampling
/// interval on the injected clock and reads them again. The busy share of
/// each core excludes idle and iowait time.
class ProcStatMonitor : public core::UsageMonitor {
public:
    /// @param fs       procfs view to read `stat` from (must outlive the monitor).
    /// @param clock    Clock used for the sampling sleep (must outlive the monitor).
    /// @param interval Sampling window; must be positive.
    /// @param cores    Number of cores reported per sample.
    /// @throws OutOfRangeError if @p interval is not positive or @p cores is 0.
    ProcStatMonitor(const ProcFs& fs, core::Clock& clock, core::Duration interval, uint32_t cores);

    [[nodiscard]] core::Result<core::UtilizationSample> sample() override;
    [[nodiscard]] uint32_t core_count() const override { return cores_; }

    [[nodiscard]] core::Duration interval() const noexcept { return interval_; }

private:
    const ProcFs& fs_;    // NOLINT(cppcoreguidelines-avoid-const-or-ref-data-members)
    core::Clock& clock_;  // NOLINT(cppcoreguidelines-avoid-const-or-ref-data-members)
    core::Duration interval_;
    uint32_t cores_;
};

} // namespace coloc::host
