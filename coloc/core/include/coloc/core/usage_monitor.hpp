#pragma once

#include <coloc/core/result.hpp>

#include <cstdint>
#include <vector>

namespace coloc::core {

/// @brief Per-core utilization percentages (0-100), one entry per core.
using UtilizationSample = std::vector<double>;

/// @brief Abstract source of per-core CPU utilization.
/// @ingroup core_collaborators
///
/// Each call measures over a bounded sampling window and returns a fresh
/// reading; implementations never return a cached value. A failed OS query
/// is reported as an Error (usually ErrorKind::Transient), never thrown.
class UsageMonitor {
public:
    virtual ~UsageMonitor() = default;

    /// @brief Measure utilization of every core.
    /// @return Sample of length core_count(), or the reason it failed.
    [[nodiscard]] virtual Result<UtilizationSample> sample() = 0;

    /// @brief Number of cores covered by each sample.
    [[nodiscard]] virtual uint32_t core_count() const = 0;
};

} // namespace coloc::core
