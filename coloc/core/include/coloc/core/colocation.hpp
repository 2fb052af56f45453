#pragma once

#include <coloc/core/core_set.hpp>
#include <coloc/core/types.hpp>

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace coloc::core {

/// @brief Division of the core set between the service and batch jobs.
/// @ingroup core_controller
enum class ColocationState : uint8_t {
    SoloCore,   ///< Service on its home cores only; batch jobs on all others.
    Colocated,  ///< Service also runs on the shared cores, which batch jobs still use.
    Isolated    ///< Batch jobs pushed off the shared cores; service owns home + shared.
};

/// @brief Lowercase name of a ColocationState (`"solo_core"`, ...).
[[nodiscard]] std::string_view to_string(ColocationState state) noexcept;

/// @brief Utilization watermarks, in percent of one core.
///
/// All comparisons are strict and use the current sample only.
///
/// @ingroup core_controller
struct Thresholds {
    double high{90.0};      ///< SoloCore -> Colocated when usage > high.
    double low{50.0};       ///< Colocated -> SoloCore when usage < low (nothing evicted).
    double eviction{95.0};  ///< Colocated: evict one job per tick when usage > eviction.
    double restore{50.0};   ///< Re-admit one evicted job per tick when usage < restore.
};

/// @brief Static assignment of cores to roles.
///
/// The home cores always belong to the service. The shared cores are lent to
/// the service in the Colocated and Isolated states. The slots partition the
/// remaining cores between concurrently running batch jobs; a slot may
/// include shared cores, which is where colocation happens.
///
/// @ingroup core_controller
struct CoreLayout {
    uint32_t core_count{0};
    CoreSet home;
    CoreSet shared;
    std::vector<CoreSet> slots;

    /// @brief Layout with home {0}, shared {1} and one slot of cores 1..n-1.
    /// @throws OutOfRangeError if @p core_count is below 3.
    static CoreLayout standard(uint32_t core_count);

    /// @brief Every core of the machine.
    [[nodiscard]] CoreSet all_cores() const { return CoreSet::first_n(core_count); }
};

/// @brief Complete configuration of a ColocationController.
/// @ingroup core_controller
struct ControllerConfig {
    std::string service_process{"memcached"};  ///< Process name of the service.
    CoreLayout layout;
    Thresholds thresholds;
    Duration tick_interval{duration_from_milliseconds(800)};
    /// Launch attempts per job before a Transient or NotFound start failure
    /// is treated as final. A Permanent failure is final on the first attempt.
    uint32_t max_start_attempts{3};

    /// @brief Check the layout and thresholds for consistency.
    ///
    /// Every core must be below `core_count`; home must be non-empty and
    /// disjoint from the shared cores and from every slot; slots must be
    /// non-empty and pairwise disjoint, and a slot holding shared cores must
    /// also hold at least one other core so that eviction leaves the job
    /// somewhere to run. Thresholds must lie in [0, 100] with
    /// `low < high` and `restore < eviction`. The tick interval and the
    /// start attempt limit must be positive.
    ///
    /// @throws OutOfRangeError describing the first violation.
    void validate() const;
};

} // namespace coloc::core
