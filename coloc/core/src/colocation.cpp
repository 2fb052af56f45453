#include <coloc/core/colocation.hpp>
#include <coloc/core/error.hpp>

namespace coloc::core {

std::string_view to_string(ColocationState state) noexcept {
    switch (state) {
        case ColocationState::SoloCore:  return "solo_core";
        case ColocationState::Colocated: return "colocated";
        case ColocationState::Isolated:  return "isolated";
    }
    return "unknown";
}

CoreLayout CoreLayout::standard(uint32_t core_count) {
    if (core_count < 3) {
        throw OutOfRangeError("colocation needs at least 3 cores, got " +
                              std::to_string(core_count));
    }
    CoreLayout layout;
    layout.core_count = core_count;
    layout.home = CoreSet{0};
    layout.shared = CoreSet{1};
    layout.slots.push_back(CoreSet::first_n(core_count).subtract(layout.home));
    return layout;
}

void ControllerConfig::validate() const {
    const auto all = layout.all_cores();
    auto check_within = [&all](const CoreSet& cores, const std::string& what) {
        if (!cores.is_subset_of(all)) {
            throw OutOfRangeError(what + " " + cores.to_string() +
                                  " exceeds the machine's cores " + all.to_string());
        }
    };

    if (service_process.empty()) {
        throw OutOfRangeError("service process name cannot be empty");
    }
    if (layout.home.empty()) {
        throw OutOfRangeError("service home cores cannot be empty");
    }
    if (layout.shared.empty()) {
        throw OutOfRangeError("shared cores cannot be empty");
    }
    check_within(layout.home, "home cores");
    check_within(layout.shared, "shared cores");
    if (layout.home.intersects(layout.shared)) {
        throw OutOfRangeError("home and shared cores overlap");
    }
    if (layout.slots.empty()) {
        throw OutOfRangeError("at least one job slot is required");
    }

    CoreSet seen;
    for (std::size_t i = 0; i < layout.slots.size(); ++i) {
        const auto& slot = layout.slots[i];
        const auto label = "slot " + std::to_string(i);
        if (slot.empty()) {
            throw OutOfRangeError(label + " is empty");
        }
        check_within(slot, label);
        if (slot.intersects(layout.home)) {
            throw OutOfRangeError(label + " overlaps the service home cores");
        }
        if (slot.intersects(seen)) {
            throw OutOfRangeError(label + " overlaps another slot");
        }
        if (slot.intersects(layout.shared) && slot.subtract(layout.shared).empty()) {
            throw OutOfRangeError(label + " holds only shared cores");
        }
        seen = seen.unite(slot);
    }

    auto check_percent = [](double value, const char* name) {
        if (value < 0.0 || value > 100.0) {
            throw OutOfRangeError(std::string("threshold '") + name + "' must be within [0, 100]");
        }
    };
    check_percent(thresholds.high, "high");
    check_percent(thresholds.low, "low");
    check_percent(thresholds.eviction, "eviction");
    check_percent(thresholds.restore, "restore");
    if (!(thresholds.low < thresholds.high)) {
        throw OutOfRangeError("threshold 'low' must be below 'high'");
    }
    if (!(thresholds.restore < thresholds.eviction)) {
        throw OutOfRangeError("threshold 'restore' must be below 'eviction'");
    }
    if (tick_interval <= Duration::zero()) {
        throw OutOfRangeError("tick interval must be positive");
    }
    if (max_start_attempts == 0) {
        throw OutOfRangeError("max start attempts must be positive");
    }
}

} // namespace coloc::core
