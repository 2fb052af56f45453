#pragma once

#include <chrono>
#include <compare>
#include <cstdint>

namespace coloc::core {

/// @brief Length of a controller interval (tick, sampling window, grace period).
/// @ingroup core_types
///
/// Stored as whole nanoseconds. The constructor is private; values come from
/// duration_from_seconds(), duration_from_milliseconds() or
/// duration_from_nanoseconds() so that every unit conversion is spelled out
/// at the call site.
class Duration {
public:
    constexpr Duration() noexcept = default;

    static constexpr Duration zero() noexcept { return Duration{}; }

    [[nodiscard]] constexpr double seconds() const noexcept { return static_cast<double>(ns_) / 1e9; }
    [[nodiscard]] constexpr int64_t milliseconds() const noexcept { return ns_ / 1'000'000; }
    [[nodiscard]] constexpr int64_t nanoseconds() const noexcept { return ns_; }

    /// @brief Same length as a `std::chrono` duration, for sleeping and deadlines.
    [[nodiscard]] constexpr std::chrono::nanoseconds to_chrono() const noexcept {
        return std::chrono::nanoseconds{ns_};
    }

    constexpr Duration operator+(Duration rhs) const noexcept { return Duration{ns_ + rhs.ns_}; }
    constexpr Duration operator-(Duration rhs) const noexcept { return Duration{ns_ - rhs.ns_}; }
    constexpr Duration operator-() const noexcept { return Duration{-ns_}; }

    constexpr Duration& operator+=(Duration rhs) noexcept {
        ns_ += rhs.ns_;
        return *this;
    }

    constexpr Duration& operator-=(Duration rhs) noexcept {
        ns_ -= rhs.ns_;
        return *this;
    }

    constexpr auto operator<=>(const Duration&) const noexcept = default;
    constexpr bool operator==(const Duration&) const noexcept = default;

private:
    explicit constexpr Duration(int64_t ns) noexcept : ns_(ns) {}

    friend constexpr Duration duration_from_seconds(double s) noexcept;
    friend constexpr Duration duration_from_milliseconds(int64_t ms) noexcept;
    friend constexpr Duration duration_from_nanoseconds(int64_t ns) noexcept;

    int64_t ns_{0};
};

/// @brief Wall-clock instant, as an offset from the Unix epoch.
/// @ingroup core_types
///
/// Event records carry these instants, so they are absolute times rather
/// than offsets from the start of the run.
class TimePoint {
public:
    constexpr TimePoint() noexcept = default;

    /// @brief 1970-01-01T00:00:00 UTC.
    static constexpr TimePoint epoch() noexcept { return TimePoint{}; }

    [[nodiscard]] constexpr Duration time_since_epoch() const noexcept { return since_epoch_; }

    constexpr TimePoint operator+(Duration d) const noexcept { return TimePoint{since_epoch_ + d}; }
    constexpr TimePoint operator-(Duration d) const noexcept { return TimePoint{since_epoch_ - d}; }
    constexpr Duration operator-(TimePoint rhs) const noexcept { return since_epoch_ - rhs.since_epoch_; }

    constexpr TimePoint& operator+=(Duration d) noexcept {
        since_epoch_ += d;
        return *this;
    }

    constexpr auto operator<=>(const TimePoint&) const noexcept = default;
    constexpr bool operator==(const TimePoint&) const noexcept = default;

private:
    explicit constexpr TimePoint(Duration since_epoch) noexcept : since_epoch_(since_epoch) {}

    friend constexpr TimePoint time_from_epoch(Duration d) noexcept;

    Duration since_epoch_;
};

// ============================================================================
// Unit conversions
// ============================================================================

/// @brief Seconds to Duration, rounded to the nearest nanosecond.
[[nodiscard]] constexpr Duration duration_from_seconds(double s) noexcept {
    return Duration{static_cast<int64_t>(s * 1e9 + (s < 0.0 ? -0.5 : 0.5))};
}

[[nodiscard]] constexpr Duration duration_from_milliseconds(int64_t ms) noexcept {
    return Duration{ms * 1'000'000};
}

[[nodiscard]] constexpr Duration duration_from_nanoseconds(int64_t ns) noexcept {
    return Duration{ns};
}

[[nodiscard]] constexpr double duration_to_seconds(Duration d) noexcept { return d.seconds(); }
[[nodiscard]] constexpr int64_t duration_to_nanoseconds(Duration d) noexcept { return d.nanoseconds(); }

[[nodiscard]] constexpr TimePoint time_from_epoch(Duration d) noexcept { return TimePoint{d}; }

/// @brief Seconds since the Unix epoch to TimePoint.
[[nodiscard]] constexpr TimePoint time_from_seconds(double s) noexcept {
    return time_from_epoch(duration_from_seconds(s));
}

[[nodiscard]] constexpr double time_to_seconds(TimePoint tp) noexcept {
    return tp.time_since_epoch().seconds();
}

} // namespace coloc::core
