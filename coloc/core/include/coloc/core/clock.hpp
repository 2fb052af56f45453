#pragma once

#include <coloc/core/types.hpp>

namespace coloc::core {

/// @brief Source of wall-clock time and of the inter-tick sleep.
///
/// The controller never reads the system clock directly so that tests can
/// drive it with a manual clock and replay exact timestamps.
///
/// @ingroup core
class Clock {
public:
    virtual ~Clock() = default;

    /// @brief Current time, as an offset from the Unix epoch.
    [[nodiscard]] virtual TimePoint now() const = 0;

    /// @brief Reading of a clock that never steps backwards.
    ///
    /// Only differences between two readings are meaningful. Timers and
    /// deadlines use this; event timestamps use now(). Defaults to now() for
    /// clocks that are already monotonic.
    [[nodiscard]] virtual TimePoint monotonic_now() const { return now(); }

    /// @brief Block the calling thread for @p duration.
    virtual void sleep_for(Duration duration) = 0;
};

/// @brief Clock backed by `std::chrono::system_clock` and `std::chrono::steady_clock`.
/// @ingroup core
class SystemClock : public Clock {
public:
    [[nodiscard]] TimePoint now() const override;
    [[nodiscard]] TimePoint monotonic_now() const override;
    void sleep_for(Duration duration) override;
};

} // namespace coloc::core
