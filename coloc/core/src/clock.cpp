#include <coloc/core/clock.hpp>

#include <chrono>
#include <thread>

namespace coloc::core {

TimePoint SystemClock::now() const {
    auto since_epoch = std::chrono::system_clock::now().time_since_epoch();
    auto ns = std::chrono::duration_cast<std::chrono::nanoseconds>(since_epoch).count();
    return time_from_epoch(duration_from_nanoseconds(ns));
}

TimePoint SystemClock::monotonic_now() const {
    auto since_boot = std::chrono::steady_clock::now().time_since_epoch();
    auto ns = std::chrono::duration_cast<std::chrono::nanoseconds>(since_boot).count();
    return time_from_epoch(duration_from_nanoseconds(ns));
}

void SystemClock::sleep_for(Duration duration) {
    if (duration > Duration::zero()) {
        std::this_thread::sleep_for(duration.to_chrono());
    }
}

} // namespace coloc::core
