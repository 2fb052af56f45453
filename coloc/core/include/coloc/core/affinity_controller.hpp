#pragma once

#include <coloc/core/core_set.hpp>
#include <coloc/core/result.hpp>

#include <cstdint>
#include <string>

namespace coloc::core {

/// @brief Abstract controller of a named process's CPU affinity.
/// @ingroup core_collaborators
///
/// The target is identified by process name; implementations resolve it on
/// every call and re-enumerate the process's threads at call time, so
/// threads created since the previous call are covered.
///
/// A missing process is reported as ErrorKind::NotFound. When only some
/// threads could be re-pinned the call fails, and the threads already
/// updated keep their new affinity.
class AffinityController {
public:
    virtual ~AffinityController() = default;

    /// @brief Cores the target may run on (union over all of its threads).
    [[nodiscard]] virtual Result<CoreSet> get_affinity(const std::string& target) = 0;

    /// @brief Restrict the target and all of its threads to @p cores.
    [[nodiscard]] virtual Status set_affinity(const std::string& target, const CoreSet& cores) = 0;

    /// @brief Number of threads the target currently owns.
    [[nodiscard]] virtual Result<uint32_t> thread_count(const std::string& target) = 0;
};

} // namespace coloc::core
