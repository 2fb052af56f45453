#pragma once

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>
#include <vector>

namespace coloc::core {

/// @brief Index of a CPU core, 0-based.
using CoreId = uint32_t;

/// @brief Ordered, duplicate-free set of CPU core indices.
///
/// CoreSet is a small value type: the machines this controller manages have a
/// handful of cores, so a sorted vector is used rather than a bitmap. All
/// mutating operations return a new set.
///
/// Two textual forms are supported: the list form used in event logs
/// (`"[1,2,3]"`) and the cpuset form understood by the kernel and docker
/// (`"1-3"` or `"0,2"`).
///
/// @ingroup core
class CoreSet {
public:
    CoreSet() = default;
    CoreSet(std::initializer_list<CoreId> cores);
    explicit CoreSet(std::vector<CoreId> cores);

    /// @brief The set {0, 1, ..., count-1}.
    static CoreSet first_n(uint32_t count);

    /// @brief Parse a cpuset string such as `"0-2,4"`.
    /// @throws OutOfRangeError if the string is malformed.
    static CoreSet parse_cpuset(std::string_view text);

    [[nodiscard]] bool empty() const noexcept { return cores_.empty(); }
    [[nodiscard]] std::size_t size() const noexcept { return cores_.size(); }
    [[nodiscard]] bool contains(CoreId core) const noexcept;

    /// @brief Largest core index in the set.
    /// @throws InvalidStateError if the set is empty.
    [[nodiscard]] CoreId max() const;

    [[nodiscard]] bool intersects(const CoreSet& other) const noexcept;
    [[nodiscard]] bool is_subset_of(const CoreSet& other) const noexcept;

    [[nodiscard]] CoreSet unite(const CoreSet& other) const;
    [[nodiscard]] CoreSet subtract(const CoreSet& other) const;
    [[nodiscard]] CoreSet intersect(const CoreSet& other) const;

    [[nodiscard]] const std::vector<CoreId>& cores() const noexcept { return cores_; }
    [[nodiscard]] auto begin() const noexcept { return cores_.begin(); }
    [[nodiscard]] auto end() const noexcept { return cores_.end(); }

    /// @brief List form, e.g. `"[0,1]"`; the empty set is `"[]"`.
    [[nodiscard]] std::string to_string() const;

    /// @brief Comma-separated cpuset form, e.g. `"0,1"`.
    [[nodiscard]] std::string to_cpuset() const;

    bool operator==(const CoreSet& rhs) const = default;

private:
    void normalize();

    std::vector<CoreId> cores_;
};

} // namespace coloc::core
