#include <coloc/core/core_set.hpp>
#include <coloc/core/error.hpp>

#include <algorithm>
#include <charconv>
#include <iterator>
#include <sstream>
#include <utility>

namespace coloc::core {

namespace {

CoreId parse_core(std::string_view token, std::string_view whole) {
    CoreId value = 0;
    const auto* first = token.data();
    const auto* last = token.data() + token.size();
    auto [ptr, ec] = std::from_chars(first, last, value);
    if (token.empty() || ec != std::errc{} || ptr != last) {
        throw OutOfRangeError("malformed cpuset '" + std::string(whole) + "'");
    }
    return value;
}

} // anonymous namespace

CoreSet::CoreSet(std::initializer_list<CoreId> cores)
    : cores_(cores) {
    normalize();
}

CoreSet::CoreSet(std::vector<CoreId> cores)
    : cores_(std::move(cores)) {
    normalize();
}

CoreSet CoreSet::first_n(uint32_t count) {
    std::vector<CoreId> cores(count);
    for (uint32_t i = 0; i < count; ++i) {
        cores[i] = i;
    }
    return CoreSet{std::move(cores)};
}

CoreSet CoreSet::parse_cpuset(std::string_view text) {
    // Trailing newline from /proc or docker inspect output
    while (!text.empty() && (text.back() == '\n' || text.back() == ' ')) {
        text.remove_suffix(1);
    }

    std::vector<CoreId> cores;
    std::size_t pos = 0;
    while (!text.empty()) {
        auto comma = text.find(',', pos);
        auto segment = text.substr(pos, comma == std::string_view::npos ? std::string_view::npos
                                                                        : comma - pos);
        auto dash = segment.find('-');
        if (dash == std::string_view::npos) {
            cores.push_back(parse_core(segment, text));
        } else {
            CoreId lo = parse_core(segment.substr(0, dash), text);
            CoreId hi = parse_core(segment.substr(dash + 1), text);
            if (hi < lo) {
                throw OutOfRangeError("descending range in cpuset '" + std::string(text) + "'");
            }
            for (CoreId c = lo; c <= hi; ++c) {
                cores.push_back(c);
            }
        }
        if (comma == std::string_view::npos) {
            break;
        }
        pos = comma + 1;
    }
    return CoreSet{std::move(cores)};
}

bool CoreSet::contains(CoreId core) const noexcept {
    return std::binary_search(cores_.begin(), cores_.end(), core);
}

CoreId CoreSet::max() const {
    if (cores_.empty()) {
        throw InvalidStateError("max() of an empty core set");
    }
    return cores_.back();
}

bool CoreSet::intersects(const CoreSet& other) const noexcept {
    return std::any_of(cores_.begin(), cores_.end(),
                       [&other](CoreId c) { return other.contains(c); });
}

bool CoreSet::is_subset_of(const CoreSet& other) const noexcept {
    return std::includes(other.cores_.begin(), other.cores_.end(),
                         cores_.begin(), cores_.end());
}

CoreSet CoreSet::unite(const CoreSet& other) const {
    std::vector<CoreId> out;
    std::set_union(cores_.begin(), cores_.end(), other.cores_.begin(), other.cores_.end(),
                   std::back_inserter(out));
    return CoreSet{std::move(out)};
}

CoreSet CoreSet::subtract(const CoreSet& other) const {
    std::vector<CoreId> out;
    std::set_difference(cores_.begin(), cores_.end(), other.cores_.begin(), other.cores_.end(),
                        std::back_inserter(out));
    return CoreSet{std::move(out)};
}

CoreSet CoreSet::intersect(const CoreSet& other) const {
    std::vector<CoreId> out;
    std::set_intersection(cores_.begin(), cores_.end(), other.cores_.begin(), other.cores_.end(),
                          std::back_inserter(out));
    return CoreSet{std::move(out)};
}

std::string CoreSet::to_string() const {
    return "[" + to_cpuset() + "]";
}

std::string CoreSet::to_cpuset() const {
    std::ostringstream oss;
    for (std::size_t i = 0; i < cores_.size(); ++i) {
        if (i > 0) {
            oss << ",";
        }
        oss << cores_[i];
    }
    return oss.str();
}

void CoreSet::normalize() {
    std::sort(cores_.begin(), cores_.end());
    cores_.erase(std::unique(cores_.begin(), cores_.end()), cores_.end());
}

} // namespace coloc::core
