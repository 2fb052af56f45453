#include <coloc/core/job.hpp>
#include <coloc/core/error.hpp>

#include <unordered_set>

namespace coloc::core {

std::string_view to_string(JobState state) noexcept {
    switch (state) {
        case JobState::Queued:    return "queued";
        case JobState::Running:   return "running";
        case JobState::Paused:    return "paused";
        case JobState::Completed: return "completed";
        case JobState::Failed:    return "failed";
    }
    return "unknown";
}

JobCatalog::JobCatalog(std::vector<JobSpec> specs)
    : specs_(std::move(specs)) {
    std::unordered_set<std::string> seen;
    for (const auto& spec : specs_) {
        if (spec.name.empty()) {
            throw InvalidStateError("job name cannot be empty");
        }
        if (spec.name == "service" || spec.name == "scheduler") {
            throw InvalidStateError("job name '" + spec.name + "' is reserved");
        }
        if (!seen.insert(spec.name).second) {
            throw InvalidStateError("duplicate job name '" + spec.name + "'");
        }
    }
}

std::optional<JobId> JobCatalog::find(std::string_view name) const {
    for (std::size_t i = 0; i < specs_.size(); ++i) {
        if (specs_[i].name == name) {
            return JobId{static_cast<uint32_t>(i)};
        }
    }
    return std::nullopt;
}

const JobSpec& JobCatalog::spec(JobId id) const {
    if (id.index() >= specs_.size()) {
        throw OutOfRangeError("job id " + std::to_string(id.index()) + " not in catalog");
    }
    return specs_[id.index()];
}

std::vector<JobId> JobCatalog::ids() const {
    std::vector<JobId> out;
    out.reserve(specs_.size());
    for (std::size_t i = 0; i < specs_.size(); ++i) {
        out.push_back(JobId{static_cast<uint32_t>(i)});
    }
    return out;
}

std::string subject_name(const Subject& subject, const JobCatalog& catalog) {
    if (std::holds_alternative<ServiceSubject>(subject)) {
        return "service";
    }
    if (std::holds_alternative<SchedulerSubject>(subject)) {
        return "scheduler";
    }
    return catalog.name(std::get<JobId>(subject));
}

} // namespace coloc::core
