#include <coloc/io/config_loader.hpp>
#include <coloc/io/error.hpp>

#include <coloc/core/error.hpp>

#include <rapidjson/document.h>
#include <rapidjson/error/en.h>

#include <fstream>
#include <set>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

namespace coloc::io {

namespace {

using namespace coloc::core;

const rapidjson::Value& get_member(const rapidjson::Value& obj, const char* name,
                                   const std::string& context) {
    if (!obj.HasMember(name)) {
        throw LoaderError(std::string("missing required field '") + name + "'", context);
    }
    return obj[name];
}

std::string get_string(const rapidjson::Value& obj, const char* name, const std::string& context) {
    const auto& member = get_member(obj, name, context);
    if (!member.IsString()) {
        throw LoaderError(std::string("field '") + name + "' must be a string", context);
    }
    return member.GetString();
}

std::string get_string_or(const rapidjson::Value& obj, const char* name,
                          const std::string& context, std::string default_val) {
    if (!obj.HasMember(name)) {
        return default_val;
    }
    return get_string(obj, name, context);
}

double get_double_or(const rapidjson::Value& obj, const char* name, const std::string& context,
                     double default_val) {
    if (!obj.HasMember(name)) {
        return default_val;
    }
    const auto& member = obj[name];
    if (!member.IsNumber()) {
        throw LoaderError(std::string("field '") + name + "' must be a number", context);
    }
    return member.GetDouble();
}

uint32_t get_uint_or(const rapidjson::Value& obj, const char* name, const std::string& context,
                     uint32_t default_val) {
    if (!obj.HasMember(name)) {
        return default_val;
    }
    const auto& member = obj[name];
    if (!member.IsUint()) {
        throw LoaderError(std::string("field '") + name + "' must be a non-negative integer",
                          context);
    }
    return member.GetUint();
}

const rapidjson::Value& get_object(const rapidjson::Value& obj, const char* name,
                                   const std::string& context) {
    const auto& member = get_member(obj, name, context);
    if (!member.IsObject()) {
        throw LoaderError(std::string("field '") + name + "' must be an object", context);
    }
    return member;
}

const rapidjson::Value& get_array(const rapidjson::Value& obj, const char* name,
                                  const std::string& context) {
    const auto& member = get_member(obj, name, context);
    if (!member.IsArray()) {
        throw LoaderError(std::string("field '") + name + "' must be an array", context);
    }
    return member;
}

Duration get_duration_ms_or(const rapidjson::Value& obj, const char* name,
                            const std::string& context, Duration default_val) {
    if (!obj.HasMember(name)) {
        return default_val;
    }
    return duration_from_seconds(get_double_or(obj, name, context, 0.0) / 1000.0);
}

Duration get_duration_s_or(const rapidjson::Value& obj, const char* name,
                           const std::string& context, Duration default_val) {
    if (!obj.HasMember(name)) {
        return default_val;
    }
    auto value = get_double_or(obj, name, context, 0.0);
    if (value < 0.0) {
        throw LoaderError(std::string("field '") + name + "' must not be negative", context);
    }
    return duration_from_seconds(value);
}

CoreSet parse_cores(const rapidjson::Value& value, const std::string& context) {
    if (!value.IsArray()) {
        throw LoaderError("core list must be an array", context);
    }
    std::vector<CoreId> cores;
    for (rapidjson::SizeType idx = 0; idx < value.Size(); ++idx) {
        if (!value[idx].IsUint()) {
            throw LoaderError("core ids must be non-negative integers", context);
        }
        cores.push_back(value[idx].GetUint());
    }
    if (cores.empty()) {
        throw LoaderError("core list must not be empty", context);
    }
    return CoreSet{std::move(cores)};
}

CoreSet get_cores_or(const rapidjson::Value& obj, const char* name, const std::string& context,
                     CoreSet default_val) {
    if (!obj.HasMember(name)) {
        return default_val;
    }
    return parse_cores(obj[name], context + "." + name);
}

std::vector<std::string> parse_command(const rapidjson::Value& job, const std::string& context) {
    if (!job.HasMember("command")) {
        return {};
    }
    const auto& command = job["command"];
    std::vector<std::string> argv;
    if (command.IsString()) {
        std::istringstream words(command.GetString());
        std::string word;
        while (words >> word) {
            argv.push_back(word);
        }
        return argv;
    }
    if (!command.IsArray()) {
        throw LoaderError("field 'command' must be a string or an array of strings", context);
    }
    for (rapidjson::SizeType idx = 0; idx < command.Size(); ++idx) {
        if (!command[idx].IsString()) {
            throw LoaderError("command arguments must be strings", context);
        }
        argv.emplace_back(command[idx].GetString());
    }
    return argv;
}

std::vector<JobSpec> load_jobs(const rapidjson::Value& doc) {
    const auto& jobs = get_array(doc, "jobs", "config");
    if (jobs.Empty()) {
        throw LoaderError("at least one job is required", "jobs");
    }

    std::vector<JobSpec> specs;
    std::set<std::string> names;
    for (rapidjson::SizeType idx = 0; idx < jobs.Size(); ++idx) {
        std::string ctx = "jobs[" + std::to_string(idx) + "]";
        const auto& job = jobs[idx];
        if (!job.IsObject()) {
            throw LoaderError("job must be an object", ctx);
        }

        JobSpec spec;
        spec.name = get_string(job, "name", ctx);
        if (!names.insert(spec.name).second) {
            throw LoaderError("duplicate job name '" + spec.name + "'", ctx);
        }
        spec.command = parse_command(job, ctx);
        spec.image = get_string_or(job, "image", ctx, "");
        if (job.HasMember("threads")) {
            auto threads = get_uint_or(job, "threads", ctx, 0);
            if (threads == 0) {
                throw LoaderError("field 'threads' must be positive", ctx);
            }
            spec.threads = threads;
        }
        if (spec.command.empty() && spec.image.empty()) {
            throw LoaderError("job needs a command or an image", ctx);
        }
        specs.push_back(std::move(spec));
    }
    return specs;
}

host::RunnerSettings load_runner(const rapidjson::Value& doc) {
    host::RunnerSettings settings;
    if (!doc.HasMember("runner")) {
        return settings;
    }
    const auto& runner = get_object(doc, "runner", "config");
    const std::string ctx = "runner";

    auto kind_name = get_string_or(runner, "kind", ctx, std::string(host::to_string(settings.kind)));
    auto kind = host::parse_runner_kind(kind_name);
    if (!kind) {
        throw LoaderError("unknown runner kind '" + kind_name + "'", ctx);
    }
    settings.kind = *kind;
    settings.grace_period = get_duration_s_or(runner, "grace_period_s", ctx, settings.grace_period);
    settings.command_timeout =
        get_duration_s_or(runner, "command_timeout_s", ctx, settings.command_timeout);
    if (settings.command_timeout <= Duration::zero()) {
        throw LoaderError("field 'command_timeout_s' must be positive", ctx);
    }
    settings.status_timeout =
        get_duration_s_or(runner, "status_timeout_s", ctx, settings.status_timeout);
    if (settings.status_timeout <= Duration::zero()) {
        throw LoaderError("field 'status_timeout_s' must be positive", ctx);
    }
    settings.name_prefix = get_string_or(runner, "name_prefix", ctx, settings.name_prefix);
    settings.docker_binary = get_string_or(runner, "docker_binary", ctx, settings.docker_binary);
    if (runner.HasMember("output_dir")) {
        settings.output_dir = get_string(runner, "output_dir", ctx);
    }
    return settings;
}

ControllerConfig load_controller(const rapidjson::Value& doc, uint32_t online_cores) {
    ControllerConfig config;
    auto& layout = config.layout;
    layout.core_count = get_uint_or(doc, "cores", "config", online_cores);

    if (doc.HasMember("service")) {
        const auto& service = get_object(doc, "service", "config");
        config.service_process = get_string_or(service, "process", "service", config.service_process);
        layout.home = get_cores_or(service, "home_cores", "service", CoreSet{0});
        layout.shared = get_cores_or(service, "shared_cores", "service", CoreSet{1});
    } else {
        layout.home = CoreSet{0};
        layout.shared = CoreSet{1};
    }

    if (doc.HasMember("slots")) {
        const auto& slots = get_array(doc, "slots", "config");
        for (rapidjson::SizeType idx = 0; idx < slots.Size(); ++idx) {
            layout.slots.push_back(parse_cores(slots[idx], "slots[" + std::to_string(idx) + "]"));
        }
    } else {
        layout.slots.push_back(layout.all_cores().subtract(layout.home));
    }

    if (doc.HasMember("thresholds")) {
        const auto& thresholds = get_object(doc, "thresholds", "config");
        auto& t = config.thresholds;
        t.high = get_double_or(thresholds, "high", "thresholds", t.high);
        t.low = get_double_or(thresholds, "low", "thresholds", t.low);
        t.eviction = get_double_or(thresholds, "eviction", "thresholds", t.eviction);
        t.restore = get_double_or(thresholds, "restore", "thresholds", t.low);
    }

    config.tick_interval = get_duration_ms_or(doc, "tick_interval_ms", "config", config.tick_interval);
    config.max_start_attempts =
        get_uint_or(doc, "max_start_attempts", "config", config.max_start_attempts);
    return config;
}

} // anonymous namespace

RunConfig load_config(const std::filesystem::path& path, uint32_t online_cores) {
    std::ifstream file(path);
    if (!file) {
        throw LoaderError("cannot open file", path.string());
    }

    std::ostringstream oss;
    oss << file.rdbuf();
    return load_config_from_string(oss.str(), online_cores);
}

RunConfig load_config_from_string(std::string_view json, uint32_t online_cores) {
    rapidjson::Document doc;
    doc.Parse(json.data(), json.size());

    if (doc.HasParseError()) {
        throw LoaderError(
            std::string("JSON parse error: ") + rapidjson::GetParseError_En(doc.GetParseError()),
            "at offset " + std::to_string(doc.GetErrorOffset()));
    }

    if (!doc.IsObject()) {
        throw LoaderError("root must be an object", "config");
    }

    RunConfig config;
    config.controller = load_controller(doc, online_cores);
    try {
        config.controller.validate();
    } catch (const ControllerError& e) {
        throw LoaderError(e.what(), "config");
    }

    try {
        config.jobs = JobCatalog(load_jobs(doc));
    } catch (const ControllerError& e) {
        throw LoaderError(e.what(), "jobs");
    }
    config.runner = load_runner(doc);
    if (config.runner.status_timeout >= config.controller.tick_interval) {
        throw LoaderError("field 'status_timeout_s' must be shorter than the tick interval", "runner");
    }
    config.sample_interval =
        get_duration_ms_or(doc, "sample_interval_ms", "config", config.sample_interval);
    if (config.sample_interval <= Duration::zero()) {
        throw LoaderError("field 'sample_interval_ms' must be positive", "config");
    }
    return config;
}

} // namespace coloc::io
