#include <coloc/core/clock.hpp>
#include <coloc/core/controller.hpp>
#include <coloc/core/error.hpp>
#include <coloc/core/event_log.hpp>
#include <coloc/core/job_runner.hpp>

#include <coloc/host/affinity.hpp>
#include <coloc/host/docker_runner.hpp>
#include <coloc/host/proc_fs.hpp>
#include <coloc/host/proc_stat_monitor.hpp>
#include <coloc/host/process_runner.hpp>
#include <coloc/host/runner_settings.hpp>

#include <coloc/io/config_loader.hpp>
#include <coloc/io/error.hpp>
#include <coloc/io/event_writers.hpp>

#include <cxxopts.hpp>

#include <unistd.h>

#include <atomic>
#include <csignal>
#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace {

namespace core = coloc::core;
namespace host = coloc::host;
namespace io = coloc::io;

std::atomic<bool> g_stop_requested{false};

extern "C" void on_stop_signal(int /*signal*/) {
    g_stop_requested.store(true);
}

struct Config {
    std::string config_file;
    std::string output_file{"coloc_events.json"};
    io::EventFormat format{io::EventFormat::Json};
    std::optional<std::string> runner;
    std::optional<double> high;
    std::optional<double> low;
    std::optional<double> eviction;
    std::optional<double> restore;
    std::optional<int64_t> tick_ms;
    bool console{true};
    bool color{true};
    bool verbose{false};
};

template <typename T>
std::optional<T> optional_value(const cxxopts::ParseResult& result, const std::string& name) {
    if (result.count(name) == 0U) {
        return std::nullopt;
    }
    return result[name].as<T>();
}

Config parse_args(int argc, char** argv) {
    cxxopts::Options options("colocd", "Core-colocation controller for a latency-critical service");

    options.add_options()
        ("c,config", "Run configuration (JSON)", cxxopts::value<std::string>())
        ("o,output", "Event log output, - for stdout (default: coloc_events.json)",
         cxxopts::value<std::string>()->default_value("coloc_events.json"))
        ("format", "Event log format: json|log|null (default: json)", cxxopts::value<std::string>()->default_value("json"))
        ("runner", "Override the job runner: process|docker", cxxopts::value<std::string>())
        ("high", "Override the colocation threshold (%)", cxxopts::value<double>())
        ("low", "Override the release threshold (%)", cxxopts::value<double>())
        ("eviction", "Override the eviction threshold (%)", cxxopts::value<double>())
        ("restore", "Override the readmission threshold (%)", cxxopts::value<double>())
        ("tick-ms", "Override the tick interval in ms", cxxopts::value<int64_t>())
        ("quiet", "Do not mirror events on stderr")
        ("no-color", "Disable colors in the stderr event log")
        ("v,verbose", "Verbose output")
        ("h,help", "Show help");

    auto result = options.parse(argc, argv);

    if (result.count("help") != 0U) {
        std::cout << options.help() << std::endl;
        std::exit(0);
    }

    if (result.count("config") == 0U) {
        std::cerr << "Error: --config is required" << std::endl;
        std::exit(64);
    }

    Config config;
    config.config_file = result["config"].as<std::string>();
    config.output_file = result["output"].as<std::string>();
    config.runner = optional_value<std::string>(result, "runner");
    config.high = optional_value<double>(result, "high");
    config.low = optional_value<double>(result, "low");
    config.eviction = optional_value<double>(result, "eviction");
    config.restore = optional_value<double>(result, "restore");
    config.tick_ms = optional_value<int64_t>(result, "tick-ms");
    config.console = result.count("quiet") == 0U;
    config.color = result.count("no-color") == 0U && ::isatty(STDERR_FILENO) != 0;
    config.verbose = result.count("verbose") != 0U;

    const auto format_name = result["format"].as<std::string>();
    auto format = io::parse_event_format(format_name);
    if (!format) {
        std::cerr << "Error: unknown format '" << format_name << "'" << std::endl;
        std::exit(64);
    }
    config.format = *format;
    return config;
}

void apply_overrides(const Config& config, io::RunConfig& run) {
    auto& thresholds = run.controller.thresholds;
    if (config.high) {
        thresholds.high = *config.high;
    }
    if (config.low) {
        thresholds.low = *config.low;
    }
    if (config.eviction) {
        thresholds.eviction = *config.eviction;
    }
    if (config.restore) {
        thresholds.restore = *config.restore;
    }
    if (config.tick_ms) {
        if (*config.tick_ms <= 0) {
            throw io::LoaderError("--tick-ms must be positive");
        }
        run.controller.tick_interval = core::duration_from_milliseconds(*config.tick_ms);
    }
    if (config.runner) {
        auto kind = host::parse_runner_kind(*config.runner);
        if (!kind) {
            throw io::LoaderError("unknown runner '" + *config.runner + "'");
        }
        run.runner.kind = *kind;
    }
    if (run.runner.status_timeout >= run.controller.tick_interval) {
        throw io::LoaderError("--tick-ms must exceed the runner's status timeout");
    }
    // Overridden thresholds must still be consistent
    run.controller.validate();
}

std::unique_ptr<core::JobRunner> make_runner(const host::RunnerSettings& settings,
                                             core::Clock& clock, const host::ProcFs& fs,
                                             bool verbose) {
    switch (settings.kind) {
        case host::RunnerKind::Process:
            return std::make_unique<host::ProcessJobRunner>(clock, settings, fs);
        case host::RunnerKind::Docker: {
            auto runner = std::make_unique<host::DockerJobRunner>(settings);
            auto cleaned = runner->remove_leftovers();
            if (!cleaned) {
                std::cerr << "Warning: cannot remove leftover containers: "
                          << cleaned.error().message << std::endl;
            } else if (verbose) {
                std::cerr << "Removed leftover containers named " << settings.name_prefix << "*"
                          << std::endl;
            }
            return runner;
        }
    }
    throw io::LoaderError("unsupported runner kind");
}

} // anonymous namespace

int main(int argc, char** argv) {
    try {
        auto config = parse_args(argc, argv);

        // 1. Load and check the configuration
        if (config.verbose) {
            std::cerr << "Loading configuration from: " << config.config_file << std::endl;
        }
        auto run = io::load_config(config.config_file, host::online_core_count());
        apply_overrides(config, run);

        if (config.verbose) {
            const auto& layout = run.controller.layout;
            std::cerr << "Service " << run.controller.service_process << " home "
                      << layout.home.to_string() << " shared " << layout.shared.to_string()
                      << ", " << layout.slots.size() << " slot(s), " << run.jobs.size()
                      << " job(s), runner " << host::to_string(run.runner.kind) << std::endl;
        }

        // 2. Open the event log before anything is started
        std::ofstream outfile;
        std::ostream* out = &std::cout;
        if (config.format != io::EventFormat::Null && config.output_file != "-") {
            outfile.open(config.output_file);
            if (!outfile) {
                std::cerr << "Error: cannot open output file: " << config.output_file << std::endl;
                return 2;
            }
            out = &outfile;
        }

        auto file_writer = io::make_event_writer(config.format, *out);
        std::vector<core::EventWriter*> sinks{file_writer.get()};
        std::unique_ptr<io::SchedulerLogWriter> console;
        if (config.console) {
            console = std::make_unique<io::SchedulerLogWriter>(std::cerr, config.color);
            sinks.push_back(console.get());
        }
        io::TeeEventWriter writer(sinks);

        // 3. Host collaborators
        core::SystemClock clock;
        host::ProcFs fs;
        host::ProcStatMonitor monitor(fs, clock, run.sample_interval, run.controller.layout.core_count);
        host::ProcessAffinityController affinity(fs);
        auto runner = make_runner(run.runner, clock, fs, config.verbose);

        core::EventLog log(writer, clock, run.jobs);
        core::ColocationController controller(run.controller, run.jobs, monitor, affinity, *runner,
                                              log, clock);

        // 4. Run until drained or interrupted
        std::signal(SIGINT, on_stop_signal);
        std::signal(SIGTERM, on_stop_signal);

        if (config.verbose) {
            std::cerr << "Starting controller..." << std::endl;
        }
        auto outcome = controller.run(g_stop_requested);

        switch (outcome) {
            case core::RunOutcome::Drained:
                if (config.verbose) {
                    std::cerr << "All jobs finished" << std::endl;
                }
                return 0;
            case core::RunOutcome::Interrupted:
                if (config.verbose) {
                    std::cerr << "Interrupted, cleanup complete" << std::endl;
                }
                return 0;
            case core::RunOutcome::InterruptedIncomplete:
                std::cerr << "Interrupted, some jobs could not be stopped" << std::endl;
                return 3;
        }
        return 0;
    }
    catch (const io::LoaderError& e) {
        std::cerr << "Config error: " << e.what() << std::endl;
        return 1;
    }
    catch (const core::ControllerError& e) {
        std::cerr << "Config error: " << e.what() << std::endl;
        return 1;
    }
    catch (const cxxopts::exceptions::parsing& e) {
        std::cerr << "Invalid args: " << e.what() << std::endl;
        return 64;
    }
    catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
