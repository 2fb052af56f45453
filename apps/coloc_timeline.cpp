#include <coloc/io/error.hpp>
#include <coloc/io/timeline.hpp>

#include <cxxopts.hpp>

#include <iomanip>
#include <iostream>
#include <string>

namespace {

namespace io = coloc::io;

struct Config {
    std::string event_file;
    std::string subject;
    bool intervals{false};
};

Config parse_args(int argc, char** argv) {
    cxxopts::Options options("coloc-timeline", "Event log replay and continuity check");

    options.add_options()
        ("event-file", "JSON event log", cxxopts::value<std::string>())
        ("s,subject", "Only show intervals of this subject", cxxopts::value<std::string>())
        ("intervals", "List every allocation interval")
        ("h,help", "Show help");

    options.parse_positional({"event-file"});
    options.positional_help("<event-file>");

    auto result = options.parse(argc, argv);

    if (result.count("help") != 0U) {
        std::cout << options.help() << std::endl;
        std::exit(0);
    }

    if (result.count("event-file") == 0U) {
        std::cerr << "Error: event file is required" << std::endl;
        std::cerr << options.help() << std::endl;
        std::exit(64);
    }

    Config config;
    config.event_file = result["event-file"].as<std::string>();
    if (result.count("subject") != 0U) {
        config.subject = result["subject"].as<std::string>();
    }
    config.intervals = result.count("intervals") != 0U || !config.subject.empty();
    return config;
}

void print_interval(const io::AllocationInterval& interval, double origin) {
    std::cout << "  " << std::left << std::setw(20) << interval.subject << std::right
              << std::setw(12) << (interval.start - origin);
    if (interval.end) {
        std::cout << std::setw(12) << (*interval.end - origin);
    } else {
        std::cout << std::setw(12) << "-";
    }
    std::cout << "  " << interval.cores.to_string() << std::endl;
}

} // anonymous namespace

int main(int argc, char** argv) {
    try {
        auto config = parse_args(argc, argv);

        auto records = io::load_event_log(config.event_file);
        auto timeline = io::build_timeline(records);
        const double origin = records.empty() ? 0.0 : records.front().time;

        std::cout << std::fixed << std::setprecision(3);
        std::cout << "=== Colocation Timeline ===" << std::endl;
        std::cout << "Records:   " << records.size() << std::endl;
        std::cout << "Intervals: " << timeline.intervals.size() << std::endl;
        std::cout << std::endl;

        std::cout << "Jobs:" << std::endl;
        for (const auto& job : timeline.jobs) {
            std::cout << "  " << std::left << std::setw(20) << job.subject << std::right;
            if (job.end) {
                std::cout << std::setw(12) << (*job.end - job.start) << " s  " << job.status;
            } else {
                std::cout << std::setw(12) << "-" << "    running";
            }
            std::cout << std::endl;
        }
        if (auto total = timeline.total_elapsed()) {
            std::cout << "Total execution time: " << *total << " s" << std::endl;
        }

        if (config.intervals) {
            std::cout << std::endl << "Allocations (seconds from first record):" << std::endl;
            const auto selected =
                config.subject.empty() ? timeline.intervals : timeline.intervals_of(config.subject);
            for (const auto& interval : selected) {
                print_interval(interval, origin);
            }
        }

        if (!timeline.continuous()) {
            std::cerr << timeline.discontinuities.size() << " discontinuit"
                      << (timeline.discontinuities.size() == 1 ? "y" : "ies") << ":" << std::endl;
            for (const auto& gap : timeline.discontinuities) {
                std::cerr << "  record " << gap.record_index << " (" << gap.subject
                          << "): " << gap.reason << std::endl;
            }
            return 1;
        }
        return 0;
    }
    catch (const io::LoaderError& e) {
        std::cerr << "Load error: " << e.what() << std::endl;
        return 2;
    }
    catch (const cxxopts::exceptions::parsing& e) {
        std::cerr << "Invalid args: " << e.what() << std::endl;
        return 64;
    }
    catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 2;
    }
}
