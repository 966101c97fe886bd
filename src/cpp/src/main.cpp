#include <chrono>
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <string>
#include <thread>

#include "nexstar/config.hpp"
#include "nexstar/controller.hpp"
#include "nexstar/logging.hpp"
#include "nexstar/tracker.hpp"

namespace {

struct Args {
    std::string config_path;
    double seconds = 30.0;
    bool help = false;
};

void print_usage(const char* prog) {
    std::cout
        << "Usage: " << prog << " [CONFIG] [SECONDS]\n"
        << "\n"
        << "Monitor the position of a NexStar telescope mount\n"
        << "\n"
        << "Arguments:\n"
        << "  CONFIG    Config file (default: ~/.nexstar_config)\n"
        << "  SECONDS   How long to monitor (default: 30)\n"
        << "  -h, --help  Show this help message\n";
}

bool parse_args(int argc, char* argv[], Args& args) {
    int positional = 0;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            args.help = true;
            return true;
        }
        if (positional == 0) {
            args.config_path = arg;
        } else if (positional == 1) {
            try {
                args.seconds = std::stod(arg);
            } catch (const std::exception&) {
                std::cerr << "Error: SECONDS must be a number, got '" << arg << "'\n";
                return false;
            }
            if (!(args.seconds > 0.0)) {
                std::cerr << "Error: SECONDS must be positive\n";
                return false;
            }
        } else {
            std::cerr << "Unexpected argument: " << arg << "\n";
            return false;
        }
        ++positional;
    }
    return true;
}

void print_status(const nexstar::TrackerStatus& status) {
    std::cout << "[" << nexstar::to_string(status.phase) << "] ";
    if (!status.last_sample) {
        std::cout << "no position yet";
        if (status.error_count > 0) {
            std::cout << " (errors: " << status.error_count << ")";
        }
        std::cout << "\n";
        return;
    }
    const auto& s = *status.last_sample;
    std::cout << std::fixed << std::setprecision(4)
              << "RA " << s.ra_hours << "h  Dec " << s.dec_degrees << "°  "
              << std::setprecision(2)
              << "Alt " << s.altitude << "°  Az " << s.azimuth << "°  "
              << "speed " << status.velocity.total_deg_per_sec << "°/s  "
              << status.freshness;
    if (status.slewing) {
        std::cout << "  SLEWING";
    }
    if (status.alert_active) {
        std::cout << "  ALERT";
    }
    std::cout << "\n";
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    Args args;
    if (!parse_args(argc, argv, args)) {
        print_usage(argv[0]);
        return 1;
    }

    if (args.help) {
        print_usage(argv[0]);
        return 0;
    }

    try {
        nexstar::Config config(args.config_path);
        config.load();
        nexstar::set_verbose_logging(config.verbose());

        nexstar::TrackerOptions options = config.tracker_options();
        nexstar::TelescopeController controller(config.connection_config());
        nexstar::ScopedConnection connection(controller);

        std::cout << "Telescope: " << connection->get_info().to_string() << "\n";

        nexstar::PositionTracker tracker(controller, options);
        tracker.start();

        using clock = std::chrono::steady_clock;
        const auto end = clock::now() + std::chrono::duration_cast<clock::duration>(
            std::chrono::duration<double>(args.seconds));
        const auto period = std::chrono::duration<double>(options.poll_interval);
        while (clock::now() < end) {
            std::this_thread::sleep_for(period);
            nexstar::TrackerStatus status = tracker.get_status();
            print_status(status);
            if (!status.running) {
                std::cerr << "Tracking stopped after " << status.error_count
                          << " consecutive errors\n";
                break;
            }
        }
        tracker.stop();

        nexstar::TrackerStatistics stats = tracker.get_statistics();
        std::cout << std::fixed << std::setprecision(2)
                  << "Samples: " << stats.sample_count << "\n"
                  << "Duration: " << stats.duration_seconds << " s\n"
                  << "Drift: " << stats.drift_degrees * 3600.0 << " arcsec"
                  << " (RA " << stats.ra_drift_arcsec
                  << ", Dec " << stats.dec_drift_arcsec << ")\n";
    } catch (const nexstar::NexStarError& e) {
        std::cerr << "Telescope error: " << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
