/**
 * @file main.cpp
 * @brief ThermalGuard daemon entry point.
 * @author Dimitris Kafetzis
 *
 * Wires all modules into the control pipeline:
 *   Config → Logger → HardwareProfiler → SensorAggregator → ThermalController
 *          → ControlAbstraction → MonitoringDaemon → SnapshotRecorder / StatusChannel
 */

#include "control/control_abstraction.hpp"
#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/types.hpp"
#include "daemon/monitoring_daemon.hpp"
#include "daemon/status_channel.hpp"
#include "hardware/profiler.hpp"
#include "platform/command_runner.hpp"
#include "sensors/aggregator.hpp"
#include "telemetry/json_sink.hpp"
#include "telemetry/snapshot_recorder.hpp"
#include "thermal/thermal_controller.hpp"

#include <chrono>
#include <csignal>
#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <thread>

using namespace thermal_guard;

namespace {

volatile std::sig_atomic_t g_shutdown_requested = 0;

void signal_handler(int /*signal*/) {
    g_shutdown_requested = 1;
}

enum class Command { Run, Detect, Status, SetProfile };

struct CLIArgs {
    std::filesystem::path config_path = "config/default.toml";
    std::optional<double> interval_s;
    std::string log_dir;
    bool no_auto_fan = false;
    Command command = Command::Run;
    std::string profile_name;
};

void print_usage() {
    std::cout << "Usage: thermal_guard [OPTIONS]\n"
              << "  --config <path>        Configuration file (default: config/default.toml)\n"
              << "  --interval <seconds>   Poll interval override\n"
              << "  --log-dir <path>       Log output directory\n"
              << "  --no-auto-fan          Leave fans under firmware control\n"
              << "  --detect               Print the detected hardware profile, then exit\n"
              << "  --status               Run one observe-only cycle and print the status\n"
              << "  --set-profile <name>   Apply performance|balanced|powersave|emergency once\n"
              << "  --help, -h             Show this help message\n";
}

std::optional<CLIArgs> parse_args(int argc, char* argv[]) {
    CLIArgs args;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            args.config_path = argv[++i];
        } else if (arg == "--interval" && i + 1 < argc) {
            try {
                args.interval_s = std::stod(argv[++i]);
            } catch (const std::exception&) {
                std::cerr << "Invalid --interval value: " << argv[i] << '\n';
                return std::nullopt;
            }
        } else if (arg == "--log-dir" && i + 1 < argc) {
            args.log_dir = argv[++i];
        } else if (arg == "--no-auto-fan") {
            args.no_auto_fan = true;
        } else if (arg == "--detect") {
            args.command = Command::Detect;
        } else if (arg == "--status") {
            args.command = Command::Status;
        } else if (arg == "--set-profile" && i + 1 < argc) {
            args.command = Command::SetProfile;
            args.profile_name = argv[++i];
        } else if (arg == "--help" || arg == "-h") {
            print_usage();
            std::exit(0);
        } else {
            std::cerr << "Unknown option: " << arg << '\n';
            print_usage();
            return std::nullopt;
        }
    }
    return args;
}

}  // namespace

int main(int argc, char* argv[]) {
    auto parsed = parse_args(argc, argv);
    if (!parsed) return 2;
    const auto args = *parsed;

    // Load configuration
    auto config_result = load_config(args.config_path);
    if (!config_result) {
        if (config_result.error().code == ErrorCode::ConfigInvalid) {
            std::cerr << "Invalid config: " << config_result.error().message << std::endl;
            return 1;
        }
        std::cerr << "Failed to load config: " << config_result.error().message << std::endl;
        std::cerr << "Using default configuration." << std::endl;
    }
    auto config = config_result ? *config_result : default_config();

    // Apply CLI overrides
    if (args.interval_s) {
        auto ms = poll_interval_from_seconds(*args.interval_s);
        if (!ms) {
            std::cerr << "Invalid --interval: " << ms.error().message << std::endl;
            return 2;
        }
        config.daemon.poll_interval_ms = *ms;
    }
    if (!args.log_dir.empty()) config.telemetry.log_dir = args.log_dir;
    if (args.no_auto_fan) config.daemon.auto_fan_control = false;

    // ── Initialize Logger ────────────────────
    // Interactive commands log to stderr so their stdout stays machine-readable.
    std::unique_ptr<ILogSink> log_sink;
    if (args.command == Command::Run && !config.telemetry.log_dir.empty()) {
        log_sink = std::make_unique<JsonFileSink>(config.telemetry.log_dir, "thermal_guard",
                                                  config.telemetry.max_file_size_mb,
                                                  config.telemetry.rotate_count);
    } else {
        log_sink = std::make_unique<StderrSink>();
    }
    Logger logger(std::move(log_sink), parse_log_level(config.telemetry.log_level));
    logger.info("ThermalGuard starting...");

    // ── Hardware Detection ───────────────────
    ProcessCommandRunner runner;
    HardwareProfiler profiler({config.sensors.sysfs_root, config.sensors.procfs_root,
                               config.sensors.dev_root},
                              runner, logger, config.thermal, config.frequency);
    auto detected = profiler.detect();
    if (!detected) {
        logger.error("Hardware detection failed: " + detected.error().message);
        logger.flush();
        std::cerr << "Fatal: " << detected.error().message << std::endl;
        return 1;
    }
    auto hardware = std::make_shared<const HardwareProfile>(std::move(*detected));

    if (args.command == Command::Detect) {
        std::cout << HardwareProfiler::describe(*hardware) << std::endl;
        return 0;
    }

    auto control = make_control_abstraction(hardware, config, profiler.multipliers(),
                                            runner, logger);

    if (args.command == Command::SetProfile) {
        auto profile = parse_power_profile(args.profile_name);
        if (!profile) {
            std::cerr << "Unknown profile: " << args.profile_name << std::endl;
            return 2;
        }
        auto app = control->apply_profile(*profile, config.daemon.auto_fan_control);
        std::cout << "frequency: " << app.frequency.khz << " kHz, "
                  << app.frequency_outcome.summary() << '\n';
        if (app.fan_outcome) std::cout << "fan: " << app.fan_outcome->summary() << '\n';
        if (app.gpu_power_outcome) {
            std::cout << "gpu power: " << app.gpu_power_outcome->summary() << '\n';
        }
        std::cout << "platform profile: " << app.platform_profile_outcome.summary()
                  << std::endl;
        return app.fully_applied() ? 0 : 1;
    }

    // ── Sensors, Controller, Telemetry ───────
    SensorAggregator aggregator(make_default_backends(config.sensors, runner), logger,
                                Duration{config.sensors.backend_timeout_ms},
                                config.sensors.worker_threads);
    logger.info("Sensor aggregator: " + std::to_string(aggregator.backend_count())
                + " backends, " + std::to_string(aggregator.timeout().count())
                + " ms deadline");

    ThermalController controller(hardware->thermal_limits, config.thermal.hysteresis_margin_c,
                                 config.thermal.escalation_bound);

    std::unique_ptr<ILogSink> snapshot_sink;
    if (args.command == Command::Status) {
        snapshot_sink = std::make_unique<NullSink>();
    } else {
        snapshot_sink = std::make_unique<JsonFileSink>(
            config.telemetry.log_dir, config.telemetry.snapshot_file,
            config.telemetry.max_file_size_mb, config.telemetry.rotate_count);
    }
    SnapshotRecorder recorder(std::move(snapshot_sink));
    StatusChannel status(logger);

    auto options = DaemonOptions::from_config(config);
    options.apply_controls = args.command == Command::Run;
    MonitoringDaemon<SensorAggregator> daemon(aggregator, controller, *control, recorder,
                                              status, logger, options);

    if (args.command == Command::Status) {
        auto snapshot = daemon.run_cycle();
        std::cout << to_json(*snapshot) << std::endl;
        return 0;
    }

    // Register signal handlers
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    status.subscribe([&logger](const DaemonStatus& s) {
        if (s.decision.transitioned) {
            logger.info("priority recommendation: nice "
                        + std::to_string(s.decision.priority.nice)
                        + (s.decision.priority.max_cores
                               ? ", max cores " + std::to_string(*s.decision.priority.max_cores)
                               : std::string{}));
        }
    });

    // ── Main Control Loop ────────────────────
    logger.info("Entering control loop. Press Ctrl+C to shutdown.");
    std::jthread loop([&daemon](std::stop_token stop) { daemon.run(stop); });

    while (!g_shutdown_requested) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }

    // ── Graceful Shutdown ────────────────────
    logger.info("Shutdown requested. Cleaning up...");
    loop.request_stop();
    loop.join();
    recorder.flush();

    logger.info("ThermalGuard stopped.");
    logger.flush();
    return 0;
}
