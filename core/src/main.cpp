// minekeeper
// Keeps one miner process running and productive

#include <filesystem>
#include <iostream>
#include <string>

#include "health/health_prober.hpp"
#include "logging/logger.hpp"
#include "process/command_runner.hpp"
#include "process/process_controller.hpp"
#include "runtime/config.hpp"
#include "runtime/signal_handler.hpp"
#include "supervisor/clock.hpp"
#include "supervisor/supervisor.hpp"

int main(int argc, char **argv) {
    // Parse CLI arguments
    std::string config_path = "minekeeper.yaml";  // Default

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--config" && i + 1 < argc) {
            config_path = argv[++i];
        } else if (arg.substr(0, 9) == "--config=") {
            config_path = arg.substr(9);
        } else if (arg == "--help" || arg == "-h") {
            std::cerr << "Usage: minekeeper [OPTIONS]\n\n";
            std::cerr << "Options:\n";
            std::cerr << "  --config=PATH    Path to config file (default: minekeeper.yaml)\n";
            std::cerr << "  --help, -h       Show this help\n";
            return 0;
        } else {
            std::cerr << "Unknown argument: " << arg << "\n";
            std::cerr << "Use --help for usage information\n";
            return 1;
        }
    }

    // Check if config exists
    if (!std::filesystem::exists(config_path)) {
        // Using cerr here as logger might not be initialized/configured
        std::cerr << "ERROR: Config file not found: " << config_path << "\n";
        std::cerr << "\nCreate a config file or specify path with --config=PATH\n";
        return 1;
    }

    LOG_INFO("minekeeper starting...");
    LOG_INFO("Loading config: " + config_path);

    minekeeper::runtime::KeeperConfig config;
    std::string error;

    if (!minekeeper::runtime::load_config(config_path, config, error)) {
        LOG_ERROR("Failed to load config: " + error);
        return 1;
    }

    minekeeper::logging::Logger::set_level(minekeeper::logging::string_to_level(config.logging.level));

    if (!config.logging.file.empty()) {
        if (!minekeeper::logging::Logger::open_file(config.logging.file, error)) {
            LOG_ERROR(error);
            return 1;
        }
        LOG_INFO("Logging to " << config.logging.file);
    }

    minekeeper::runtime::SignalHandler::install();

    minekeeper::process::ProcessController controller;
    minekeeper::process::ShellCommandRunner commands;
    minekeeper::health::HealthProber prober;
    minekeeper::supervisor::SystemClock clock;

    minekeeper::supervisor::Supervisor supervisor(config, controller, prober, commands, clock);

    LOG_INFO("Press Ctrl+C to exit (the worker keeps running)");

    // Run supervision loop (blocking)
    supervisor.run();

    minekeeper::logging::Logger::close_file();
    return 0;
}
