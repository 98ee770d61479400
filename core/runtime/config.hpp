#pragma once

#include <string>

#include "../health/health_endpoint.hpp"
#include "../supervisor/supervisor_config.hpp"

namespace minekeeper {
namespace runtime {

struct LoggingConfig {
    std::string level = "info";  // debug, info, warn, error
    std::string file;            // Append-only log file, empty disables
};

// Everything the keeper needs, loaded once at start-up and passed by reference
struct KeeperConfig {
    supervisor::WorkerSpec worker;
    health::HealthEndpoint health;
    supervisor::RestartPolicyConfig policy;
    LoggingConfig logging;
};

// Loads configuration from a YAML file
bool load_config(const std::string &config_path, KeeperConfig &config, std::string &error);

// Validates the configuration
bool validate_config(const KeeperConfig &config, std::string &error);

}  // namespace runtime
}  // namespace minekeeper
