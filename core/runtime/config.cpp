#include "config.hpp"

#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

#include "../health/throughput_parsers.hpp"
#include "../logging/logger.hpp"

namespace minekeeper {
namespace runtime {

namespace {
// Upper bounds keep every duration well inside steady_clock's range
constexpr int kMaxMinutes = 60 * 24 * 365;  // One year
constexpr int kMaxSeconds = kMaxMinutes * 60;
}  // namespace

// Helper to parse the response format tag
std::optional<health::ResponseFormat> parse_response_format(const std::string &format_str) {
    std::string s = format_str;
    std::transform(s.begin(), s.end(), s.begin(), ::tolower);
    if (s == "json") {
        return health::ResponseFormat::JSON;
    }
    return std::nullopt;
}

bool validate_config(const KeeperConfig &config, std::string &error) {
    // Validate worker settings
    if (config.worker.executable.empty()) {
        error = "worker.executable must be set";
        return false;
    }

    // Validate health endpoint
    if (config.health.host.empty()) {
        error = "health.host must not be empty";
        return false;
    }
    if (config.health.port < 1 || config.health.port > 65535) {
        error = "health.port must be between 1 and 65535";
        return false;
    }
    if (!health::find_parser(config.health.parser)) {
        std::string known;
        for (const auto &name : health::parser_names()) {
            known += known.empty() ? name : ", " + name;
        }
        error = "Unknown health.parser '" + config.health.parser + "' (known: " + known + ")";
        return false;
    }
    if (config.health.timeout_seconds < 1 || config.health.timeout_seconds > kMaxSeconds) {
        error = "health.timeout_seconds must be between 1 and " + std::to_string(kMaxSeconds);
        return false;
    }

    // Validate policy settings
    const auto &policy = config.policy;
    if (policy.target_throughput <= 0) {
        error = "policy.target_throughput must be > 0";
        return false;
    }
    if (policy.max_run_time_minutes < 1) {
        error = "policy.max_run_time_minutes must be >= 1";
        return false;
    }
    if (policy.poll_interval_seconds < 1) {
        error = "policy.poll_interval_seconds must be >= 1";
        return false;
    }
    if (policy.hot_restart_threshold_minutes < 0 || policy.settle_minutes < 0 || policy.kill_grace_seconds < 0 ||
        policy.cold_start_delay_seconds < 0) {
        error = "policy durations must be >= 0";
        return false;
    }
    if (policy.hot_restart_threshold_minutes > kMaxMinutes || policy.max_run_time_minutes > kMaxMinutes ||
        policy.settle_minutes > kMaxMinutes) {
        error = "policy minute settings must be <= " + std::to_string(kMaxMinutes);
        return false;
    }
    if (policy.poll_interval_seconds > kMaxSeconds || policy.kill_grace_seconds > kMaxSeconds ||
        policy.cold_start_delay_seconds > kMaxSeconds) {
        error = "policy second settings must be <= " + std::to_string(kMaxSeconds);
        return false;
    }

    // Validate Logging settings
    if (config.logging.level != "debug" && config.logging.level != "info" && config.logging.level != "warn" &&
        config.logging.level != "error") {
        error = "Invalid log level: " + config.logging.level;
        return false;
    }

    return true;
}

bool load_config(const std::string &config_path, KeeperConfig &config, std::string &error) {
    try {
        YAML::Node yaml = YAML::LoadFile(config_path);

        // Check for unknown top-level keys
        const std::vector<std::string> valid_keys = {"worker", "health", "policy", "logging"};
        for (const auto &key_node : yaml) {
            std::string key = key_node.first.as<std::string>();
            if (std::find(valid_keys.begin(), valid_keys.end(), key) == valid_keys.end()) {
                LOG_WARN("[Config] Unknown top-level key: '" << key << "' (will be ignored)");
            }
        }

        // Load worker
        if (yaml["worker"]) {
            const auto &worker = yaml["worker"];
            if (worker["executable"]) {
                config.worker.executable = worker["executable"].as<std::string>();
            }
            if (worker["new_session"]) {
                config.worker.new_session = worker["new_session"].as<bool>();
            }
        }

        // Load health endpoint
        if (yaml["health"]) {
            const auto &h = yaml["health"];
            if (h["type"]) {
                auto format_str = h["type"].as<std::string>();
                auto format = parse_response_format(format_str);
                if (!format) {
                    error = "Invalid health.type '" + format_str + "': only json is supported";
                    return false;
                }
                config.health.format = *format;
            }
            if (h["host"]) {
                config.health.host = h["host"].as<std::string>();
            }
            if (h["port"]) {
                config.health.port = h["port"].as<int>();
            }
            if (h["page"]) {
                config.health.page = h["page"].as<std::string>();
            }
            if (h["user"]) {
                config.health.user = h["user"].as<std::string>();
            }
            if (h["password"]) {
                config.health.password = h["password"].as<std::string>();
            }
            if (h["parser"]) {
                config.health.parser = h["parser"].as<std::string>();
            }
            if (h["timeout_seconds"]) {
                config.health.timeout_seconds = h["timeout_seconds"].as<int>();
            }
        }

        // Load restart policy
        if (yaml["policy"]) {
            const auto &p = yaml["policy"];
            auto &policy = config.policy;

            if (p["target_throughput"]) {
                policy.target_throughput = p["target_throughput"].as<double>();
            }
            if (p["hot_restart_threshold_minutes"]) {
                policy.hot_restart_threshold_minutes = p["hot_restart_threshold_minutes"].as<int>();
            }
            if (p["max_run_time_minutes"]) {
                policy.max_run_time_minutes = p["max_run_time_minutes"].as<int>();
            }
            if (p["settle_minutes"]) {
                policy.settle_minutes = p["settle_minutes"].as<int>();
            }
            if (p["poll_interval_seconds"]) {
                policy.poll_interval_seconds = p["poll_interval_seconds"].as<int>();
            }
            if (p["kill_grace_seconds"]) {
                policy.kill_grace_seconds = p["kill_grace_seconds"].as<int>();
            }
            if (p["cold_start_delay_seconds"]) {
                policy.cold_start_delay_seconds = p["cold_start_delay_seconds"].as<int>();
            }
            if (p["cold_start_commands"]) {
                policy.cold_start_commands.clear();  // Ensure idempotent parsing
                for (const auto &command : p["cold_start_commands"]) {
                    policy.cold_start_commands.push_back(command.as<std::string>());
                }
            }
        }

        // Load logging config
        if (yaml["logging"]) {
            if (yaml["logging"]["level"]) {
                config.logging.level = yaml["logging"]["level"].as<std::string>();
            }
            if (yaml["logging"]["file"]) {
                config.logging.file = yaml["logging"]["file"].as<std::string>();
            }
        }

        if (!validate_config(config, error)) {
            return false;
        }

        LOG_INFO("[Config] Worker: " << config.worker.executable);
        LOG_INFO("[Config] Health: " << config.health.host << ":" << config.health.port << "/" << config.health.page
                                     << " (parser: " << config.health.parser << ")");

        std::stringstream policy_msg;
        policy_msg << "[Config] Policy: target " << config.policy.target_throughput << ", max run "
                   << config.policy.max_run_time_minutes << "min, settle " << config.policy.settle_minutes
                   << "min, poll " << config.policy.poll_interval_seconds << "s, hot after "
                   << config.policy.hot_restart_threshold_minutes << "min";
        LOG_INFO(policy_msg.str());
        LOG_INFO("[Config] Cold start commands: " << config.policy.cold_start_commands.size());
        LOG_INFO("[Config] Log level: " << config.logging.level);

        return true;
    } catch (const YAML::BadFile &e) {
        error = "Cannot open config file: " + config_path;
        return false;
    } catch (const YAML::ParserException &e) {
        error = "YAML parse error: " + std::string(e.what());
        return false;
    } catch (const YAML::Exception &e) {
        error = "Config load error: " + std::string(e.what());
        return false;
    }
}

}  // namespace runtime
}  // namespace minekeeper
