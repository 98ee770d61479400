#include "runtime/config.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <string>

namespace fs = std::filesystem;
using namespace minekeeper::runtime;

class ConfigTest : public ::testing::Test {
protected:
    fs::path temp_dir;

    void SetUp() override {
        // Create temporary test directory
        temp_dir = fs::temp_directory_path() / "minekeeper_config_test";
        fs::create_directories(temp_dir);
    }

    void TearDown() override {
        // Clean up temporary files
        if (fs::exists(temp_dir)) {
            fs::remove_all(temp_dir);
        }
    }

    std::string create_config_file(const std::string& name, const std::string& content) {
        fs::path config_path = temp_dir / name;
        std::ofstream file(config_path);
        file << content;
        file.close();
        return config_path.string();
    }
};

TEST_F(ConfigTest, ValidMinimalConfig) {
    std::string config_content = R"(
worker:
  executable: /opt/miners/xmr-stak/xmr-stak

health:
  port: 4580
  page: api.json
  parser: xmrstak

policy:
  target_throughput: 11500
)";

    std::string config_path = create_config_file("minimal.yaml", config_content);
    KeeperConfig config;
    std::string error;

    ASSERT_TRUE(load_config(config_path, config, error)) << "Error: " << error;
    EXPECT_EQ(config.worker.executable, "/opt/miners/xmr-stak/xmr-stak");
    EXPECT_EQ(config.worker.working_directory(), "/opt/miners/xmr-stak");
    EXPECT_TRUE(config.worker.new_session);
    EXPECT_EQ(config.health.host, "localhost");
    EXPECT_EQ(config.health.port, 4580);
    EXPECT_EQ(config.health.timeout_seconds, 6);
    EXPECT_DOUBLE_EQ(config.policy.target_throughput, 11500.0);

    // Defaults
    EXPECT_EQ(config.policy.hot_restart_threshold_minutes, 5);
    EXPECT_EQ(config.policy.max_run_time_minutes, 40);
    EXPECT_EQ(config.policy.settle_minutes, 2);
    EXPECT_EQ(config.policy.poll_interval_seconds, 20);
    EXPECT_EQ(config.policy.kill_grace_seconds, 5);
    EXPECT_EQ(config.policy.cold_start_delay_seconds, 16);
    EXPECT_TRUE(config.policy.cold_start_commands.empty());
    EXPECT_EQ(config.logging.level, "info");
    EXPECT_TRUE(config.logging.file.empty());
}

TEST_F(ConfigTest, FullConfig) {
    std::string config_content = R"(
worker:
  executable: run.sh
  new_session: false

health:
  type: JSON
  host: 127.0.0.1
  port: 7777
  page: ""
  user: miner
  password: secret
  parser: castxmr
  timeout_seconds: 3

policy:
  target_throughput: 1800.5
  hot_restart_threshold_minutes: 10
  max_run_time_minutes: 60
  settle_minutes: 1
  poll_interval_seconds: 15
  kill_grace_seconds: 8
  cold_start_delay_seconds: 4
  cold_start_commands:
    - "modprobe -r amdgpu"
    - "modprobe amdgpu"

logging:
  level: debug
  file: keeper.log
)";

    std::string config_path = create_config_file("full.yaml", config_content);
    KeeperConfig config;
    std::string error;

    ASSERT_TRUE(load_config(config_path, config, error)) << "Error: " << error;
    EXPECT_FALSE(config.worker.new_session);
    EXPECT_EQ(config.worker.working_directory(), "");
    EXPECT_EQ(config.health.user, "miner");
    EXPECT_EQ(config.health.password, "secret");
    EXPECT_EQ(config.health.parser, "castxmr");
    EXPECT_TRUE(config.health.page.empty());
    EXPECT_EQ(config.health.timeout_seconds, 3);
    EXPECT_DOUBLE_EQ(config.policy.target_throughput, 1800.5);
    EXPECT_EQ(config.policy.max_run_time_minutes, 60);
    ASSERT_EQ(config.policy.cold_start_commands.size(), 2u);
    EXPECT_EQ(config.policy.cold_start_commands[0], "modprobe -r amdgpu");
    EXPECT_EQ(config.policy.cold_start_commands[1], "modprobe amdgpu");
    EXPECT_EQ(config.logging.level, "debug");
    EXPECT_EQ(config.logging.file, "keeper.log");
}

TEST_F(ConfigTest, MissingExecutable) {
    std::string config_content = R"(
health:
  parser: xmrstak
policy:
  target_throughput: 100
)";

    std::string config_path = create_config_file("no_exe.yaml", config_content);
    KeeperConfig config;
    std::string error;

    EXPECT_FALSE(load_config(config_path, config, error));
    EXPECT_NE(error.find("executable"), std::string::npos);
}

TEST_F(ConfigTest, UnknownParser) {
    std::string config_content = R"(
worker:
  executable: /opt/miner
health:
  parser: claymore
policy:
  target_throughput: 100
)";

    std::string config_path = create_config_file("bad_parser.yaml", config_content);
    KeeperConfig config;
    std::string error;

    EXPECT_FALSE(load_config(config_path, config, error));
    EXPECT_NE(error.find("claymore"), std::string::npos);
    EXPECT_NE(error.find("xmrstak"), std::string::npos);
}

TEST_F(ConfigTest, UnsupportedResponseFormat) {
    std::string config_content = R"(
worker:
  executable: /opt/miner
health:
  type: xml
  parser: xmrstak
policy:
  target_throughput: 100
)";

    std::string config_path = create_config_file("xml.yaml", config_content);
    KeeperConfig config;
    std::string error;

    EXPECT_FALSE(load_config(config_path, config, error));
    EXPECT_NE(error.find("json"), std::string::npos);
}

TEST_F(ConfigTest, InvalidPort) {
    std::string config_content = R"(
worker:
  executable: /opt/miner
health:
  port: 70000
  parser: xmrstak
policy:
  target_throughput: 100
)";

    std::string config_path = create_config_file("bad_port.yaml", config_content);
    KeeperConfig config;
    std::string error;

    EXPECT_FALSE(load_config(config_path, config, error));
    EXPECT_NE(error.find("port"), std::string::npos);
}

TEST_F(ConfigTest, TargetThroughputRequired) {
    std::string config_content = R"(
worker:
  executable: /opt/miner
health:
  parser: xmrstak
)";

    std::string config_path = create_config_file("no_target.yaml", config_content);
    KeeperConfig config;
    std::string error;

    EXPECT_FALSE(load_config(config_path, config, error));
    EXPECT_NE(error.find("target_throughput"), std::string::npos);
}

TEST_F(ConfigTest, ZeroPollIntervalRejected) {
    std::string config_content = R"(
worker:
  executable: /opt/miner
health:
  parser: xmrstak
policy:
  target_throughput: 100
  poll_interval_seconds: 0
)";

    std::string config_path = create_config_file("zero_poll.yaml", config_content);
    KeeperConfig config;
    std::string error;

    EXPECT_FALSE(load_config(config_path, config, error));
    EXPECT_NE(error.find("poll_interval_seconds"), std::string::npos);
}

TEST_F(ConfigTest, NegativeDurationRejected) {
    std::string config_content = R"(
worker:
  executable: /opt/miner
health:
  parser: xmrstak
policy:
  target_throughput: 100
  kill_grace_seconds: -1
)";

    std::string config_path = create_config_file("negative.yaml", config_content);
    KeeperConfig config;
    std::string error;

    EXPECT_FALSE(load_config(config_path, config, error));
}

TEST_F(ConfigTest, OversizedDurationRejected) {
    std::string config_content = R"(
worker:
  executable: /opt/miner
health:
  parser: xmrstak
policy:
  target_throughput: 100
  max_run_time_minutes: 200000000
)";

    std::string config_path = create_config_file("huge_run.yaml", config_content);
    KeeperConfig config;
    std::string error;

    EXPECT_FALSE(load_config(config_path, config, error));
    EXPECT_NE(error.find("<="), std::string::npos);
}

TEST_F(ConfigTest, OversizedSecondsRejected) {
    KeeperConfig config;
    config.worker.executable = "/opt/miner";
    config.health.parser = "castxmr";
    config.policy.target_throughput = 100;
    std::string error;
    ASSERT_TRUE(validate_config(config, error)) << error;

    config.policy.poll_interval_seconds = 60 * 60 * 24 * 366;
    EXPECT_FALSE(validate_config(config, error));

    config.policy.poll_interval_seconds = 20;
    config.health.timeout_seconds = 60 * 60 * 24 * 366;
    EXPECT_FALSE(validate_config(config, error));
}

TEST_F(ConfigTest, InvalidLogLevel) {
    std::string config_content = R"(
worker:
  executable: /opt/miner
health:
  parser: xmrstak
policy:
  target_throughput: 100
logging:
  level: verbose
)";

    std::string config_path = create_config_file("bad_level.yaml", config_content);
    KeeperConfig config;
    std::string error;

    EXPECT_FALSE(load_config(config_path, config, error));
    EXPECT_NE(error.find("log level"), std::string::npos);
}

TEST_F(ConfigTest, UnknownTopLevelKeyIsIgnored) {
    std::string config_content = R"(
worker:
  executable: /opt/miner
health:
  parser: xmrstak
policy:
  target_throughput: 100
telemetry:
  enabled: true
)";

    std::string config_path = create_config_file("extra_key.yaml", config_content);
    KeeperConfig config;
    std::string error;

    EXPECT_TRUE(load_config(config_path, config, error)) << "Error: " << error;
}

TEST_F(ConfigTest, WrongValueTypeReportsError) {
    std::string config_content = R"(
worker:
  executable: /opt/miner
health:
  port: not-a-number
  parser: xmrstak
policy:
  target_throughput: 100
)";

    std::string config_path = create_config_file("bad_type.yaml", config_content);
    KeeperConfig config;
    std::string error;

    EXPECT_FALSE(load_config(config_path, config, error));
    EXPECT_FALSE(error.empty());
}

TEST_F(ConfigTest, MissingFile) {
    KeeperConfig config;
    std::string error;

    EXPECT_FALSE(load_config((temp_dir / "absent.yaml").string(), config, error));
    EXPECT_NE(error.find("Cannot open config file"), std::string::npos);
}

TEST_F(ConfigTest, MalformedYaml) {
    std::string config_path = create_config_file("broken.yaml", "worker: [unterminated\n");
    KeeperConfig config;
    std::string error;

    EXPECT_FALSE(load_config(config_path, config, error));
    EXPECT_NE(error.find("YAML parse error"), std::string::npos);
}
