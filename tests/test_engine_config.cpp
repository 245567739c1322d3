#include "runcage/core/engine_config.hpp"
#include "runcage/core/errors.hpp"

#include <gtest/gtest.h>

#include <cstdlib>
#include <filesystem>
#include <fstream>

using namespace runcage::core;
using runcage::backends::BackendMode;
namespace fs = std::filesystem;

TEST(EngineConfigTest, Defaults) {
    EngineConfig config;
    EXPECT_EQ(config.backend, BackendMode::AUTO);
    EXPECT_EQ(config.docker_socket, "/var/run/docker.sock");
    EXPECT_EQ(config.docker_binary, "docker");
    EXPECT_EQ(config.pull_timeout, std::chrono::seconds(300));
    EXPECT_EQ(config.container_prefix, "runcage-sandbox");
    EXPECT_EQ(config.mount_path, "/sandbox");
    EXPECT_EQ(config.ledger_capacity, 1000u);
    EXPECT_EQ(config.default_limits.memory_limit(), "512m");
    EXPECT_EQ(config.default_limits.timeout_seconds(), 30);
    EXPECT_NO_THROW(ValidateEngineConfig(config));
}

TEST(EngineConfigTest, ParsesDocument) {
    auto document = nlohmann::json::parse(R"({
        "backend": "cli",
        "docker_binary": "/usr/local/bin/docker",
        "pull_timeout_seconds": 60,
        "stop_grace_seconds": 1,
        "tmpfs_size": "64m",
        "container_prefix": "ci-sandbox",
        "ledger_capacity": 10,
        "default_limits": {"memory": "256m", "pids_limit": 50, "timeout_seconds": 10}
    })");

    auto config = ParseEngineConfig(document);
    EXPECT_EQ(config.backend, BackendMode::CLI);
    EXPECT_EQ(config.docker_binary, "/usr/local/bin/docker");
    EXPECT_EQ(config.pull_timeout, std::chrono::seconds(60));
    EXPECT_EQ(config.stop_grace, std::chrono::seconds(1));
    EXPECT_EQ(config.tmpfs_size, "64m");
    EXPECT_EQ(config.container_prefix, "ci-sandbox");
    EXPECT_EQ(config.ledger_capacity, 10u);
    EXPECT_EQ(config.default_limits.memory_limit(), "256m");
    EXPECT_EQ(config.default_limits.memory_swap_limit(), "256m");
    EXPECT_EQ(config.default_limits.pids_limit(), 50);
    EXPECT_EQ(config.default_limits.timeout_seconds(), 10);
    // untouched keys keep their defaults
    EXPECT_EQ(config.default_limits.cpu_quota(), 100000);
    EXPECT_EQ(config.docker_socket, "/var/run/docker.sock");
}

TEST(EngineConfigTest, ExplicitSwapSurvivesMemoryOverride) {
    auto config = ParseEngineConfig(nlohmann::json::parse(
        R"({"default_limits": {"memory": "256m", "memory_swap": "1g"}})"));
    EXPECT_EQ(config.default_limits.memory_limit(), "256m");
    EXPECT_EQ(config.default_limits.memory_swap_limit(), "1g");

    auto swap_only = ParseEngineConfig(nlohmann::json::parse(
        R"({"default_limits": {"memory_swap": "2g"}})"));
    EXPECT_EQ(swap_only.default_limits.memory_limit(), "512m");
    EXPECT_EQ(swap_only.default_limits.memory_swap_limit(), "2g");
}

TEST(EngineConfigTest, DefaultLimitTimeoutIsClamped) {
    auto config = ParseEngineConfig(nlohmann::json::parse(
        R"({"default_limits": {"timeout_seconds": 120}})"));
    EXPECT_EQ(config.default_limits.timeout_seconds(), 30);
}

TEST(EngineConfigTest, RejectsBadValues) {
    EXPECT_THROW(ParseEngineConfig(nlohmann::json::array()), ConfigError);
    EXPECT_THROW(ParseEngineConfig(nlohmann::json::parse(R"({"backend": "podman"})")), ConfigError);
    EXPECT_THROW(ParseEngineConfig(nlohmann::json::parse(R"({"ledger_capacity": "many"})")), ConfigError);
    EXPECT_THROW(ParseEngineConfig(nlohmann::json::parse(R"({"ledger_capacity": 0})")), ConfigError);
    EXPECT_THROW(ParseEngineConfig(nlohmann::json::parse(R"({"stop_grace_seconds": -1})")), ConfigError);
    EXPECT_THROW(ParseEngineConfig(nlohmann::json::parse(R"({"tmpfs_size": "lots"})")), ConfigError);
    EXPECT_THROW(ParseEngineConfig(nlohmann::json::parse(R"({"mount_path": "sandbox"})")), ConfigError);
    EXPECT_THROW(ParseEngineConfig(nlohmann::json::parse(R"({"default_limits": 5})")), ConfigError);
}

TEST(EngineConfigTest, BuilderValidates) {
    auto config = EngineConfigBuilder()
        .WithBackend(BackendMode::API)
        .WithDockerSocket("/run/user/1000/docker.sock")
        .WithLedgerCapacity(5)
        .Build();
    EXPECT_EQ(config.backend, BackendMode::API);
    EXPECT_EQ(config.docker_socket, "/run/user/1000/docker.sock");
    EXPECT_EQ(config.ledger_capacity, 5u);

    EXPECT_THROW(EngineConfigBuilder().WithContainerPrefix("").Build(), ConfigError);
    EXPECT_THROW(EngineConfigBuilder().WithDockerBinary("").Build(), ConfigError);
    EXPECT_THROW(EngineConfigBuilder().WithLedgerCapacity(0).Build(), ConfigError);
}

TEST(EngineConfigTest, ConfigErrorCarriesCode) {
    try {
        ParseEngineConfig(nlohmann::json::parse(R"({"backend": "podman"})"));
        FAIL() << "expected ConfigError";
    } catch (const ConfigError& e) {
        EXPECT_EQ(e.code(), ErrorCode::CONFIGURATION);
        EXPECT_NE(std::string(e.what()).find("podman"), std::string::npos);
    }
}

class EngineConfigFileTest : public ::testing::Test {
protected:
    void SetUp() override {
        path_ = fs::temp_directory_path() /
            (std::string("runcage-config-") +
             ::testing::UnitTest::GetInstance()->current_test_info()->name() + ".json");
    }

    void TearDown() override {
        fs::remove(path_);
    }

    void Write(const std::string& content) {
        std::ofstream out(path_);
        out << content;
    }

    fs::path path_;
};

TEST_F(EngineConfigFileTest, LoadsFile) {
    Write(R"({"backend": "api", "docker_socket": "/tmp/docker.sock"})");
    auto config = LoadEngineConfig(path_);
    EXPECT_EQ(config.backend, BackendMode::API);
    EXPECT_EQ(config.docker_socket, "/tmp/docker.sock");
}

TEST_F(EngineConfigFileTest, MissingFileIsConfigError) {
    EXPECT_THROW(LoadEngineConfig(path_), ConfigError);
}

TEST_F(EngineConfigFileTest, MalformedFileIsConfigError) {
    Write("{ \"backend\": ");
    EXPECT_THROW(LoadEngineConfig(path_), ConfigError);
}

class DockerHostOverrideTest : public ::testing::Test {
protected:
    void SetUp() override {
        if (const char* value = std::getenv("DOCKER_HOST")) {
            saved_ = value;
            had_value_ = true;
        }
    }

    void TearDown() override {
        if (had_value_) {
            ::setenv("DOCKER_HOST", saved_.c_str(), 1);
        } else {
            ::unsetenv("DOCKER_HOST");
        }
    }

    std::string saved_;
    bool had_value_{false};
};

TEST_F(DockerHostOverrideTest, UnixSocketOverridesConfig) {
    ::setenv("DOCKER_HOST", "unix:///run/user/1000/docker.sock", 1);
    EngineConfig config;
    ApplyEnvironmentOverrides(config);
    EXPECT_EQ(config.docker_socket, "/run/user/1000/docker.sock");
}

TEST_F(DockerHostOverrideTest, TcpHostLeavesSocketAlone) {
    ::setenv("DOCKER_HOST", "tcp://10.0.0.5:2376", 1);
    EngineConfig config;
    ApplyEnvironmentOverrides(config);
    EXPECT_EQ(config.docker_socket, "/var/run/docker.sock");
}

TEST_F(DockerHostOverrideTest, UnsetLeavesSocketAlone) {
    ::unsetenv("DOCKER_HOST");
    EngineConfig config;
    ApplyEnvironmentOverrides(config);
    EXPECT_EQ(config.docker_socket, "/var/run/docker.sock");
}
