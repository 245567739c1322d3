#include "fake_backend.hpp"

#include "runcage/core/container_lifecycle.hpp"
#include "runcage/core/workspace.hpp"

#include <gtest/gtest.h>

#include <filesystem>

#include <sys/wait.h>
#include <unistd.h>

using namespace runcage::core;
using runcage::testing::FakeBackend;
using namespace std::chrono_literals;

class ContainerLifecycleTest : public ::testing::Test {
protected:
    void SetUp() override {
        config_ = EngineConfigBuilder().WithWaitGraceMargin(0s).Build();
        spec_ = *LanguageRegistry::Default().Resolve("python");
        request_.code = "print('hi')";
    }

    ExecutionOutcome Run(std::chrono::seconds timeout = 5s) {
        auto workspace = StageWorkspace(request_, spec_);
        ContainerLifecycleManager manager(backend_, config_);
        return manager.Run(spec_, workspace, DeriveIsolation(request_, request_.limits),
                           request_.env_vars, timeout);
    }

    FakeBackend backend_;
    EngineConfig config_;
    LanguageSpec spec_;
    ExecutionRequest request_;
};

TEST_F(ContainerLifecycleTest, SuccessfulRunReturnsExitCodeAndLogs) {
    backend_.stdout_bytes = "hi\n";
    backend_.stderr_bytes = "warn\n";

    auto outcome = Run();
    EXPECT_EQ(outcome.exit_code, 0);
    EXPECT_EQ(outcome.stdout_bytes, "hi\n");
    EXPECT_EQ(outcome.stderr_bytes, "warn\n");
    EXPECT_FALSE(outcome.timed_out);
    EXPECT_FALSE(outcome.infra_error);
    ASSERT_TRUE(outcome.container_id);

    EXPECT_EQ(backend_.created, 1);
    EXPECT_EQ(backend_.removed, 1);
    EXPECT_EQ(backend_.LiveContainers(), 0u);
}

TEST_F(ContainerLifecycleTest, ContainerSpecCarriesSandboxSettings) {
    request_.env_vars["FOO"] = "bar";
    request_.env_vars["PYTHONUNBUFFERED"] = "0";
    Run();

    const auto& spec = backend_.last_spec;
    EXPECT_EQ(spec.image, "python:3.11-slim");
    EXPECT_EQ(spec.command, (std::vector<std::string>{"python", "code.py"}));
    EXPECT_EQ(spec.name.rfind("runcage-sandbox-", 0), 0u);
    EXPECT_EQ(spec.labels.at("runcage.managed"), "true");
    EXPECT_EQ(spec.labels.at("runcage.language"), "python");
    EXPECT_EQ(spec.labels.at("runcage.owner"), ProcessOwnerTag());
    EXPECT_EQ(spec.working_dir, "/sandbox");
    ASSERT_EQ(spec.mounts.size(), 1u);
    EXPECT_EQ(spec.mounts[0].container_path, "/sandbox");
    EXPECT_TRUE(spec.mounts[0].read_only);
    EXPECT_EQ(spec.env.at("FOO"), "bar");
    EXPECT_EQ(spec.env.at("PYTHONUNBUFFERED"), "1");
    EXPECT_EQ(spec.env.at("PYTHONDONTWRITEBYTECODE"), "1");
    EXPECT_EQ(spec.isolation.network_mode, "none");
}

TEST_F(ContainerLifecycleTest, HangingProgramTimesOutAndIsRemoved) {
    backend_.hang = true;
    backend_.stdout_bytes = "partial";

    auto start = std::chrono::steady_clock::now();
    auto outcome = Run(1s);
    auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_TRUE(outcome.timed_out);
    EXPECT_EQ(outcome.exit_code, 124);
    EXPECT_EQ(outcome.timeout_seconds, 1);
    EXPECT_EQ(outcome.stdout_bytes, "partial");
    EXPECT_GE(backend_.stops, 1);
    EXPECT_EQ(backend_.LiveContainers(), 0u);
    EXPECT_LT(elapsed, 3s);
}

TEST_F(ContainerLifecycleTest, BackendOverrunningDeadlineCountsAsTimeout) {
    backend_.hang = true;
    backend_.ignore_deadline = true;
    backend_.run_time = 1500ms;

    auto outcome = Run(1s);
    EXPECT_TRUE(outcome.timed_out);
    EXPECT_EQ(outcome.exit_code, 124);
    EXPECT_EQ(backend_.LiveContainers(), 0u);
}

TEST_F(ContainerLifecycleTest, MissingImageIsPulled) {
    backend_.images.clear();
    auto outcome = Run();
    EXPECT_EQ(backend_.pulls, 1);
    EXPECT_EQ(outcome.exit_code, 0);
    EXPECT_FALSE(outcome.infra_error);
}

TEST_F(ContainerLifecycleTest, FailedPullIsImageUnavailable) {
    backend_.images.clear();
    backend_.pull_succeeds = false;

    auto outcome = Run();
    ASSERT_TRUE(outcome.infra_error);
    EXPECT_EQ(outcome.infra_error->rfind("ImageUnavailable: Docker image not found", 0), 0u);
    EXPECT_EQ(outcome.exit_code, -1);
    EXPECT_EQ(backend_.created, 0);
}

TEST_F(ContainerLifecycleTest, CreateFailureIsReportedWithoutContainer) {
    backend_.create_error = "invalid memory";
    auto outcome = Run();
    ASSERT_TRUE(outcome.infra_error);
    EXPECT_EQ(outcome.infra_error->rfind("ContainerCreationFailed: invalid memory", 0), 0u);
    EXPECT_FALSE(outcome.container_id);
    EXPECT_EQ(backend_.LiveContainers(), 0u);
}

TEST_F(ContainerLifecycleTest, CreateTimeoutRemovesLateContainerByName) {
    backend_.create_times_out = true;
    auto outcome = Run();
    ASSERT_TRUE(outcome.infra_error);
    EXPECT_EQ(outcome.infra_error->rfind("ContainerCreationFailed:", 0), 0u);
    EXPECT_FALSE(outcome.container_id);
    EXPECT_EQ(backend_.created, 1);
    EXPECT_EQ(backend_.removed, 1);
    EXPECT_EQ(backend_.LiveContainers(), 0u);
}

TEST_F(ContainerLifecycleTest, RejectedCreateDoesNotAttemptRemoval) {
    backend_.create_error = "invalid memory";
    Run();
    EXPECT_EQ(backend_.removed, 0);
}

TEST_F(ContainerLifecycleTest, StartFailureStillRemovesContainer) {
    backend_.start_error = "exec format error";
    auto outcome = Run();
    ASSERT_TRUE(outcome.infra_error);
    EXPECT_EQ(outcome.infra_error->rfind("ContainerStartFailed", 0), 0u);
    EXPECT_EQ(outcome.exit_code, -1);
    EXPECT_EQ(backend_.created, 1);
    EXPECT_EQ(backend_.LiveContainers(), 0u);
}

TEST_F(ContainerLifecycleTest, WaitFailureIsBackendError) {
    backend_.wait_error = "connection reset";
    auto outcome = Run();
    ASSERT_TRUE(outcome.infra_error);
    EXPECT_EQ(outcome.infra_error->rfind("BackendError", 0), 0u);
    EXPECT_EQ(backend_.LiveContainers(), 0u);
}

TEST_F(ContainerLifecycleTest, LogFailureAfterExitIsBackendError) {
    backend_.exit_code = 0;
    backend_.logs_error = "stream closed";
    auto outcome = Run();
    ASSERT_TRUE(outcome.infra_error);
    EXPECT_EQ(outcome.exit_code, -1);
    EXPECT_EQ(backend_.LiveContainers(), 0u);
}

TEST_F(ContainerLifecycleTest, StdinWrapsLaunchCommand) {
    request_.stdin_input = std::string("42\n");
    auto workspace = StageWorkspace(request_, spec_);

    auto argv = ContainerLifecycleManager::BuildLaunchCommand(spec_, workspace, "/sandbox");
    EXPECT_EQ(argv, (std::vector<std::string>{
        "sh", "-c", "exec \"$@\" < /sandbox/.runcage_stdin", "runcage", "python", "code.py"}));
}

TEST(ContainerNameTest, NamesAreUniqueAndPrefixed) {
    auto a = ContainerLifecycleManager::GenerateContainerName("pfx");
    auto b = ContainerLifecycleManager::GenerateContainerName("pfx");
    EXPECT_NE(a, b);
    EXPECT_EQ(a.rfind("pfx-", 0), 0u);
    EXPECT_EQ(a.size(), 4u + 12u);
}

TEST(ContainerGuardTest, RemovesOnScopeExit) {
    FakeBackend backend;
    runcage::backends::ContainerSpec spec;
    auto created = backend.CreateContainer(spec);
    {
        ContainerGuard guard(backend, created.container_id, 2s);
    }
    EXPECT_EQ(backend.stops, 1);
    EXPECT_EQ(backend.removed, 1);
    EXPECT_EQ(backend.LiveContainers(), 0u);
}

TEST(ContainerGuardTest, StoppedContainerIsOnlyRemoved) {
    FakeBackend backend;
    auto created = backend.CreateContainer(runcage::backends::ContainerSpec{});
    ContainerGuard guard(backend, created.container_id, 2s);
    guard.MarkStopped();
    guard.Release();
    guard.Release();
    EXPECT_EQ(backend.stops, 0);
    EXPECT_EQ(backend.removed, 1);
}

TEST(InFlightContainersTest, TracksNames) {
    InFlightContainers registry;
    registry.Add("runcage-sandbox-a");
    registry.Add("runcage-sandbox-b");
    EXPECT_TRUE(registry.Contains("runcage-sandbox-a"));
    EXPECT_EQ(registry.Size(), 2u);

    registry.Remove("runcage-sandbox-a");
    EXPECT_FALSE(registry.Contains("runcage-sandbox-a"));
    EXPECT_TRUE(registry.Contains("runcage-sandbox-b"));
}

TEST(OwnerTagTest, LiveAndDeadProcesses) {
    std::string own = ProcessOwnerTag();
    auto slash = own.rfind('/');
    ASSERT_NE(slash, std::string::npos);
    std::string host = own.substr(0, slash);

    EXPECT_TRUE(OwnerIsAlive(own));

    pid_t child = ::fork();
    ASSERT_GE(child, 0);
    if (child == 0) {
        ::_exit(0);
    }
    int status = 0;
    ASSERT_EQ(::waitpid(child, &status, 0), child);
    EXPECT_FALSE(OwnerIsAlive(host + "/" + std::to_string(child)));

    EXPECT_TRUE(OwnerIsAlive("some-other-host/1"));
    EXPECT_TRUE(OwnerIsAlive("garbage"));
}
