#include "runcage/backends/docker_api_backend.hpp"
#include "runcage/core/isolation_policy.hpp"

#include <gtest/gtest.h>

#include <cstdint>

using namespace runcage;
using namespace runcage::backends;

namespace {

std::string Frame(std::uint8_t stream, const std::string& payload) {
    std::string frame(8, '\0');
    frame[0] = static_cast<char>(stream);
    auto size = static_cast<std::uint32_t>(payload.size());
    frame[4] = static_cast<char>((size >> 24) & 0xFF);
    frame[5] = static_cast<char>((size >> 16) & 0xFF);
    frame[6] = static_cast<char>((size >> 8) & 0xFF);
    frame[7] = static_cast<char>(size & 0xFF);
    return frame + payload;
}

ContainerSpec SampleSpec() {
    core::ExecutionRequest request;
    ContainerSpec spec;
    spec.image = "python:3.11-slim";
    spec.command = {"python", "code.py"};
    spec.name = "runcage-sandbox-abc";
    spec.labels = {{"runcage.managed", "true"}};
    spec.mounts.push_back({"/tmp/runcage-ws-1", "/sandbox", true});
    spec.working_dir = "/sandbox";
    spec.env = {{"PYTHONUNBUFFERED", "1"}};
    spec.isolation = core::DeriveIsolation(request, core::ResourceLimits{});
    return spec;
}

} // namespace

TEST(DemuxDockerStreamTest, SplitsInterleavedFrames) {
    std::string raw = Frame(1, "out1\n") + Frame(2, "err1\n") + Frame(1, "out2\n");
    auto streams = DemuxDockerStream(raw);
    EXPECT_EQ(streams.stdout_bytes, "out1\nout2\n");
    EXPECT_EQ(streams.stderr_bytes, "err1\n");
    EXPECT_FALSE(streams.truncated);
}

TEST(DemuxDockerStreamTest, HandlesEmptyAndLargeFrames) {
    EXPECT_TRUE(DemuxDockerStream("").stdout_bytes.empty());

    std::string big(70000, 'x');
    auto streams = DemuxDockerStream(Frame(1, "") + Frame(2, big));
    EXPECT_EQ(streams.stdout_bytes, "");
    EXPECT_EQ(streams.stderr_bytes, big);
}

TEST(DemuxDockerStreamTest, KeepsBinaryPayloads) {
    std::string payload("a\0b\xff", 4);
    auto streams = DemuxDockerStream(Frame(1, payload));
    EXPECT_EQ(streams.stdout_bytes, payload);
}

TEST(DemuxDockerStreamTest, TruncatedFrameKeepsAvailableBytes) {
    std::string raw = Frame(1, "complete") + Frame(2, "cut-off-payload");
    raw.resize(raw.size() - 7);
    auto streams = DemuxDockerStream(raw);
    EXPECT_EQ(streams.stdout_bytes, "complete");
    EXPECT_EQ(streams.stderr_bytes, "cut-off-");
    EXPECT_TRUE(streams.truncated);
}

TEST(DemuxDockerStreamTest, UnframedOutputIsStdout) {
    auto streams = DemuxDockerStream("plain tty output\n");
    EXPECT_EQ(streams.stdout_bytes, "plain tty output\n");
    EXPECT_TRUE(streams.stderr_bytes.empty());
}

TEST(DockerApiCreateBodyTest, CarriesIsolationAndLimits) {
    auto body = DockerApiBackend::BuildCreateBody(SampleSpec());

    EXPECT_EQ(body["Image"], "python:3.11-slim");
    EXPECT_EQ(body["Cmd"], nlohmann::json::array({"python", "code.py"}));
    EXPECT_EQ(body["WorkingDir"], "/sandbox");
    EXPECT_EQ(body["Env"], nlohmann::json::array({"PYTHONUNBUFFERED=1"}));
    EXPECT_EQ(body["Labels"]["runcage.managed"], "true");
    EXPECT_EQ(body["NetworkDisabled"], true);
    EXPECT_EQ(body["Tty"], false);

    const auto& host = body["HostConfig"];
    EXPECT_EQ(host["Binds"], nlohmann::json::array({"/tmp/runcage-ws-1:/sandbox:ro"}));
    EXPECT_EQ(host["NetworkMode"], "none");
    EXPECT_EQ(host["ReadonlyRootfs"], true);
    EXPECT_EQ(host["Init"], true);
    EXPECT_EQ(host["CapDrop"], nlohmann::json::array({"ALL"}));
    EXPECT_EQ(host["SecurityOpt"], nlohmann::json::array({"no-new-privileges"}));
    EXPECT_EQ(host["Tmpfs"]["/tmp"], "size=100m,noexec,nosuid,nodev");
    EXPECT_EQ(host["Memory"], 512LL * 1024 * 1024);
    EXPECT_EQ(host["MemorySwap"], 512LL * 1024 * 1024);
    EXPECT_EQ(host["CpuQuota"], 100000);
    EXPECT_EQ(host["CpuPeriod"], 100000);
    EXPECT_EQ(host["CpuShares"], 1024);
    EXPECT_EQ(host["PidsLimit"], 100);
}

TEST(DockerApiCreateBodyTest, MalformedMemoryIsRejected) {
    auto spec = SampleSpec();
    spec.isolation.memory = "lots";
    spec.isolation.memory_bytes.reset();
    EXPECT_THROW(DockerApiBackend::BuildCreateBody(spec), std::invalid_argument);
}

TEST(DockerApiBackendTest, MissingSocketIsDaemonUnreachable) {
    DockerApiOptions options;
    options.socket_path = "/nonexistent/runcage-test/docker.sock";
    DockerApiBackend backend(options);

    auto status = backend.Ping();
    EXPECT_FALSE(status.ok());
    EXPECT_EQ(status.kind, BackendErrorKind::DAEMON_UNREACHABLE);
    EXPECT_FALSE(backend.RuntimeVersion().has_value());

    auto created = backend.CreateContainer(SampleSpec());
    EXPECT_FALSE(created.status.ok());
    EXPECT_TRUE(created.container_id.empty());
}

TEST(DockerApiBackendTest, ExpiredDeadlineTimesOutWithoutRequest) {
    DockerApiOptions options;
    options.socket_path = "/nonexistent/runcage-test/docker.sock";
    DockerApiBackend backend(options);

    auto waited = backend.WaitContainer("abc", core::Deadline::After(std::chrono::seconds(0)));
    EXPECT_EQ(waited.status.kind, BackendErrorKind::TIMEOUT);
}
