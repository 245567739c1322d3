/**
 * @file docker_api_backend.cpp
 * @brief Docker Engine API backend implementation
 * 
 * @date 2025
 */

#include "runcage/backends/docker_api_backend.hpp"
#include "runcage/utils/string_utils.hpp"

#include <curl/curl.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <iomanip>
#include <memory>
#include <mutex>
#include <sstream>
#include <stdexcept>

namespace runcage {
namespace backends {

using utils::StringUtils;

namespace {

constexpr const char* kBaseUrl = "http://localhost";
constexpr std::size_t kFrameHeaderSize = 8;

void EnsureCurlInitialized() {
    static std::once_flag once;
    std::call_once(once, [] {
        curl_global_init(CURL_GLOBAL_DEFAULT);
    });
}

struct CurlHandleDeleter {
    void operator()(CURL* handle) const { curl_easy_cleanup(handle); }
};

struct CurlListDeleter {
    void operator()(curl_slist* list) const { curl_slist_free_all(list); }
};

using CurlHandle = std::unique_ptr<CURL, CurlHandleDeleter>;
using CurlList = std::unique_ptr<curl_slist, CurlListDeleter>;

std::size_t AppendToString(char* data, std::size_t size, std::size_t nmemb, void* userdata) {
    auto* sink = static_cast<std::string*>(userdata);
    sink->append(data, size * nmemb);
    return size * nmemb;
}

std::string PercentEncode(const std::string& value) {
    std::ostringstream oss;
    oss << std::hex << std::uppercase;
    for (unsigned char c : value) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            oss << c;
        } else {
            oss << '%' << std::setw(2) << std::setfill('0') << static_cast<int>(c);
        }
    }
    return oss.str();
}

/// Error text of a daemon response ({"message": "..."}) or the raw body
std::string DaemonMessage(const std::string& body) {
    auto parsed = nlohmann::json::parse(body, nullptr, false);
    if (!parsed.is_discarded() && parsed.is_object() && parsed.contains("message") &&
        parsed["message"].is_string()) {
        return parsed["message"].get<std::string>();
    }
    return StringUtils::Trim(body);
}

/// Split "repo/name:tag" into repository and tag ("latest" when absent)
std::pair<std::string, std::string> SplitImageReference(const std::string& image) {
    auto at = image.find('@');
    if (at != std::string::npos) {
        return {image.substr(0, at), image.substr(at + 1)};
    }
    auto colon = image.rfind(':');
    auto slash = image.rfind('/');
    if (colon != std::string::npos && (slash == std::string::npos || colon > slash)) {
        return {image.substr(0, colon), image.substr(colon + 1)};
    }
    return {image, "latest"};
}

} // anonymous namespace

// ============================================================================
// STREAM DEMULTIPLEXING
// ============================================================================

DemuxedStreams DemuxDockerStream(const std::string& raw) {
    DemuxedStreams streams;

    auto valid_header = [&raw](std::size_t offset) {
        if (offset + kFrameHeaderSize > raw.size()) {
            return false;
        }
        unsigned char stream = static_cast<unsigned char>(raw[offset]);
        return stream <= 2 && raw[offset + 1] == 0 && raw[offset + 2] == 0 && raw[offset + 3] == 0;
    };

    if (!raw.empty() && !valid_header(0)) {
        streams.stdout_bytes = raw;
        return streams;
    }

    std::size_t offset = 0;
    while (offset < raw.size()) {
        if (!valid_header(offset)) {
            streams.truncated = true;
            break;
        }

        unsigned char stream = static_cast<unsigned char>(raw[offset]);
        std::uint32_t length =
            (static_cast<std::uint32_t>(static_cast<unsigned char>(raw[offset + 4])) << 24) |
            (static_cast<std::uint32_t>(static_cast<unsigned char>(raw[offset + 5])) << 16) |
            (static_cast<std::uint32_t>(static_cast<unsigned char>(raw[offset + 6])) << 8) |
            static_cast<std::uint32_t>(static_cast<unsigned char>(raw[offset + 7]));
        offset += kFrameHeaderSize;

        std::size_t available = std::min<std::size_t>(length, raw.size() - offset);
        if (available < length) {
            streams.truncated = true;
        }

        std::string& sink = (stream == 2) ? streams.stderr_bytes : streams.stdout_bytes;
        sink.append(raw, offset, available);
        offset += available;
    }

    return streams;
}

// ============================================================================
// TRANSPORT
// ============================================================================

DockerApiBackend::DockerApiBackend(DockerApiOptions options)
    : options_(std::move(options)) {
    EnsureCurlInitialized();
    spdlog::debug("Docker API backend on {} ({})", options_.socket_path, options_.api_version);
}

core::Deadline DockerApiBackend::ControlDeadline() const {
    return core::Deadline::After(options_.request_timeout);
}

DockerApiBackend::HttpResponse DockerApiBackend::Request(const std::string& method,
                                                         const std::string& path,
                                                         const std::string& body,
                                                         const core::Deadline& deadline) const {
    HttpResponse response;

    if (deadline.Expired()) {
        response.timed_out = true;
        response.transport_error = "deadline already passed";
        return response;
    }

    CurlHandle curl(curl_easy_init());
    if (!curl) {
        response.transport_error = "curl_easy_init failed";
        return response;
    }

    std::string url = std::string(kBaseUrl) + "/" + options_.api_version + path;

    curl_easy_setopt(curl.get(), CURLOPT_UNIX_SOCKET_PATH, options_.socket_path.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_CUSTOMREQUEST, method.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, AppendToString);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &response.body);

    if (!deadline.IsInfinite()) {
        long timeout_ms = static_cast<long>(std::max<long long>(1, deadline.RemainingMillis().count()));
        curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT_MS, timeout_ms);
    }

    CurlList headers;
    if (method == "POST") {
        headers.reset(curl_slist_append(nullptr, "Content-Type: application/json"));
        curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headers.get());
        curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, body.c_str());
        curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));
    }

    spdlog::debug("Docker API {} {}", method, path);
    CURLcode res = curl_easy_perform(curl.get());

    if (res != CURLE_OK) {
        response.transport_error = curl_easy_strerror(res);
        response.timed_out = (res == CURLE_OPERATION_TIMEDOUT);
        response.unreachable = (res == CURLE_COULDNT_CONNECT);
        return response;
    }

    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &response.status);
    response.transport_ok = true;
    return response;
}

BackendStatus DockerApiBackend::TransportStatus(const HttpResponse& response,
                                                BackendErrorKind fallback) {
    if (response.timed_out) {
        return BackendStatus::Error(BackendErrorKind::TIMEOUT, response.transport_error);
    }
    if (response.unreachable) {
        return BackendStatus::Error(BackendErrorKind::DAEMON_UNREACHABLE,
                                    "Cannot connect to Docker daemon: " + response.transport_error);
    }
    return BackendStatus::Error(fallback, response.transport_error);
}

// ============================================================================
// DAEMON / IMAGES
// ============================================================================

BackendStatus DockerApiBackend::Ping() {
    auto response = Request("GET", "/_ping", "", core::Deadline::After(std::chrono::seconds(5)));
    if (!response.transport_ok) {
        return TransportStatus(response, BackendErrorKind::DAEMON_UNREACHABLE);
    }
    if (response.status != 200) {
        return BackendStatus::Error(BackendErrorKind::PROTOCOL,
                                    "Ping returned HTTP " + std::to_string(response.status));
    }
    return BackendStatus::Ok();
}

std::optional<std::string> DockerApiBackend::RuntimeVersion() {
    auto response = Request("GET", "/version", "", ControlDeadline());
    if (!response.transport_ok || response.status != 200) {
        return std::nullopt;
    }

    auto parsed = nlohmann::json::parse(response.body, nullptr, false);
    if (parsed.is_discarded() || !parsed.contains("Version") || !parsed["Version"].is_string()) {
        return std::nullopt;
    }
    return parsed["Version"].get<std::string>();
}

BackendStatus DockerApiBackend::ImageExists(const std::string& image) {
    auto response = Request("GET", "/images/" + image + "/json", "", ControlDeadline());
    if (!response.transport_ok) {
        return TransportStatus(response, BackendErrorKind::PROTOCOL);
    }
    if (response.status == 200) {
        return BackendStatus::Ok();
    }
    if (response.status == 404) {
        return BackendStatus::Error(BackendErrorKind::NOT_FOUND, "Image not found: " + image);
    }
    return BackendStatus::Error(BackendErrorKind::PROTOCOL, DaemonMessage(response.body));
}

BackendStatus DockerApiBackend::PullImage(const std::string& image, const core::Deadline& deadline) {
    auto [repository, tag] = SplitImageReference(image);
    std::string path = "/images/create?fromImage=" + PercentEncode(repository) +
                       "&tag=" + PercentEncode(tag);

    spdlog::info("Pulling image {} via API", image);
    auto response = Request("POST", path, "", deadline);
    if (!response.transport_ok) {
        auto status = TransportStatus(response, BackendErrorKind::IMAGE_UNAVAILABLE);
        if (status.kind == BackendErrorKind::TIMEOUT) {
            status.kind = BackendErrorKind::IMAGE_UNAVAILABLE;
            status.message = "Pull of " + image + " timed out";
        }
        return status;
    }
    if (response.status != 200) {
        return BackendStatus::Error(BackendErrorKind::IMAGE_UNAVAILABLE, DaemonMessage(response.body));
    }

    // The daemon streams JSON progress lines and reports failures inline
    std::istringstream lines(response.body);
    std::string line;
    while (std::getline(lines, line)) {
        auto progress = nlohmann::json::parse(line, nullptr, false);
        if (!progress.is_discarded() && progress.is_object() && progress.contains("error")) {
            return BackendStatus::Error(BackendErrorKind::IMAGE_UNAVAILABLE,
                                        progress["error"].is_string()
                                            ? progress["error"].get<std::string>()
                                            : progress["error"].dump());
        }
    }

    return BackendStatus::Ok();
}

// ============================================================================
// CONTAINER LIFECYCLE
// ============================================================================

nlohmann::json DockerApiBackend::BuildCreateBody(const ContainerSpec& spec) {
    const auto& iso = spec.isolation;
    if (!iso.memory_bytes) {
        throw std::invalid_argument("Invalid memory limit '" + iso.memory + "'");
    }
    if (!iso.memory_swap_bytes) {
        throw std::invalid_argument("Invalid memory swap limit '" + iso.memory_swap + "'");
    }

    nlohmann::json env = nlohmann::json::array();
    for (const auto& [key, value] : spec.env) {
        env.push_back(key + "=" + value);
    }

    nlohmann::json binds = nlohmann::json::array();
    for (const auto& mount : spec.mounts) {
        binds.push_back(mount.host_path + ":" + mount.container_path +
                        (mount.read_only ? ":ro" : ":rw"));
    }

    nlohmann::json host_config;
    host_config["Binds"] = binds;
    host_config["NetworkMode"] = iso.network_mode;
    host_config["ReadonlyRootfs"] = iso.read_only_rootfs;
    host_config["Init"] = iso.init_process;
    host_config["CapDrop"] = iso.cap_drop;
    host_config["SecurityOpt"] = iso.security_opt;
    host_config["Tmpfs"] = {{iso.tmpfs_path, iso.tmpfs_options}};
    host_config["Memory"] = *iso.memory_bytes;
    host_config["MemorySwap"] = *iso.memory_swap_bytes;
    host_config["CpuQuota"] = iso.cpu_quota;
    host_config["CpuPeriod"] = iso.cpu_period;
    host_config["CpuShares"] = iso.cpu_shares;
    host_config["PidsLimit"] = iso.pids_limit;

    nlohmann::json body;
    body["Image"] = spec.image;
    body["Cmd"] = spec.command;
    body["Env"] = env;
    body["WorkingDir"] = spec.working_dir;
    body["Labels"] = spec.labels;
    body["Tty"] = false;
    body["AttachStdin"] = false;
    body["AttachStdout"] = false;
    body["AttachStderr"] = false;
    body["NetworkDisabled"] = (iso.network_mode == "none");
    body["HostConfig"] = host_config;
    return body;
}

CreateResult DockerApiBackend::CreateContainer(const ContainerSpec& spec) {
    CreateResult result;

    std::string body;
    try {
        body = BuildCreateBody(spec).dump();
    } catch (const std::invalid_argument& e) {
        result.status = BackendStatus::Error(BackendErrorKind::CREATE_FAILED, e.what());
        return result;
    }

    auto response = Request("POST", "/containers/create?name=" + PercentEncode(spec.name),
                            body, ControlDeadline());
    if (!response.transport_ok) {
        result.status = TransportStatus(response, BackendErrorKind::CREATE_FAILED);
        return result;
    }
    if (response.status != 201) {
        result.status = BackendStatus::Error(BackendErrorKind::CREATE_FAILED, DaemonMessage(response.body));
        return result;
    }

    auto parsed = nlohmann::json::parse(response.body, nullptr, false);
    if (parsed.is_discarded() || !parsed.contains("Id") || !parsed["Id"].is_string()) {
        result.status = BackendStatus::Error(BackendErrorKind::PROTOCOL,
                                             "Create response without Id: " + response.body);
        return result;
    }

    for (const auto& warning : parsed.value("Warnings", nlohmann::json::array())) {
        if (warning.is_string()) {
            spdlog::warn("Docker: {}", warning.get<std::string>());
        }
    }

    result.container_id = parsed["Id"].get<std::string>();
    return result;
}

BackendStatus DockerApiBackend::StartContainer(const std::string& container_id) {
    auto response = Request("POST", "/containers/" + container_id + "/start", "", ControlDeadline());
    if (!response.transport_ok) {
        return TransportStatus(response, BackendErrorKind::START_FAILED);
    }
    // 304: already started
    if (response.status != 204 && response.status != 304) {
        return BackendStatus::Error(BackendErrorKind::START_FAILED, DaemonMessage(response.body));
    }
    return BackendStatus::Ok();
}

WaitResult DockerApiBackend::WaitContainer(const std::string& container_id,
                                           const core::Deadline& deadline) {
    WaitResult result;

    auto response = Request("POST", "/containers/" + container_id + "/wait", "", deadline);
    if (!response.transport_ok) {
        result.status = TransportStatus(response, BackendErrorKind::WAIT_FAILED);
        return result;
    }
    if (response.status != 200) {
        result.status = BackendStatus::Error(BackendErrorKind::WAIT_FAILED, DaemonMessage(response.body));
        return result;
    }

    auto parsed = nlohmann::json::parse(response.body, nullptr, false);
    if (parsed.is_discarded() || !parsed.contains("StatusCode") ||
        !parsed["StatusCode"].is_number_integer()) {
        result.status = BackendStatus::Error(BackendErrorKind::PROTOCOL,
                                             "Wait response without StatusCode: " + response.body);
        return result;
    }

    if (parsed.contains("Error") && parsed["Error"].is_object() &&
        parsed["Error"].contains("Message") && parsed["Error"]["Message"].is_string()) {
        auto message = parsed["Error"]["Message"].get<std::string>();
        if (!message.empty()) {
            result.status = BackendStatus::Error(BackendErrorKind::WAIT_FAILED, message);
            return result;
        }
    }

    result.exit_code = parsed["StatusCode"].get<int>();
    return result;
}

BackendStatus DockerApiBackend::StopContainer(const std::string& container_id,
                                              std::chrono::seconds grace) {
    auto deadline = core::Deadline::After(grace + options_.request_timeout);
    auto response = Request("POST",
                            "/containers/" + container_id + "/stop?t=" + std::to_string(grace.count()),
                            "", deadline);
    if (!response.transport_ok) {
        return TransportStatus(response, BackendErrorKind::PROTOCOL);
    }
    // 304: already stopped
    if (response.status == 204 || response.status == 304) {
        return BackendStatus::Ok();
    }
    if (response.status == 404) {
        return BackendStatus::Error(BackendErrorKind::NOT_FOUND, DaemonMessage(response.body));
    }
    return BackendStatus::Error(BackendErrorKind::PROTOCOL, DaemonMessage(response.body));
}

BackendStatus DockerApiBackend::RemoveContainer(const std::string& container_id, bool force) {
    std::string path = "/containers/" + container_id + (force ? "?force=1" : "");
    auto response = Request("DELETE", path, "", ControlDeadline());
    if (!response.transport_ok) {
        return TransportStatus(response, BackendErrorKind::PROTOCOL);
    }
    if (response.status == 204) {
        return BackendStatus::Ok();
    }
    if (response.status == 404) {
        return BackendStatus::Error(BackendErrorKind::NOT_FOUND, DaemonMessage(response.body));
    }
    return BackendStatus::Error(BackendErrorKind::PROTOCOL, DaemonMessage(response.body));
}

LogsResult DockerApiBackend::FetchLogs(const std::string& container_id) {
    LogsResult result;

    auto response = Request("GET", "/containers/" + container_id + "/logs?stdout=1&stderr=1",
                            "", ControlDeadline());
    if (!response.transport_ok) {
        result.status = TransportStatus(response, BackendErrorKind::PROTOCOL);
        return result;
    }
    if (response.status != 200) {
        result.status = BackendStatus::Error(
            response.status == 404 ? BackendErrorKind::NOT_FOUND : BackendErrorKind::PROTOCOL,
            DaemonMessage(response.body));
        return result;
    }

    auto streams = DemuxDockerStream(response.body);
    if (streams.truncated) {
        spdlog::warn("Log stream of {} ended inside a frame", StringUtils::ShortId(container_id));
    }
    result.stdout_bytes = std::move(streams.stdout_bytes);
    result.stderr_bytes = std::move(streams.stderr_bytes);
    return result;
}

ListResult DockerApiBackend::ListContainers(const std::string& label_filter) {
    ListResult result;

    nlohmann::json filters;
    filters["label"] = nlohmann::json::array({label_filter});

    auto response = Request("GET", "/containers/json?all=1&filters=" + PercentEncode(filters.dump()),
                            "", ControlDeadline());
    if (!response.transport_ok) {
        result.status = TransportStatus(response, BackendErrorKind::PROTOCOL);
        return result;
    }
    if (response.status != 200) {
        result.status = BackendStatus::Error(BackendErrorKind::PROTOCOL, DaemonMessage(response.body));
        return result;
    }

    auto parsed = nlohmann::json::parse(response.body, nullptr, false);
    if (parsed.is_discarded() || !parsed.is_array()) {
        result.status = BackendStatus::Error(BackendErrorKind::PROTOCOL, "Container list is not an array");
        return result;
    }

    for (const auto& item : parsed) {
        ContainerSummary summary;
        summary.id = item.value("Id", "");
        summary.image = item.value("Image", "");
        summary.state = item.value("State", "");
        if (item.contains("Names") && item["Names"].is_array() && !item["Names"].empty() &&
            item["Names"][0].is_string()) {
            summary.name = item["Names"][0].get<std::string>();
            if (StringUtils::StartsWith(summary.name, "/")) {
                summary.name.erase(0, 1);
            }
        }
        if (item.contains("Labels") && item["Labels"].is_object()) {
            for (const auto& [key, value] : item["Labels"].items()) {
                if (value.is_string()) {
                    summary.labels[key] = value.get<std::string>();
                }
            }
        }
        result.containers.push_back(std::move(summary));
    }

    return result;
}

} // namespace backends
} // namespace runcage
