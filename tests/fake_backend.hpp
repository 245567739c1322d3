/**
 * @file fake_backend.hpp
 * @brief Scriptable in-memory ContainerBackend for engine and lifecycle tests
 * 
 * @date 2025
 */

#pragma once

#include "runcage/backends/container_backend.hpp"

#include <algorithm>
#include <atomic>
#include <map>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <vector>

namespace runcage {
namespace testing {

class FakeBackend : public backends::ContainerBackend {
public:
    struct Container {
        backends::ContainerSpec spec;
        bool running{false};
        bool stopped{false};
    };

    // Script
    std::set<std::string> images{"python:3.11-slim", "node:18-alpine", "ubuntu:22.04",
                                 "ruby:3.2-alpine", "golang:1.21-alpine"};
    bool pull_succeeds{true};
    std::string create_error;
    bool create_times_out{false};              ///< Container is created but the call reports TIMEOUT
    std::string start_error;
    std::string wait_error;
    std::string logs_error;
    std::string remove_error;
    bool hang{false};                          ///< Wait blocks until the deadline
    bool ignore_deadline{false};               ///< Wait returns late instead of timing out
    std::chrono::milliseconds run_time{0};     ///< Simulated program run time
    int exit_code{0};
    std::string stdout_bytes;
    std::string stderr_bytes;

    std::string Name() const override { return "fake"; }

    backends::BackendStatus Ping() override { return backends::BackendStatus::Ok(); }

    std::optional<std::string> RuntimeVersion() override { return std::string("fake-1.0"); }

    backends::BackendStatus ImageExists(const std::string& image) override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (images.count(image)) {
            return backends::BackendStatus::Ok();
        }
        return backends::BackendStatus::Error(backends::BackendErrorKind::NOT_FOUND, "no such image");
    }

    backends::BackendStatus PullImage(const std::string& image, const core::Deadline&) override {
        std::lock_guard<std::mutex> lock(mutex_);
        ++pulls;
        if (!pull_succeeds) {
            return backends::BackendStatus::Error(backends::BackendErrorKind::IMAGE_UNAVAILABLE,
                                                  "pull access denied");
        }
        images.insert(image);
        return backends::BackendStatus::Ok();
    }

    backends::CreateResult CreateContainer(const backends::ContainerSpec& spec) override {
        std::lock_guard<std::mutex> lock(mutex_);
        backends::CreateResult result;
        if (!create_error.empty()) {
            result.status = backends::BackendStatus::Error(backends::BackendErrorKind::CREATE_FAILED,
                                                           create_error);
            return result;
        }
        result.container_id = "fake" + std::to_string(++next_id_) + std::string(60, '0');
        containers_[result.container_id] = Container{spec, false, false};
        last_spec = spec;
        ++created;
        if (create_times_out) {
            result.container_id.clear();
            result.status = backends::BackendStatus::Error(backends::BackendErrorKind::TIMEOUT,
                                                           "create request timed out");
        }
        return result;
    }

    backends::BackendStatus StartContainer(const std::string& id) override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!start_error.empty()) {
            return backends::BackendStatus::Error(backends::BackendErrorKind::START_FAILED, start_error);
        }
        containers_.at(id).running = true;
        return backends::BackendStatus::Ok();
    }

    backends::WaitResult WaitContainer(const std::string& id, const core::Deadline& deadline) override {
        backends::WaitResult result;
        if (!wait_error.empty()) {
            result.status = backends::BackendStatus::Error(backends::BackendErrorKind::WAIT_FAILED,
                                                           wait_error);
            return result;
        }

        if (hang && !ignore_deadline) {
            std::this_thread::sleep_for(deadline.Remaining());
            result.status = backends::BackendStatus::Error(backends::BackendErrorKind::TIMEOUT,
                                                           "deadline reached");
            return result;
        }

        std::this_thread::sleep_for(run_time);

        std::lock_guard<std::mutex> lock(mutex_);
        containers_.at(id).running = false;
        result.exit_code = exit_code;
        return result;
    }

    backends::BackendStatus StopContainer(const std::string& id, std::chrono::seconds) override {
        std::lock_guard<std::mutex> lock(mutex_);
        ++stops;
        auto it = containers_.find(id);
        if (it == containers_.end()) {
            return backends::BackendStatus::Error(backends::BackendErrorKind::NOT_FOUND, "no such container");
        }
        it->second.running = false;
        it->second.stopped = true;
        return backends::BackendStatus::Ok();
    }

    backends::BackendStatus RemoveContainer(const std::string& id, bool) override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!remove_error.empty()) {
            return backends::BackendStatus::Error(backends::BackendErrorKind::PROTOCOL, remove_error);
        }
        // Docker accepts a name wherever it takes an id
        auto it = containers_.find(id);
        if (it == containers_.end()) {
            it = std::find_if(containers_.begin(), containers_.end(),
                              [&id](const auto& entry) { return entry.second.spec.name == id; });
        }
        if (it == containers_.end()) {
            return backends::BackendStatus::Error(backends::BackendErrorKind::NOT_FOUND, "no such container");
        }
        containers_.erase(it);
        ++removed;
        return backends::BackendStatus::Ok();
    }

    backends::LogsResult FetchLogs(const std::string&) override {
        backends::LogsResult logs;
        if (!logs_error.empty()) {
            logs.status = backends::BackendStatus::Error(backends::BackendErrorKind::PROTOCOL, logs_error);
            return logs;
        }
        logs.stdout_bytes = stdout_bytes;
        logs.stderr_bytes = stderr_bytes;
        return logs;
    }

    backends::ListResult ListContainers(const std::string& label_filter) override {
        std::lock_guard<std::mutex> lock(mutex_);
        backends::ListResult result;
        auto eq = label_filter.find('=');
        std::string key = label_filter.substr(0, eq);
        std::string value = eq == std::string::npos ? "" : label_filter.substr(eq + 1);
        for (const auto& [id, container] : containers_) {
            auto it = container.spec.labels.find(key);
            if (it != container.spec.labels.end() && (value.empty() || it->second == value)) {
                backends::ContainerSummary summary;
                summary.id = id;
                summary.name = container.spec.name;
                summary.image = container.spec.image;
                summary.labels = container.spec.labels;
                result.containers.push_back(summary);
            }
        }
        return result;
    }

    /// Simulate a container left behind by a crashed process
    void AddOrphan(const std::string& id, std::map<std::string, std::string> labels,
                   const std::string& name = "") {
        std::lock_guard<std::mutex> lock(mutex_);
        Container container;
        container.spec.name = name.empty() ? "orphan-" + id : name;
        container.spec.labels = std::move(labels);
        containers_[id] = container;
    }

    std::size_t LiveContainers() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return containers_.size();
    }

    std::atomic<int> created{0};
    std::atomic<int> removed{0};
    std::atomic<int> stops{0};
    std::atomic<int> pulls{0};
    backends::ContainerSpec last_spec;

private:
    mutable std::mutex mutex_;
    std::map<std::string, Container> containers_;
    int next_id_{0};
};

} // namespace testing
} // namespace runcage
