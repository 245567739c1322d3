/**
 * @file execution_types.cpp
 * @brief JSON serialization of execution results
 * 
 * @date 2025
 */

#include "runcage/core/execution_types.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>

namespace runcage {
namespace core {

std::string FormatTimestamp(std::chrono::system_clock::time_point time) {
    auto seconds = std::chrono::time_point_cast<std::chrono::seconds>(time);
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(time - seconds).count();

    std::time_t t = std::chrono::system_clock::to_time_t(seconds);
    std::tm tm_utc{};
    gmtime_r(&t, &tm_utc);

    std::ostringstream oss;
    oss << std::put_time(&tm_utc, "%Y-%m-%dT%H:%M:%S")
        << '.' << std::setfill('0') << std::setw(3) << millis << 'Z';
    return oss.str();
}

nlohmann::json ToJson(const ExecutionResult& result) {
    nlohmann::json j;
    j["success"] = result.success;
    j["exit_code"] = result.exit_code;
    j["stdout"] = result.stdout_output;
    j["stderr"] = result.stderr_output;
    j["execution_time"] = result.execution_time_seconds;
    j["timed_out"] = result.timed_out;
    j["error_message"] = result.error_message ? nlohmann::json(*result.error_message)
                                              : nlohmann::json(nullptr);
    j["container_id"] = result.container_id ? nlohmann::json(*result.container_id)
                                            : nlohmann::json(nullptr);
    j["language"] = result.language;
    j["timestamp"] = FormatTimestamp(result.timestamp);
    return j;
}

} // namespace core
} // namespace runcage
