/**
 * @file execution_ledger.cpp
 * @brief Execution history
 * 
 * @date 2025
 */

#include "runcage/core/execution_ledger.hpp"
#include "runcage/core/execution_types.hpp"

#include <stdexcept>

namespace runcage {
namespace core {

ExecutionLedger::ExecutionLedger(std::size_t capacity)
    : capacity_(capacity) {
    if (capacity_ == 0) {
        throw std::invalid_argument("Ledger capacity must be at least 1");
    }
}

void ExecutionLedger::Record(ExecutionLedgerEntry entry) {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.push_back(std::move(entry));
    while (entries_.size() > capacity_) {
        entries_.pop_front();
    }
}

std::vector<ExecutionLedgerEntry> ExecutionLedger::Recent(std::size_t limit) const {
    std::lock_guard<std::mutex> lock(mutex_);

    std::size_t count = (limit == 0 || limit > entries_.size()) ? entries_.size() : limit;
    return std::vector<ExecutionLedgerEntry>(entries_.end() - static_cast<std::ptrdiff_t>(count),
                                             entries_.end());
}

std::size_t ExecutionLedger::Size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

void ExecutionLedger::Clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.clear();
}

nlohmann::json ToJson(const ExecutionLedgerEntry& entry) {
    nlohmann::json j;
    j["timestamp"] = FormatTimestamp(entry.timestamp);
    j["language"] = entry.language;
    j["success"] = entry.success;
    j["exit_code"] = entry.exit_code;
    j["execution_time"] = entry.execution_time_seconds;
    j["container_id"] = entry.container_id ? nlohmann::json(*entry.container_id)
                                           : nlohmann::json(nullptr);
    j["code_sha256"] = entry.code_sha256;
    return j;
}

} // namespace core
} // namespace runcage
