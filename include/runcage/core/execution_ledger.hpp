/**
 * @file execution_ledger.hpp
 * @brief Bounded, thread-safe history of recent executions
 * 
 * @date 2025
 */

#pragma once

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace runcage {
namespace core {

/**
 * @struct ExecutionLedgerEntry
 * @brief Summary of one finished execution
 */
struct ExecutionLedgerEntry {
    std::chrono::system_clock::time_point timestamp;  ///< Completion time
    std::string language;                             ///< "<id> (<display name>)"
    bool success{false};
    int exit_code{-1};
    double execution_time_seconds{0.0};
    std::optional<std::string> container_id;
    std::string code_sha256;                          ///< Hex digest of the submitted code
};

/**
 * @class ExecutionLedger
 * @brief FIFO of the most recent executions, oldest evicted first
 * 
 * **Thread Safety**: All methods lock one internal mutex.
 */
class ExecutionLedger {
public:
    static constexpr std::size_t kDefaultCapacity = 1000;

    /// @throws std::invalid_argument if capacity is 0
    explicit ExecutionLedger(std::size_t capacity = kDefaultCapacity);

    /// Append an entry, evicting the oldest beyond capacity
    void Record(ExecutionLedgerEntry entry);

    /**
     * @brief Newest entries, oldest first
     * @param limit Maximum count; 0 returns everything retained
     */
    std::vector<ExecutionLedgerEntry> Recent(std::size_t limit = 0) const;

    std::size_t Size() const;
    std::size_t Capacity() const { return capacity_; }
    void Clear();

private:
    const std::size_t capacity_;
    mutable std::mutex mutex_;
    std::deque<ExecutionLedgerEntry> entries_;
};

nlohmann::json ToJson(const ExecutionLedgerEntry& entry);

} // namespace core
} // namespace runcage
