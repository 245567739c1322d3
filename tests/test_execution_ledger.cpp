#include "runcage/core/execution_ledger.hpp"

#include <gtest/gtest.h>

#include <thread>
#include <vector>

using namespace runcage::core;

namespace {

ExecutionLedgerEntry Entry(int exit_code) {
    ExecutionLedgerEntry entry;
    entry.timestamp = std::chrono::system_clock::now();
    entry.language = "python (Python 3.11)";
    entry.exit_code = exit_code;
    entry.success = exit_code == 0;
    return entry;
}

} // namespace

TEST(ExecutionLedgerTest, RecentReturnsNewestOldestFirst) {
    ExecutionLedger ledger(10);
    for (int i = 0; i < 5; ++i) {
        ledger.Record(Entry(i));
    }

    auto recent = ledger.Recent(3);
    ASSERT_EQ(recent.size(), 3u);
    EXPECT_EQ(recent[0].exit_code, 2);
    EXPECT_EQ(recent[1].exit_code, 3);
    EXPECT_EQ(recent[2].exit_code, 4);

    EXPECT_EQ(ledger.Recent(0).size(), 5u);
    EXPECT_EQ(ledger.Recent(100).size(), 5u);
}

TEST(ExecutionLedgerTest, EvictsOldestBeyondCapacity) {
    ExecutionLedger ledger(3);
    for (int i = 0; i < 7; ++i) {
        ledger.Record(Entry(i));
    }

    EXPECT_EQ(ledger.Size(), 3u);
    auto all = ledger.Recent();
    ASSERT_EQ(all.size(), 3u);
    EXPECT_EQ(all.front().exit_code, 4);
    EXPECT_EQ(all.back().exit_code, 6);
}

TEST(ExecutionLedgerTest, ClearEmptiesLedger) {
    ExecutionLedger ledger;
    EXPECT_EQ(ledger.Capacity(), 1000u);
    ledger.Record(Entry(0));
    ledger.Clear();
    EXPECT_EQ(ledger.Size(), 0u);
    EXPECT_TRUE(ledger.Recent().empty());
}

TEST(ExecutionLedgerTest, ZeroCapacityIsRejected) {
    EXPECT_THROW(ExecutionLedger(0), std::invalid_argument);
}

TEST(ExecutionLedgerTest, ConcurrentRecordsAreAllCounted) {
    ExecutionLedger ledger(10000);
    std::vector<std::thread> threads;
    for (int t = 0; t < 8; ++t) {
        threads.emplace_back([&ledger] {
            for (int i = 0; i < 250; ++i) {
                ledger.Record(Entry(i));
                ledger.Recent(5);
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }
    EXPECT_EQ(ledger.Size(), 2000u);
}

TEST(ExecutionLedgerTest, JsonIncludesDigest) {
    auto entry = Entry(1);
    entry.code_sha256 = std::string(64, 'a');
    entry.container_id = std::string("0123456789abcdef");

    auto json = ToJson(entry);
    EXPECT_EQ(json["exit_code"], 1);
    EXPECT_EQ(json["success"], false);
    EXPECT_EQ(json["code_sha256"], std::string(64, 'a'));
    EXPECT_EQ(json["container_id"], "0123456789abcdef");
}
