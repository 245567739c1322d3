#include "runcage/core/result_assembler.hpp"

#include <gtest/gtest.h>

using namespace runcage::core;
using namespace std::chrono_literals;

TEST(ResultAssemblerTest, CleanExitIsSuccess) {
    ExecutionOutcome raw;
    raw.exit_code = 0;
    raw.stdout_bytes = "hello\n";
    raw.container_id = std::string("abc123");

    auto result = AssembleResult(raw, "python", "Python 3.11", 1234567us);
    EXPECT_TRUE(result.success);
    EXPECT_EQ(result.exit_code, 0);
    EXPECT_EQ(result.stdout_output, "hello\n");
    EXPECT_FALSE(result.timed_out);
    EXPECT_FALSE(result.error_message.has_value());
    EXPECT_EQ(result.container_id, std::optional<std::string>("abc123"));
    EXPECT_EQ(result.language, "python (Python 3.11)");
    EXPECT_DOUBLE_EQ(result.execution_time_seconds, 1.235);
}

TEST(ResultAssemblerTest, NonZeroExitIsProgramFailureWithoutMessage) {
    ExecutionOutcome raw;
    raw.exit_code = 3;
    raw.stderr_bytes = "Traceback\n";

    auto result = AssembleResult(raw, "python", "Python 3.11", 10ms);
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.exit_code, 3);
    EXPECT_EQ(result.stderr_output, "Traceback\n");
    EXPECT_FALSE(result.error_message.has_value());
}

TEST(ResultAssemblerTest, TimeoutForcesExit124) {
    ExecutionOutcome raw;
    raw.timed_out = true;
    raw.exit_code = 137;
    raw.timeout_seconds = 2;
    raw.stdout_bytes = "partial";

    auto result = AssembleResult(raw, "bash", "Bash 5", 2s);
    EXPECT_TRUE(result.timed_out);
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.exit_code, 124);
    EXPECT_EQ(result.stdout_output, "partial");
    ASSERT_TRUE(result.error_message);
    EXPECT_EQ(*result.error_message, "Execution timed out after 2s");
}

TEST(ResultAssemblerTest, InfraErrorKeepsMessageAndExitMinusOne) {
    ExecutionOutcome raw;
    raw.exit_code = 0;
    raw.infra_error = std::string("ImageUnavailable: Docker image not found: x");

    auto result = AssembleResult(raw, "ruby", "Ruby 3.2", 5ms);
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.exit_code, -1);
    ASSERT_TRUE(result.error_message);
    EXPECT_EQ(result.error_message->rfind("ImageUnavailable", 0), 0u);
}

TEST(ResultAssemblerTest, InvalidUtf8IsReplaced) {
    ExecutionOutcome raw;
    raw.exit_code = 0;
    raw.stdout_bytes = std::string("ok\xff\xfe!");

    auto result = AssembleResult(raw, "python", "Python 3.11", 1ms);
    EXPECT_EQ(result.stdout_output, "ok\xEF\xBF\xBD\xEF\xBF\xBD!");
}

TEST(ResultAssemblerTest, JsonCarriesAllFields) {
    ExecutionOutcome raw;
    raw.exit_code = 0;
    raw.stdout_bytes = "4\n";

    auto json = ToJson(AssembleResult(raw, "python", "Python 3.11", 50ms));
    EXPECT_EQ(json["success"], true);
    EXPECT_EQ(json["exit_code"], 0);
    EXPECT_EQ(json["stdout"], "4\n");
    EXPECT_EQ(json["language"], "python (Python 3.11)");
    EXPECT_TRUE(json["error_message"].is_null());
    EXPECT_TRUE(json["container_id"].is_null());
    EXPECT_DOUBLE_EQ(json["execution_time"].get<double>(), 0.05);
    EXPECT_EQ(json["timestamp"].get<std::string>().size(), 24u);
}
