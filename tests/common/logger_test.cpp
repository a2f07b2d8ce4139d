// =============================================================================
// seqcov - Logger Tests
// =============================================================================

#include "seqcov/common/logger.h"

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>

namespace seqcov::log {
namespace {

TEST(LoggerLevelTest, QuillLevels) {
    EXPECT_EQ(toQuillLevel(Level::kTrace), quill::LogLevel::TraceL1);
    EXPECT_EQ(toQuillLevel(Level::kWarning), quill::LogLevel::Warning);
}

TEST(LoggerTest, MacrosAreNoOpsBeforeInit) {
    ASSERT_EQ(logger(), nullptr);
    SEQCOV_LOG_INFO("not initialised: {}", 1);
    shutdown();
    EXPECT_EQ(logger(), nullptr);
}

TEST(LoggerTest, WritesToLogFile) {
    auto path = std::filesystem::temp_directory_path() / "seqcov_logger_test.log";

    Config config;
    config.logFile = path.string();
    config.level = Level::kDebug;
    config.enableConsole = false;
    init(config);
    ASSERT_NE(logger(), nullptr);

    SEQCOV_LOG_DEBUG("coverage for {} samples", 3);
    SEQCOV_LOG_TRACE("below the configured level");
    shutdown();
    EXPECT_EQ(logger(), nullptr);

    std::ifstream in(path);
    std::stringstream content;
    content << in.rdbuf();
    EXPECT_NE(content.str().find("coverage for 3 samples"), std::string::npos);
    EXPECT_EQ(content.str().find("below the configured level"), std::string::npos);

    std::error_code ec;
    std::filesystem::remove(path, ec);
}

}  // namespace
}  // namespace seqcov::log
