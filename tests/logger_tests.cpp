#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include "logger.hpp"

namespace fs = std::filesystem;

class LoggerTest : public ::testing::Test {
protected:
    fs::path testDir = fs::temp_directory_path() / "sitevault_logger_test";

    void SetUp() override {
        fs::remove_all(testDir);
    }

    void TearDown() override {
        fs::remove_all(testDir);
    }

    static std::string readFile(const fs::path& path) {
        std::ifstream file(path);
        std::stringstream buffer;
        buffer << file.rdbuf();
        return buffer.str();
    }
};

TEST_F(LoggerTest, WritesLevelTaggedLines) {
    Logger logger(LogSettings{testDir.string()});
    EXPECT_EQ((testDir / "sitevault.log").string(), logger.logFilePath());

    logger.info("Backup started");
    logger.error("Upload failed");

    std::string content = readFile(logger.logFilePath());
    EXPECT_NE(std::string::npos, content.find("] [INFO] Backup started\n"));
    EXPECT_NE(std::string::npos, content.find("] [ERROR] Upload failed\n"));
    EXPECT_EQ(std::string::npos, content.find("ERROR: "));
}

TEST_F(LoggerTest, ErrorPrefixGoesToConsoleOnly) {
    Logger logger(LogSettings{testDir.string()});
    testing::internal::CaptureStderr();
    logger.error("Bucket is not reachable");
    std::string console = testing::internal::GetCapturedStderr();

    EXPECT_NE(std::string::npos, console.find("] ERROR: Bucket is not reachable\n"));
    EXPECT_NE(std::string::npos, readFile(logger.logFilePath()).find("] [ERROR] Bucket is not reachable\n"));
}

TEST_F(LoggerTest, DropsMessagesBelowLevel) {
    Logger logger(LogSettings{testDir.string(), LogLevel::Warning});
    logger.debug("debug detail");
    logger.info("info detail");
    logger.warning("disk almost full");

    std::string content = readFile(logger.logFilePath());
    EXPECT_EQ(std::string::npos, content.find("debug detail"));
    EXPECT_EQ(std::string::npos, content.find("info detail"));
    EXPECT_NE(std::string::npos, content.find("[WARNING] disk almost full"));
}

TEST_F(LoggerTest, RotatesBySize) {
    Logger logger(LogSettings{testDir.string(), LogLevel::Info, 200, 2});
    for (int i = 0; i < 30; ++i) {
        logger.info(std::string(40, 'a' + (i % 26)));
    }

    EXPECT_TRUE(fs::exists(testDir / "sitevault.log"));
    EXPECT_TRUE(fs::exists(testDir / "sitevault.log.1"));
    EXPECT_TRUE(fs::exists(testDir / "sitevault.log.2"));
    EXPECT_FALSE(fs::exists(testDir / "sitevault.log.3"));
    EXPECT_LE(fs::file_size(testDir / "sitevault.log"), 400u);
}

TEST_F(LoggerTest, ConsoleOnlyWithoutDirectory) {
    Logger logger;
    EXPECT_TRUE(logger.logFilePath().empty());
    logger.info("console only");
}

TEST(LogLevelTest, ParsesNamesCaseInsensitively) {
    EXPECT_EQ(LogLevel::Debug, Logger::parseLevel("debug").value());
    EXPECT_EQ(LogLevel::Info, Logger::parseLevel("INFO").value());
    EXPECT_EQ(LogLevel::Warning, Logger::parseLevel("Warning").value());
    EXPECT_EQ(LogLevel::Warning, Logger::parseLevel("warn").value());
    EXPECT_EQ(LogLevel::Error, Logger::parseLevel("error").value());
    EXPECT_FALSE(Logger::parseLevel("verbose").has_value());
}
