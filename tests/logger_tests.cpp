#include "gtest/gtest.h"
#include "utilities/logger.h"
#include "utilities/var_dir.hpp"
#include <cstdio> // For std::remove
#include <fstream>
#include <nlohmann/json.hpp>
#include <sstream>
#include <string>
#include <vector>

// Helper function to read file contents
static std::string readFileContents(const std::string& path) {
    std::ifstream ifs(path);
    if (!ifs) {
        return "";
    }
    return std::string((std::istreambuf_iterator<char>(ifs)), std::istreambuf_iterator<char>());
}

static bool fileExists(const std::string& path) {
    std::ifstream f(path);
    return f.good();
}

// Test fixture for Logger tests
class LoggerTest : public ::testing::Test {
protected:
    std::vector<std::string> files_to_remove_;

    std::string logPath(const std::string& name) {
        std::string path = tfs::logsDir() + "/" + name;
        files_to_remove_.push_back(path);
        for (int i = 1; i <= 3; ++i) files_to_remove_.push_back(path + "." + std::to_string(i));
        for (const auto& f : files_to_remove_) std::remove(f.c_str());
        return path;
    }

    // Re-initializing closes the current stream, so files can be read back.
    void flush() {
        Logger::init(tfs::logsDir() + "/tfs_tests.log", LogLevel::DEBUG);
    }

    void TearDown() override {
        flush();
        for (const auto& file : files_to_remove_) {
            std::remove(file.c_str());
        }
        files_to_remove_.clear();
    }
};

TEST_F(LoggerTest, LogLevelFiltering) {
    const std::string testLogFile = logPath("test_level_filter.log");

    ASSERT_NO_THROW(Logger::init(testLogFile, LogLevel::INFO));
    Logger& logger = Logger::getInstance();

    logger.log(LogLevel::TRACE, "This is a trace message.");
    logger.log(LogLevel::DEBUG, "This is a debug message.");
    logger.log(LogLevel::INFO, "This is an info message.");
    logger.log(LogLevel::WARN, "This is a warning message.");
    logger.log(LogLevel::ERROR, "This is an error message.");
    logger.log(LogLevel::FATAL, "This is a fatal message.");
    flush();

    std::string logContents = readFileContents(testLogFile);
    ASSERT_NE(logContents, "");
    EXPECT_EQ(logContents.find("This is a trace message."), std::string::npos);
    EXPECT_EQ(logContents.find("This is a debug message."), std::string::npos);
    EXPECT_NE(logContents.find("This is an info message."), std::string::npos);
    EXPECT_NE(logContents.find("This is a warning message."), std::string::npos);
    EXPECT_NE(logContents.find("This is an error message."), std::string::npos);
    EXPECT_NE(logContents.find("This is a fatal message."), std::string::npos);
}

TEST_F(LoggerTest, SetLogLevelAppliesImmediately) {
    const std::string testLogFile = logPath("test_set_level.log");
    ASSERT_NO_THROW(Logger::init(testLogFile, LogLevel::ERROR));
    Logger::getInstance().log(LogLevel::INFO, "before");
    Logger::getInstance().setLogLevel(LogLevel::INFO);
    Logger::getInstance().log(LogLevel::INFO, "after");
    flush();

    std::string logContents = readFileContents(testLogFile);
    EXPECT_EQ(logContents.find("before"), std::string::npos);
    EXPECT_NE(logContents.find("after"), std::string::npos);
}

TEST_F(LoggerTest, JsonOutputFormat) {
    const std::string testLogFile = logPath("test_json_format.log");

    ASSERT_NO_THROW(Logger::init(testLogFile, LogLevel::DEBUG));
    const std::string message = "Test JSON output with special chars \" \\ / \b \f \n \r \t";
    Logger::getInstance().log(LogLevel::INFO, message);
    flush();

    std::string logContents = readFileContents(testLogFile);
    ASSERT_NE(logContents, "");
    EXPECT_NE(logContents.find("\"level\":\"INFO\""), std::string::npos);
    EXPECT_EQ(logContents.find('\n'), logContents.size() - 1) << "one line per entry";

    nlohmann::json entry;
    ASSERT_NO_THROW(entry = nlohmann::json::parse(logContents));
    EXPECT_EQ(entry["level"], "INFO");
    EXPECT_EQ(entry["message"], message);
    ASSERT_TRUE(entry["timestamp"].is_string());
    EXPECT_EQ(entry["timestamp"].get<std::string>().size(), 19u);
}

TEST_F(LoggerTest, InvalidUtf8IsReplaced) {
    const std::string testLogFile = logPath("test_bad_utf8.log");
    ASSERT_NO_THROW(Logger::init(testLogFile, LogLevel::DEBUG));
    EXPECT_NO_THROW(Logger::getInstance().log(LogLevel::WARN, std::string("bad \xff byte")));
    flush();

    std::string logContents = readFileContents(testLogFile);
    EXPECT_NO_THROW(nlohmann::json::parse(logContents));
}

TEST_F(LoggerTest, LongTraceMessageIsNotTruncated) {
    const std::string testLogFile = logPath("test_long_trace.log");
    ASSERT_NO_THROW(Logger::init(testLogFile, LogLevel::TRACE));
    const std::string message = "trace:" + std::string(2000, 'x') + ":end";
    Logger::getInstance().log(LogLevel::TRACE, message);
    flush();

    nlohmann::json entry;
    ASSERT_NO_THROW(entry = nlohmann::json::parse(readFileContents(testLogFile)));
    EXPECT_EQ(entry["level"], "TRACE");
    EXPECT_EQ(entry["message"], message);
}

TEST_F(LoggerTest, LogRotation) {
    const std::string baseLogFile = logPath("test_rotation.log");
    const int maxBackupFiles = 2;
    const long long maxFileSize = 1024; // 1KB

    ASSERT_NO_THROW(Logger::init(baseLogFile, LogLevel::DEBUG, maxFileSize, maxBackupFiles));
    Logger& logger = Logger::getInstance();

    std::string singleMessage = "Rotation test message. This message is intended to be somewhat long to help fill the log file quickly. ";
    for (int k = 0; k < 3; ++k) singleMessage += singleMessage; // ~800 bytes

    // Each entry is close to the limit, so every second write rotates.
    for (int i = 0; i < 8; ++i) {
        logger.log(LogLevel::INFO, singleMessage + " #" + std::to_string(i));
    }
    flush();

    EXPECT_TRUE(fileExists(baseLogFile)) << baseLogFile << " should exist.";
    EXPECT_TRUE(fileExists(baseLogFile + ".1")) << baseLogFile << ".1 should exist.";
    EXPECT_TRUE(fileExists(baseLogFile + ".2")) << baseLogFile << ".2 should exist.";
    EXPECT_FALSE(fileExists(baseLogFile + ".3")) << baseLogFile << ".3 should NOT exist.";

    // Newest entry lives in the primary file.
    EXPECT_NE(readFileContents(baseLogFile).find(" #7"), std::string::npos);
}

TEST_F(LoggerTest, LogRotationNoBackups) {
    const std::string baseLogFile = logPath("test_no_backup_rotation.log");

    ASSERT_NO_THROW(Logger::init(baseLogFile, LogLevel::DEBUG, 512, 0));
    Logger& logger = Logger::getInstance();

    std::string singleMessage = "No backup rotation test. This message is intended to be somewhat long. ";
    for (int k = 0; k < 2; ++k) singleMessage += singleMessage; // ~280 bytes
    for (int i = 0; i < 5; ++i) {
        logger.log(LogLevel::INFO, singleMessage + " #" + std::to_string(i));
    }
    flush();

    EXPECT_TRUE(fileExists(baseLogFile)) << baseLogFile << " should exist (newly created after rotation).";
    EXPECT_FALSE(fileExists(baseLogFile + ".1")) << baseLogFile << ".1 should NOT exist.";
}

// The logger can be initialized multiple times and respects the latest parameters.
TEST_F(LoggerTest, ReinitializationTest) {
    const std::string logFile1 = logPath("test_reinit1.log");
    const std::string logFile2 = logPath("test_reinit2.log");

    ASSERT_NO_THROW(Logger::init(logFile1, LogLevel::INFO));
    Logger::getInstance().log(LogLevel::INFO, "Message for logfile1");

    ASSERT_NO_THROW(Logger::init(logFile2, LogLevel::WARN));
    Logger::getInstance().log(LogLevel::WARN, "Message for logfile2");
    Logger::getInstance().log(LogLevel::INFO, "Info message for logfile2");
    flush();

    std::string contents1 = readFileContents(logFile1);
    EXPECT_NE(contents1.find("Message for logfile1"), std::string::npos);
    EXPECT_EQ(contents1.find("Message for logfile2"), std::string::npos);

    std::string contents2 = readFileContents(logFile2);
    EXPECT_NE(contents2.find("Message for logfile2"), std::string::npos);
    EXPECT_EQ(contents2.find("Info message for logfile2"), std::string::npos);
    EXPECT_EQ(contents2.find("Message for logfile1"), std::string::npos);
}

TEST(LogLevelParsing, AcceptsNamesInAnyCase) {
    EXPECT_EQ(logLevelFromString("trace"), LogLevel::TRACE);
    EXPECT_EQ(logLevelFromString("DEBUG"), LogLevel::DEBUG);
    EXPECT_EQ(logLevelFromString("Info"), LogLevel::INFO);
    EXPECT_EQ(logLevelFromString("warn"), LogLevel::WARN);
    EXPECT_EQ(logLevelFromString("WARNING"), LogLevel::WARN);
    EXPECT_EQ(logLevelFromString("error"), LogLevel::ERROR);
    EXPECT_EQ(logLevelFromString("fatal"), LogLevel::FATAL);
    EXPECT_THROW(logLevelFromString("verbose"), std::invalid_argument);
    EXPECT_THROW(logLevelFromString(""), std::invalid_argument);
}
