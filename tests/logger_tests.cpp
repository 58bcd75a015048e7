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

// Helper function to count occurrences of a substring
static int countOccurrences(const std::string& text, const std::string& sub) {
    int count = 0;
    size_t pos = text.find(sub, 0);
    while (pos != std::string::npos) {
        count++;
        pos = text.find(sub, pos + sub.length());
    }
    return count;
}

class LoggerTest : public ::testing::Test {
protected:
    std::vector<std::string> files_to_remove_;

    void TearDown() override {
        // The logger is a singleton; point it back at the suite log so the
        // test files below are released before removal.
        Logger::init(quickshare::logPathFor("quickshare_tests"), LogLevel::DEBUG);
        for (const auto& file : files_to_remove_) {
            std::remove(file.c_str());
        }
        files_to_remove_.clear();
    }

    std::string testFile(const std::string& name) {
        std::string path = quickshare::logsDir() + "/" + name;
        files_to_remove_.push_back(path);
        std::remove(path.c_str());
        return path;
    }
};

TEST_F(LoggerTest, LogLevelFiltering) {
    const std::string testLogFile = testFile("test_level_filter.log");

    ASSERT_NO_THROW(Logger::init(testLogFile, LogLevel::INFO));
    Logger& logger = Logger::getInstance();

    logger.log(LogLevel::TRACE, "This is a trace message.");
    logger.log(LogLevel::DEBUG, "This is a debug message.");
    logger.log(LogLevel::INFO, "This is an info message.");
    logger.log(LogLevel::WARN, "This is a warning message.");
    logger.log(LogLevel::ERROR, "This is an error message.");

    std::string logContents = readFileContents(testLogFile);
    ASSERT_NE(logContents, "");
    EXPECT_EQ(countOccurrences(logContents, "trace message"), 0);
    EXPECT_EQ(countOccurrences(logContents, "debug message"), 0);
    EXPECT_EQ(countOccurrences(logContents, "info message"), 1);
    EXPECT_EQ(countOccurrences(logContents, "warning message"), 1);
    EXPECT_EQ(countOccurrences(logContents, "error message"), 1);

    logger.setLogLevel(LogLevel::ERROR);
    logger.log(LogLevel::WARN, "suppressed after level change");
    EXPECT_EQ(countOccurrences(readFileContents(testLogFile), "suppressed"), 0);
}

TEST_F(LoggerTest, JsonOutputFormat) {
    const std::string testLogFile = testFile("test_json_format.log");
    ASSERT_NO_THROW(Logger::init(testLogFile, LogLevel::DEBUG));

    Logger::getInstance().log(LogLevel::INFO, "relay_store", "stored chunk 3 for ABC123");
    Logger::getInstance().log(LogLevel::WARN, "no component here");

    std::istringstream lines(readFileContents(testLogFile));
    std::string first, second;
    ASSERT_TRUE(std::getline(lines, first));
    ASSERT_TRUE(std::getline(lines, second));

    auto record = nlohmann::json::parse(first);
    EXPECT_EQ(record["level"], "INFO");
    EXPECT_EQ(record["component"], "relay_store");
    EXPECT_EQ(record["message"], "stored chunk 3 for ABC123");
    ASSERT_TRUE(record.contains("timestamp"));
    EXPECT_EQ(record["timestamp"].get<std::string>().back(), 'Z');

    auto bare = nlohmann::json::parse(second);
    EXPECT_EQ(bare["level"], "WARN");
    EXPECT_FALSE(bare.contains("component"));
}

TEST_F(LoggerTest, InvalidUtf8DoesNotThrow) {
    const std::string testLogFile = testFile("test_utf8.log");
    ASSERT_NO_THROW(Logger::init(testLogFile, LogLevel::DEBUG));
    std::string hostile = "file name \xff\xfe.txt";
    EXPECT_NO_THROW(Logger::getInstance().log(LogLevel::INFO, "cli", hostile));
    EXPECT_EQ(countOccurrences(readFileContents(testLogFile), "file name"), 1);
}

TEST_F(LoggerTest, LogRotation) {
    const std::string testLogFile = testFile("test_rotation.log");
    testFile("test_rotation.log.1");
    testFile("test_rotation.log.2");
    testFile("test_rotation.log.3");

    const long long maxSize = 256;
    ASSERT_NO_THROW(Logger::init(testLogFile, LogLevel::INFO, maxSize, 2));
    for (int i = 0; i < 40; ++i) {
        Logger::getInstance().log(LogLevel::INFO, "rotation message number " + std::to_string(i));
    }

    EXPECT_NE(readFileContents(testLogFile + ".1"), "");
    EXPECT_NE(readFileContents(testLogFile + ".2"), "");
    EXPECT_EQ(readFileContents(testLogFile + ".3"), "");
    // The newest message is always in the active file.
    EXPECT_EQ(countOccurrences(readFileContents(testLogFile), "number 39"), 1);
}

TEST_F(LoggerTest, LogRotationNoBackups) {
    const std::string testLogFile = testFile("test_rotation_nobackup.log");
    testFile("test_rotation_nobackup.log.1");

    ASSERT_NO_THROW(Logger::init(testLogFile, LogLevel::INFO, 128, 0));
    for (int i = 0; i < 20; ++i) {
        Logger::getInstance().log(LogLevel::INFO, "line " + std::to_string(i));
    }
    EXPECT_EQ(readFileContents(testLogFile + ".1"), "");
    EXPECT_EQ(countOccurrences(readFileContents(testLogFile), "line 0\""), 0);
}

TEST_F(LoggerTest, ReinitializationTest) {
    const std::string fileA = testFile("test_reinit_a.log");
    const std::string fileB = testFile("test_reinit_b.log");

    Logger::init(fileA, LogLevel::INFO);
    Logger::getInstance().log(LogLevel::INFO, "to A");
    Logger::init(fileB, LogLevel::INFO);
    Logger::getInstance().log(LogLevel::INFO, "to B");

    EXPECT_EQ(countOccurrences(readFileContents(fileA), "to A"), 1);
    EXPECT_EQ(countOccurrences(readFileContents(fileA), "to B"), 0);
    EXPECT_EQ(countOccurrences(readFileContents(fileB), "to B"), 1);
}

TEST(LoggerLevels, ParsesNames) {
    EXPECT_EQ(Logger::levelFromString("debug"), LogLevel::DEBUG);
    EXPECT_EQ(Logger::levelFromString("WARN"), LogLevel::WARN);
    EXPECT_EQ(Logger::levelFromString("warning"), LogLevel::WARN);
    EXPECT_EQ(Logger::levelFromString("bogus"), LogLevel::INFO);
}

TEST(VarDir, ResolvesLogDestination) {
    std::string warning;
    EXPECT_EQ(quickshare::resolveLogFile("/tmp/explicit.log", "relay", warning), "/tmp/explicit.log");
    EXPECT_TRUE(warning.empty());

    const std::string path = quickshare::resolveLogFile("", "quickshare_relay", warning);
    EXPECT_EQ(path, quickshare::logsDir() + "/quickshare_relay.log");
    EXPECT_TRUE(warning.empty());
}
