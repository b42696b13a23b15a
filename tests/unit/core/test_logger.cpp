#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <hyper-cri/core/logger.hpp>
#include <sstream>
#include <string>
#include <vector>

using namespace hyper_cri;

class LoggerTest : public ::testing::Test {
protected:
    void SetUp() override
    {
        test_dir_ = std::filesystem::temp_directory_path() / "hyper_cri_logger_test";
        std::filesystem::create_directories(test_dir_);

        Logger::resetInstance(kLoggerName);
        logger_ = Logger::getInstance(kLoggerName);
        logger_->setConsoleSinkEnabled(false);
    }

    void TearDown() override
    {
        Logger::resetInstance(kLoggerName);
        std::filesystem::remove_all(test_dir_);
    }

    static constexpr const char* kLoggerName = "logger-test";
    Logger* logger_ = nullptr;
    std::filesystem::path test_dir_;
};

TEST_F(LoggerTest, DefaultLevelIsInfo)
{
    EXPECT_EQ(logger_->getLevel(), LogLevel::INFO);
    EXPECT_TRUE(logger_->isLevelEnabled(LogLevel::INFO));
    EXPECT_TRUE(logger_->isLevelEnabled(LogLevel::ERROR));
    EXPECT_FALSE(logger_->isLevelEnabled(LogLevel::DEBUG));
}

TEST_F(LoggerTest, SameNameReturnsSameInstance)
{
    EXPECT_EQ(Logger::getInstance(kLoggerName), logger_);
    EXPECT_EQ(logger_->getName(), kLoggerName);
}

TEST_F(LoggerTest, PlaceholdersAreSubstituted)
{
    std::vector<LogMessage> messages;
    logger_->addSink([&messages](const LogMessage& message) { messages.push_back(message); });

    logger_->info("Start pod {} failed: {}", "pod-1", 42);

    ASSERT_EQ(messages.size(), 1u);
    EXPECT_EQ(messages[0].message, "Start pod pod-1 failed: 42");
    EXPECT_EQ(messages[0].level, LogLevel::INFO);
    EXPECT_EQ(messages[0].logger_name, kLoggerName);
}

TEST_F(LoggerTest, MissingArgumentsLeavePlaceholders)
{
    std::vector<std::string> messages;
    logger_->addSink([&messages](const LogMessage& message) { messages.push_back(message.message); });

    logger_->warning("Remove pod {} failed: {}", "pod-7");
    logger_->warning("no placeholders", "extra");

    ASSERT_EQ(messages.size(), 2u);
    EXPECT_EQ(messages[0], "Remove pod pod-7 failed: {}");
    EXPECT_EQ(messages[1], "no placeholders");
}

TEST_F(LoggerTest, LevelFiltering)
{
    std::vector<LogLevel> levels;
    logger_->addSink([&levels](const LogMessage& message) { levels.push_back(message.level); });

    logger_->setLevel(LogLevel::WARNING);
    logger_->debug("dropped");
    logger_->info("dropped");
    logger_->warning("kept");
    logger_->error("kept");

    ASSERT_EQ(levels.size(), 2u);
    EXPECT_EQ(levels[0], LogLevel::WARNING);
    EXPECT_EQ(levels[1], LogLevel::ERROR);
}

TEST_F(LoggerTest, SinkLevelThreshold)
{
    int error_count = 0;
    logger_->addSink([&error_count](const LogMessage&) { ++error_count; }, LogLevel::ERROR);

    logger_->info("info");
    logger_->warning("warning");
    logger_->error("error");
    logger_->critical("critical");

    EXPECT_EQ(error_count, 2);
}

TEST_F(LoggerTest, ConsoleOutputUsesPattern)
{
    logger_->setConsoleSinkEnabled(true);
    logger_->setPattern("[%l] %n: %v");

    ::testing::internal::CaptureStdout();
    logger_->error("GetPodList failed: {}", "timeout");
    std::string output = ::testing::internal::GetCapturedStdout();

    EXPECT_EQ(output, "[ERROR] logger-test: GetPodList failed: timeout\n");
}

TEST_F(LoggerTest, FileSinkWritesMessages)
{
    auto log_path = test_dir_ / "nested" / "runtime.log";
    logger_->setPattern("%l %v");
    logger_->addFileSink(log_path, LogLevel::INFO);

    logger_->debug("not written");
    logger_->info("written {}", 1);
    logger_->flush();

    std::ifstream file(log_path);
    ASSERT_TRUE(file.is_open());
    std::stringstream content;
    content << file.rdbuf();
    EXPECT_EQ(content.str(), "INFO written 1\n");
}

TEST_F(LoggerTest, ClearSinksStopsDelivery)
{
    int count = 0;
    logger_->addSink([&count](const LogMessage&) { ++count; });
    logger_->info("one");
    logger_->clearSinks();
    logger_->info("two");

    EXPECT_EQ(count, 1);
}

TEST_F(LoggerTest, LevelStringConversion)
{
    EXPECT_EQ(toString(LogLevel::WARNING), "WARNING");
    EXPECT_EQ(fromString("debug"), LogLevel::DEBUG);
    EXPECT_EQ(fromString("Warn"), LogLevel::WARNING);
    EXPECT_EQ(fromString("CRITICAL"), LogLevel::CRITICAL);
    EXPECT_EQ(fromString("nonsense"), LogLevel::INFO);
}
