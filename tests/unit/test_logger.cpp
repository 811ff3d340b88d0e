#include <gtest/gtest.h>

#include "Logger.h"
#include "LoggerMacros.h"

#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <unistd.h>

using namespace RelayPipe;

namespace fs = std::filesystem;

class LoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = fs::temp_directory_path() / ("relaypipe_logger_test_" + std::to_string(::getpid()));
        fs::remove_all(dir_);
        fs::create_directories(dir_);
        path_ = (dir_ / "relay.log").string();

        auto& logger = Logger::instance();
        previousLevel_ = logger.getLevel();
        logger.setConsoleOutput(false);
        logger.setLogFile(path_);
    }

    void TearDown() override {
        auto& logger = Logger::instance();
        logger.setLogFile("");
        logger.setMaxFileSize(100);
        logger.setLevel(previousLevel_);
        logger.setConsoleOutput(true);
        std::error_code ec;
        fs::remove_all(dir_, ec);
    }

    std::string contents() const {
        std::ifstream in(path_);
        std::stringstream ss;
        ss << in.rdbuf();
        return ss.str();
    }

    fs::path dir_;
    std::string path_;
    LogLevel previousLevel_{LogLevel::INFO};
};

TEST_F(LoggerTest, ParseLevel) {
    EXPECT_EQ(Logger::parseLevel("debug"), LogLevel::DEBUG);
    EXPECT_EQ(Logger::parseLevel("INFO"), LogLevel::INFO);
    EXPECT_EQ(Logger::parseLevel("warn"), LogLevel::WARN);
    EXPECT_EQ(Logger::parseLevel("Warning"), LogLevel::WARN);
    EXPECT_EQ(Logger::parseLevel("error"), LogLevel::ERROR);
    EXPECT_EQ(Logger::parseLevel("critical"), LogLevel::CRITICAL);
    EXPECT_EQ(Logger::parseLevel("loud"), LogLevel::INFO);
    EXPECT_EQ(Logger::parseLevel("", LogLevel::WARN), LogLevel::WARN);
}

TEST_F(LoggerTest, WritesFormattedLinesToFile) {
    auto& logger = Logger::instance();
    logger.setLevel(LogLevel::INFO);
    logger.info("channel created", "ChannelStore");
    logger.error("push rejected", "Handler");

    auto text = contents();
    EXPECT_NE(text.find("[INFO] [ChannelStore] channel created"), std::string::npos);
    EXPECT_NE(text.find("[ERROR] [Handler] push rejected"), std::string::npos);
}

TEST_F(LoggerTest, LevelFiltersMessages) {
    auto& logger = Logger::instance();
    logger.setLevel(LogLevel::WARN);
    EXPECT_FALSE(logger.isInfoEnabled());
    EXPECT_FALSE(logger.isDebugEnabled());

    logger.debug("hidden debug", "Test");
    logger.info("hidden info", "Test");
    logger.warn("visible warn", "Test");
    LOG_DEBUG_COMP_IF("hidden macro", "Test");

    auto text = contents();
    EXPECT_EQ(text.find("hidden"), std::string::npos);
    EXPECT_NE(text.find("visible warn"), std::string::npos);

    logger.setLevel(LogLevel::DEBUG);
    LOG_DEBUG_COMP_IF("shown macro", "Test");
    EXPECT_NE(contents().find("[DEBUG] [Test] shown macro"), std::string::npos);
}

TEST_F(LoggerTest, DefaultComponentIsUsed) {
    auto& logger = Logger::instance();
    logger.setLevel(LogLevel::INFO);
    logger.setComponent("Server");
    logger.info("no component given");
    logger.setComponent("Relay");

    EXPECT_NE(contents().find("[Server] no component given"), std::string::npos);
}

TEST_F(LoggerTest, RotatesWhenFileTooLarge) {
    auto& logger = Logger::instance();
    logger.setLevel(LogLevel::INFO);
    logger.setMaxFileSize(0);
    logger.info("first line triggers rotation", "Test");

    bool rotated = false;
    for (const auto& entry : fs::directory_iterator(dir_)) {
        auto name = entry.path().filename().string();
        if (name.rfind("relay.log.", 0) == 0) {
            rotated = true;
            std::ifstream in(entry.path());
            std::stringstream ss;
            ss << in.rdbuf();
            EXPECT_NE(ss.str().find("first line triggers rotation"), std::string::npos);
        }
    }
    EXPECT_TRUE(rotated);
    EXPECT_NE(contents().find("Log file rotated to"), std::string::npos);
}
