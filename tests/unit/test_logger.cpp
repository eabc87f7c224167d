#include <gtest/gtest.h>
#include "utils/Logger.hpp"
#include "codec/ChecksumCodec.hpp"
#include "codec/CrcCodec.hpp"
#include <cstdlib>
#include <regex>
#include <sstream>

using namespace bitguard::utils;

class LoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        saved_level_ = Logger::getInstance().getLevel();
        Logger::getInstance().setOutput(&captured_);
    }

    void TearDown() override {
        Logger::getInstance().setOutput(nullptr);
        Logger::getInstance().setLevel(saved_level_);
        unsetenv(Logger::LEVEL_ENV_VAR);
    }

    std::ostringstream captured_;
    LogLevel saved_level_{LogLevel::INFO};
};

TEST_F(LoggerTest, FiltersBelowLevel) {
    Logger::getInstance().setLevel(LogLevel::WARN);

    LOG_INFO("hidden");
    LOG_WARN("shown ", 42);

    std::string text = captured_.str();
    EXPECT_EQ(text.find("hidden"), std::string::npos);
    EXPECT_NE(text.find("[WARN ] shown 42"), std::string::npos);
}

TEST_F(LoggerTest, ParseLevel) {
    EXPECT_EQ(Logger::parseLevel("debug"), LogLevel::DEBUG);
    EXPECT_EQ(Logger::parseLevel("WARN"), LogLevel::WARN);
    EXPECT_EQ(Logger::parseLevel("warning"), LogLevel::WARN);
    EXPECT_FALSE(Logger::parseLevel("loud").has_value());
}

TEST_F(LoggerTest, LevelFromEnvironment) {
    Logger::getInstance().setLevel(LogLevel::INFO);

    setenv(Logger::LEVEL_ENV_VAR, "error", 1);
    EXPECT_TRUE(Logger::getInstance().configureFromEnvironment());
    EXPECT_EQ(Logger::getInstance().getLevel(), LogLevel::ERROR);

    setenv(Logger::LEVEL_ENV_VAR, "nonsense", 1);
    EXPECT_FALSE(Logger::getInstance().configureFromEnvironment());
    EXPECT_EQ(Logger::getInstance().getLevel(), LogLevel::ERROR);
}

TEST_F(LoggerTest, CodecReportsCorruption) {
    Logger::getInstance().setLevel(LogLevel::WARN);

    bitguard::codec::CrcCodec codec;
    auto codeword = codec.encode(BitString::fromString("1101011011"));
    codeword.flip(2);
    EXPECT_EQ(codec.verify(codeword), bitguard::codec::VerifyStatus::CORRUPTED);

    EXPECT_NE(captured_.str().find("CrcCodec: Non-zero remainder"), std::string::npos);
}

TEST_F(LoggerTest, LineFormat) {
    Logger::getInstance().setLevel(LogLevel::INFO);

    LOG_INFO("ready");

    std::regex line(R"(\[\d{2}:\d{2}:\d{2}\.\d{3}\] \[INFO \] ready\n)");
    EXPECT_TRUE(std::regex_match(captured_.str(), line)) << captured_.str();
}

TEST_F(LoggerTest, ChecksumWarnsAboutWidthOne) {
    Logger::getInstance().setLevel(LogLevel::WARN);

    bitguard::codec::ChecksumCodec::Config config;
    config.block_width = 1;
    bitguard::codec::ChecksumCodec codec(config);

    EXPECT_NE(captured_.str().find("ChecksumCodec: 1-bit blocks detect nothing"),
              std::string::npos);
}
