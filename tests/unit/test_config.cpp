#include <gtest/gtest.h>
#include "utils/config.hpp"
#include "utils/error_handler.hpp"
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <stdexcept>

using namespace livetranslate::utils;

class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        unsetenv("USE_MOCK_TRANSLATOR");
        unsetenv("LIVETRANSLATE_MODEL_PATH");
    }

    void TearDown() override {
        unsetenv("USE_MOCK_TRANSLATOR");
        unsetenv("LIVETRANSLATE_MODEL_PATH");
        std::remove(tempPath_.c_str());
    }

    std::string writeTempConfig(const std::string& content) {
        std::ofstream out(tempPath_);
        out << content;
        return tempPath_;
    }

    std::string tempPath_ = "livetranslate_config_test.json";
};

TEST_F(ConfigTest, DefaultValues) {
    auto config = Config::load("nonexistent.json");
    EXPECT_EQ(config.getHost(), "0.0.0.0");
    EXPECT_EQ(config.getPort(), 8000);
    EXPECT_EQ(config.getLogLevel(), "INFO");
    EXPECT_FALSE(config.useMock());
    EXPECT_EQ(config.getSourceLang(), "fr");
    EXPECT_EQ(config.getTargetLang(), "en-US");
    EXPECT_EQ(config.getMaxNewTokens(), 512);
    EXPECT_EQ(config.getGenerationTimeoutMs(), 120000);
    EXPECT_TRUE(config.serializeGeneration());
}

TEST_F(ConfigTest, LoadsFromFile) {
    auto path = writeTempConfig(R"({"port": 9100, "use_mock": true, "mock_chunk_delay_ms": 5})");
    auto config = Config::load(path);

    EXPECT_EQ(config.getPort(), 9100);
    EXPECT_TRUE(config.useMock());
    EXPECT_EQ(config.getMockChunkDelayMs(), 5);
    EXPECT_EQ(config.getHost(), "0.0.0.0");
}

TEST_F(ConfigTest, MalformedFileFallsBackToDefaults) {
    auto& handler = ErrorHandler::getInstance();
    handler.clearErrorHistory();

    auto path = writeTempConfig("{\"port\": ");
    auto config = Config::load(path);

    EXPECT_EQ(config.getPort(), 8000);
    EXPECT_EQ(handler.getErrorCount(ErrorCategory::CONFIGURATION), 1u);
}

TEST_F(ConfigTest, WrongTypesKeepDefaults) {
    auto config = Config::fromJson(R"({"port": "9000", "use_mock": "yes", "host": 12})");

    EXPECT_EQ(config.getPort(), 8000);
    EXPECT_FALSE(config.useMock());
    EXPECT_EQ(config.getHost(), "0.0.0.0");
}

TEST_F(ConfigTest, RejectsInvalidValues) {
    EXPECT_THROW(Config::fromJson(R"({"port": 70000})"), ConfigurationException);
    EXPECT_THROW(Config::fromJson(R"({"max_new_tokens": 0})"), ConfigurationException);
    EXPECT_THROW(Config::fromJson("[1, 2]"), ConfigurationException);
    // Syntax errors come straight from the JSON parser
    EXPECT_THROW(Config::fromJson("{"), std::runtime_error);
}

TEST_F(ConfigTest, ClampsNegativeDurations) {
    auto config = Config::fromJson(R"({"generation_timeout_ms": -5, "worker_threads": 0})");

    EXPECT_EQ(config.getGenerationTimeoutMs(), 0);
    EXPECT_EQ(config.getWorkerThreads(), 1u);
}

TEST_F(ConfigTest, EnvironmentOverrides) {
    setenv("USE_MOCK_TRANSLATOR", "TRUE", 1);
    setenv("LIVETRANSLATE_MODEL_PATH", "/tmp/model.gguf", 1);

    auto config = Config::defaults();
    config.applyEnvironment();

    EXPECT_TRUE(config.useMock());
    EXPECT_EQ(config.getModelPath(), "/tmp/model.gguf");
}

TEST_F(ConfigTest, EnvironmentCanDisableMock) {
    setenv("USE_MOCK_TRANSLATOR", "false", 1);

    auto config = Config::fromJson(R"({"use_mock": true})");
    config.applyEnvironment();

    EXPECT_FALSE(config.useMock());
}
