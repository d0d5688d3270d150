#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "utils/error_handler.hpp"
#include <stdexcept>
#include <thread>
#include <vector>

using namespace livetranslate::utils;
using ::testing::_;
using ::testing::Field;

class ErrorHandlerTest : public ::testing::Test {
protected:
    void SetUp() override {
        ErrorHandler::getInstance().clearErrorHistory();
    }

    void TearDown() override {
        ErrorHandler::getInstance().clearErrorHistory();
        ErrorHandler::getInstance().setErrorCallback(nullptr);
    }
};

TEST_F(ErrorHandlerTest, ErrorInfoCreation) {
    ErrorInfo error(ErrorCategory::WEBSOCKET, ErrorSeverity::ERROR,
                    "Test message", "Test details", "Test context", "session123");

    EXPECT_EQ(error.category, ErrorCategory::WEBSOCKET);
    EXPECT_EQ(error.severity, ErrorSeverity::ERROR);
    EXPECT_EQ(error.message, "Test message");
    EXPECT_EQ(error.details, "Test details");
    EXPECT_EQ(error.context, "Test context");
    EXPECT_EQ(error.session_id, "session123");
    EXPECT_EQ(error.id.rfind("err_", 0), 0u);
    EXPECT_EQ(error.id.size(), 12u);
}

TEST_F(ErrorHandlerTest, ErrorInfoUniqueIds) {
    ErrorInfo error1(ErrorCategory::GENERATION, ErrorSeverity::WARNING, "Message 1");
    ErrorInfo error2(ErrorCategory::GENERATION, ErrorSeverity::WARNING, "Message 2");

    EXPECT_NE(error1.id, error2.id);
}

TEST_F(ErrorHandlerTest, ExceptionWhatIncludesDetails) {
    ErrorInfo error(ErrorCategory::GENERATION, ErrorSeverity::ERROR,
                    "Translation failed", "Model not loaded");

    LiveTranslateException exception(error);

    EXPECT_STREQ(exception.what(), "Translation failed: Model not loaded");
    EXPECT_EQ(exception.getErrorInfo().category, ErrorCategory::GENERATION);
}

TEST_F(ErrorHandlerTest, SpecificExceptions) {
    InputException input_ex("Empty text received", "session1");
    EXPECT_EQ(input_ex.getErrorInfo().category, ErrorCategory::INPUT);
    EXPECT_EQ(input_ex.getErrorInfo().session_id, "session1");
    EXPECT_STREQ(input_ex.what(), "Empty text received");

    DetectionException detect_ex("Text too short");
    EXPECT_EQ(detect_ex.getErrorInfo().category, ErrorCategory::DETECTION);
    EXPECT_EQ(detect_ex.getErrorInfo().context, "Detection");

    GenerationException gen_ex("Generation cancelled");
    EXPECT_EQ(gen_ex.getErrorInfo().category, ErrorCategory::GENERATION);
    EXPECT_STREQ(gen_ex.what(), "Generation cancelled");

    ProtocolException proto_ex("Translation already in progress", "session2");
    EXPECT_EQ(proto_ex.getErrorInfo().category, ErrorCategory::PROTOCOL);

    WebSocketException ws_ex("Connection lost", "session3");
    EXPECT_EQ(ws_ex.getErrorInfo().category, ErrorCategory::WEBSOCKET);
    EXPECT_EQ(ws_ex.getErrorInfo().session_id, "session3");

    ModelLoadingException model_ex("Failed to load", "/models/model.gguf");
    EXPECT_EQ(model_ex.getErrorInfo().category, ErrorCategory::MODEL_LOADING);
    EXPECT_EQ(model_ex.getErrorInfo().severity, ErrorSeverity::CRITICAL);
    EXPECT_STREQ(model_ex.what(), "Failed to load: /models/model.gguf");

    ConfigurationException config_ex("port out of range", "70000");
    EXPECT_EQ(config_ex.getErrorInfo().category, ErrorCategory::CONFIGURATION);
    EXPECT_EQ(config_ex.getErrorInfo().context, "Configuration");
    EXPECT_STREQ(config_ex.what(), "port out of range: 70000");
}

TEST_F(ErrorHandlerTest, ReportAndCount) {
    auto& handler = ErrorHandler::getInstance();

    handler.reportError(ErrorInfo(ErrorCategory::INPUT, ErrorSeverity::WARNING, "bad input"));
    handler.reportError(ErrorInfo(ErrorCategory::GENERATION, ErrorSeverity::ERROR, "engine failed"));
    handler.reportError(ErrorInfo(ErrorCategory::GENERATION, ErrorSeverity::ERROR, "timeout"));

    EXPECT_EQ(handler.getErrorCount(ErrorCategory::INPUT), 1u);
    EXPECT_EQ(handler.getErrorCount(ErrorCategory::GENERATION), 2u);
    EXPECT_EQ(handler.getErrorCount(ErrorCategory::PROTOCOL), 0u);
    EXPECT_EQ(handler.getErrorCount(), 3u);
}

TEST_F(ErrorHandlerTest, ReportKnownExceptionKeepsCategory) {
    auto& handler = ErrorHandler::getInstance();

    handler.reportError(GenerationException("boom"), "pump", "session9");

    auto recent = handler.getRecentErrors(1);
    ASSERT_EQ(recent.size(), 1u);
    EXPECT_EQ(recent[0].category, ErrorCategory::GENERATION);
    EXPECT_EQ(recent[0].context, "pump");
    EXPECT_EQ(recent[0].session_id, "session9");
}

TEST_F(ErrorHandlerTest, ReportForeignExceptionIsUnknown) {
    auto& handler = ErrorHandler::getInstance();

    handler.reportError(std::runtime_error("plain failure"), "test");

    auto recent = handler.getRecentErrors(1);
    ASSERT_EQ(recent.size(), 1u);
    EXPECT_EQ(recent[0].category, ErrorCategory::UNKNOWN);
    EXPECT_EQ(recent[0].message, "plain failure");
}

TEST_F(ErrorHandlerTest, RecentErrorsReturnsNewest) {
    auto& handler = ErrorHandler::getInstance();

    for (int i = 0; i < 5; ++i) {
        handler.reportError(ErrorInfo(ErrorCategory::CONFIGURATION, ErrorSeverity::INFO, "error " + std::to_string(i)));
    }

    auto recent = handler.getRecentErrors(2);
    ASSERT_EQ(recent.size(), 2u);
    EXPECT_EQ(recent[0].message, "error 3");
    EXPECT_EQ(recent[1].message, "error 4");
}

TEST_F(ErrorHandlerTest, CallbackInvoked) {
    ::testing::MockFunction<void(const ErrorInfo&)> callback;
    EXPECT_CALL(callback, Call(Field(&ErrorInfo::message, "watched"))).Times(1);

    auto& handler = ErrorHandler::getInstance();
    handler.setErrorCallback(callback.AsStdFunction());
    handler.reportError(ErrorInfo(ErrorCategory::WEBSOCKET, ErrorSeverity::ERROR, "watched"));
}

TEST_F(ErrorHandlerTest, CallbackMayQueryHandler) {
    auto& handler = ErrorHandler::getInstance();
    size_t seen = 0;
    handler.setErrorCallback([&](const ErrorInfo&) {
        seen = ErrorHandler::getInstance().getErrorCount();
    });

    handler.reportError(ErrorInfo(ErrorCategory::INPUT, ErrorSeverity::WARNING, "first"));
    EXPECT_EQ(seen, 1u);
}

TEST_F(ErrorHandlerTest, ThrowingCallbackIsContained) {
    auto& handler = ErrorHandler::getInstance();
    handler.setErrorCallback([](const ErrorInfo&) {
        throw std::runtime_error("callback failed");
    });

    EXPECT_NO_THROW(handler.reportError(ErrorInfo(ErrorCategory::INPUT, ErrorSeverity::WARNING, "x")));
    EXPECT_EQ(handler.getErrorCount(), 1u);
}

TEST_F(ErrorHandlerTest, ConcurrentReports) {
    auto& handler = ErrorHandler::getInstance();
    std::vector<std::thread> threads;

    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&handler]() {
            for (int i = 0; i < 50; ++i) {
                handler.reportError(ErrorInfo(ErrorCategory::GENERATION, ErrorSeverity::INFO, "concurrent"));
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_EQ(handler.getErrorCount(ErrorCategory::GENERATION), 200u);
}

TEST_F(ErrorHandlerTest, CategoryNames) {
    EXPECT_EQ(ErrorHandler::categoryToString(ErrorCategory::INPUT), "Input");
    EXPECT_EQ(ErrorHandler::categoryToString(ErrorCategory::GENERATION), "Generation");
    EXPECT_EQ(ErrorHandler::categoryToString(ErrorCategory::MODEL_LOADING), "ModelLoading");
    EXPECT_EQ(ErrorHandler::categoryToString(ErrorCategory::CONFIGURATION), "Configuration");
}
