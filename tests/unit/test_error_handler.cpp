#include "utils/error_handler.hpp"
#include <gtest/gtest.h>
#include <stdexcept>
#include <vector>

using namespace livenotes::utils;

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
    ErrorInfo error(ErrorCategory::STT, ErrorSeverity::ERROR,
                    "Test message", "Test details", "Test context", "session123");

    EXPECT_EQ(error.category, ErrorCategory::STT);
    EXPECT_EQ(error.severity, ErrorSeverity::ERROR);
    EXPECT_EQ(error.message, "Test message");
    EXPECT_EQ(error.details, "Test details");
    EXPECT_EQ(error.context, "Test context");
    EXPECT_EQ(error.session_id, "session123");
    EXPECT_EQ(error.id.rfind("err_", 0), 0u);
}

TEST_F(ErrorHandlerTest, ErrorInfoUniqueIds) {
    ErrorInfo error1(ErrorCategory::ANALYSIS, ErrorSeverity::WARNING, "Message 1");
    ErrorInfo error2(ErrorCategory::ANALYSIS, ErrorSeverity::WARNING, "Message 2");

    EXPECT_NE(error1.id, error2.id);
}

TEST_F(ErrorHandlerTest, ExceptionMessages) {
    ConfigException config_ex("Invalid JSON configuration", "server.json");
    EXPECT_STREQ(config_ex.what(), "Invalid JSON configuration: server.json");
    EXPECT_EQ(config_ex.getErrorInfo().category, ErrorCategory::CONFIGURATION);

    HttpException http_ex("Request failed", 503, "https://example.invalid");
    EXPECT_EQ(http_ex.getStatusCode(), 503);
    EXPECT_STREQ(http_ex.what(), "Request failed: HTTP 503");
    EXPECT_EQ(http_ex.getErrorInfo().category, ErrorCategory::NETWORK);

    AnalysisException analysis_ex("Bad reply");
    EXPECT_EQ(analysis_ex.getErrorInfo().severity, ErrorSeverity::WARNING);
}

TEST_F(ErrorHandlerTest, ReportingKeepsCategoryCounts) {
    auto& handler = ErrorHandler::getInstance();

    handler.reportError(ErrorInfo(ErrorCategory::STT, ErrorSeverity::ERROR, "stt down"));
    handler.reportError(ErrorInfo(ErrorCategory::STT, ErrorSeverity::WARNING, "stt slow"));
    handler.reportError(ErrorInfo(ErrorCategory::WEBSOCKET, ErrorSeverity::WARNING, "bad frame"));

    EXPECT_EQ(handler.getErrorCount(ErrorCategory::STT), 2u);
    EXPECT_EQ(handler.getErrorCount(ErrorCategory::WEBSOCKET), 1u);
    EXPECT_EQ(handler.getErrorCount(ErrorCategory::ANALYSIS), 0u);
    EXPECT_EQ(handler.getErrorCount(), 3u);

    auto recent = handler.getRecentErrors(2);
    ASSERT_EQ(recent.size(), 2u);
    EXPECT_EQ(recent[0].message, "stt slow");
    EXPECT_EQ(recent[1].message, "bad frame");
}

TEST_F(ErrorHandlerTest, ReportsExceptionsWithContext) {
    auto& handler = ErrorHandler::getInstance();

    handler.reportError(STTException("Transcription request failed"), "transcription", "s1");
    handler.reportError(std::runtime_error("boom"), "worker");

    auto recent = handler.getRecentErrors(2);
    ASSERT_EQ(recent.size(), 2u);
    EXPECT_EQ(recent[0].category, ErrorCategory::STT);
    EXPECT_EQ(recent[0].context, "transcription");
    EXPECT_EQ(recent[0].session_id, "s1");
    EXPECT_EQ(recent[1].category, ErrorCategory::UNKNOWN);
    EXPECT_EQ(recent[1].message, "boom");
}

TEST_F(ErrorHandlerTest, CallbackSeesEveryReport) {
    std::vector<std::string> seen;
    ErrorHandler::getInstance().setErrorCallback([&seen](const ErrorInfo& error) {
        seen.push_back(error.message);
    });

    ErrorHandler::getInstance().reportError(ErrorInfo(ErrorCategory::ANALYSIS, ErrorSeverity::INFO, "closed"));

    ASSERT_EQ(seen.size(), 1u);
    EXPECT_EQ(seen[0], "closed");
}

TEST_F(ErrorHandlerTest, ErrorContextNests) {
    EXPECT_EQ(ErrorContext::getCurrentContext(), "");
    {
        ErrorContext outer("transcription", "s1");
        EXPECT_EQ(ErrorContext::getCurrentContext(), "transcription");
        {
            ErrorContext inner("analysis", "s1");
            EXPECT_EQ(ErrorContext::getCurrentContext(), "analysis");
        }
        EXPECT_EQ(ErrorContext::getCurrentContext(), "transcription");
        EXPECT_EQ(ErrorContext::getCurrentSessionId(), "s1");
    }
    EXPECT_EQ(ErrorContext::getCurrentContext(), "");
}
