/**
 * @file test_error.cpp
 * @brief Tests for result codes and the logger
 */

#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "parley/core/logger.h"
#include "parley/core/parley_error.h"

using namespace parley;

namespace {

struct CapturedLog {
    LogLevel level;
    std::string category;
    std::string message;
};

void capture_log(LogLevel level, const char* category, const char* message, void* user_data) {
    auto* logs = static_cast<std::vector<CapturedLog>*>(user_data);
    logs->push_back({level, category, message});
}

}  // namespace

// =============================================================================
// ERROR CODES
// =============================================================================

TEST(ParleyError, SuccessAndFailure) {
    EXPECT_TRUE(succeeded(ErrorCode::Success));
    EXPECT_FALSE(failed(ErrorCode::Success));
    EXPECT_TRUE(failed(ErrorCode::CaptureFailed));
    EXPECT_EQ(static_cast<int>(ErrorCode::Success), 0);
}

TEST(ParleyError, CategoriesFollowCodeRanges) {
    EXPECT_STREQ(error_category(ErrorCode::Success), "Success");
    EXPECT_STREQ(error_category(ErrorCode::NotInitialized), "Initialization");
    EXPECT_STREQ(error_category(ErrorCode::GenerationFailed), "Generation");
    EXPECT_STREQ(error_category(ErrorCode::RateLimited), "Generation");
    EXPECT_STREQ(error_category(ErrorCode::ContentFiltered), "Generation");
    EXPECT_STREQ(error_category(ErrorCode::Timeout), "Network");
    EXPECT_STREQ(error_category(ErrorCode::AlreadyDisposed), "ComponentState");
    EXPECT_STREQ(error_category(ErrorCode::ConfigParseFailed), "Validation");
    EXPECT_STREQ(error_category(ErrorCode::TranscriptionFailed), "Audio");
    EXPECT_STREQ(error_category(ErrorCode::Cancelled), "Other");
    EXPECT_STREQ(error_category(static_cast<ErrorCode>(-5)), "Unknown");
}

TEST(ParleyError, MessagesAreNonEmpty) {
    const ErrorCode codes[] = {ErrorCode::NotInitialized, ErrorCode::InvalidApiKey,
                               ErrorCode::NetworkError,   ErrorCode::InvalidState,
                               ErrorCode::InvalidArgument, ErrorCode::SpeechFailed,
                               ErrorCode::Unknown};
    for (ErrorCode code : codes) {
        EXPECT_GT(std::string(error_message(code)).size(), 0u);
    }
    EXPECT_STREQ(error_message(ErrorCode::AlreadyDisposed), "Already disposed");
}

TEST(ParleyError, MakeErrorInfoAppendsDetail) {
    ErrorInfo info = make_error_info(ErrorCode::TranscriptionFailed, "model missing");
    EXPECT_EQ(info.code, ErrorCode::TranscriptionFailed);
    EXPECT_EQ(info.category, "Audio");
    EXPECT_EQ(info.message, "Transcription failed: model missing");

    info = make_error_info(ErrorCode::Timeout);
    EXPECT_EQ(info.message, "Operation timed out");
}

// =============================================================================
// LOGGER
// =============================================================================

TEST(Logger, RoutesToCallbackAboveMinLevel) {
    std::vector<CapturedLog> logs;
    Logger& logger = Logger::instance();
    const LogLevel previous = logger.min_level();
    logger.set_callback(capture_log, &logs);
    logger.set_min_level(LogLevel::Info);

    PARLEY_LOG_DEBUG("Test", "hidden %d", 1);
    PARLEY_LOG_WARNING("Test", "shown %d", 2);

    logger.set_callback(nullptr);
    logger.set_min_level(previous);

    ASSERT_EQ(logs.size(), 1u);
    EXPECT_EQ(logs[0].level, LogLevel::Warning);
    EXPECT_EQ(logs[0].category, "Test");
    EXPECT_EQ(logs[0].message, "shown 2");
}

TEST(Logger, LevelNames) {
    LogLevel level = LogLevel::Info;
    EXPECT_TRUE(Logger::level_from_string("debug", level));
    EXPECT_EQ(level, LogLevel::Debug);
    EXPECT_TRUE(Logger::level_from_string("error", level));
    EXPECT_EQ(level, LogLevel::Error);
    EXPECT_FALSE(Logger::level_from_string("loud", level));
    EXPECT_EQ(level, LogLevel::Error);
    EXPECT_STREQ(Logger::level_to_string(LogLevel::Warning), "WARN");
}
