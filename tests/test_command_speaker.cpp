/**
 * @file test_command_speaker.cpp
 * @brief Tests for the external TTS program speaker
 */

#include <gtest/gtest.h>

#include <chrono>
#include <future>
#include <string>
#include <thread>
#include <vector>

#include "process/command_speaker.h"

using namespace parley;

namespace {

CommandSpeakerConfig make_config(const std::string& command, std::vector<std::string> args = {}) {
    CommandSpeakerConfig config;
    config.command = command;
    config.args = std::move(args);
    return config;
}

}  // namespace

// =============================================================================
// ARGUMENTS
// =============================================================================

TEST(CommandSpeaker, ExpandsPlaceholders) {
    CommandSpeakerConfig config = make_config("espeak-ng", {"-v", "{voice}", "-s", "{rate}", "-p{pitch}"});
    config.voice = "en-GB";
    config.rate = 0.75;
    config.pitch = 1.5;
    CommandSpeaker speaker(config);

    const std::vector<std::string> expected = {"espeak-ng", "-v", "en-GB", "-s", "0.75", "-p1.5", "hello"};
    EXPECT_EQ(speaker.build_argv("hello"), expected);
}

// =============================================================================
// INITIALIZE
// =============================================================================

TEST(CommandSpeaker, InitializeChecksCommand) {
    CommandSpeaker empty(make_config(""));
    EXPECT_EQ(empty.initialize(), ErrorCode::InvalidArgument);

    CommandSpeaker missing(make_config("/nonexistent/parley-tts"));
    EXPECT_EQ(missing.initialize(), ErrorCode::FileNotFound);
    EXPECT_NE(missing.last_error().find("not found"), std::string::npos);

    CommandSpeaker shell(make_config("sh"));
    EXPECT_EQ(shell.initialize(), ErrorCode::Success);
}

// =============================================================================
// SPEAK
// =============================================================================

TEST(CommandSpeaker, ExitStatusDecidesResult) {
    CommandSpeaker ok(make_config("sh", {"-c", "exit 0", "parley"}));
    EXPECT_EQ(ok.speak("hello"), ErrorCode::Success);

    CommandSpeaker failing(make_config("sh", {"-c", "exit 3", "parley"}));
    EXPECT_EQ(failing.speak("hello"), ErrorCode::SpeechFailed);
    EXPECT_NE(failing.last_error().find("exited with code 3"), std::string::npos);

    CommandSpeaker unrunnable(make_config("/nonexistent/parley-tts"));
    EXPECT_EQ(unrunnable.speak("hello"), ErrorCode::SpeechFailed);
}

TEST(CommandSpeaker, StopEndsPlaybackCleanly) {
    CommandSpeaker speaker(make_config("sh", {"-c", "sleep 5", "parley"}));

    const auto start = std::chrono::steady_clock::now();
    std::future<ErrorCode> result =
        std::async(std::launch::async, [&speaker]() { return speaker.speak("hello"); });
    std::this_thread::sleep_for(std::chrono::milliseconds(200));
    speaker.stop();

    EXPECT_EQ(result.get(), ErrorCode::Success);
    EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds(4));
}

TEST(CommandSpeaker, EmptyTextIsNoop) {
    CommandSpeaker speaker(make_config("/nonexistent/parley-tts"));
    EXPECT_EQ(speaker.speak(""), ErrorCode::Success);
    EXPECT_TRUE(speaker.reports_completion());
}
