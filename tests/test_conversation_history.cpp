/**
 * @file test_conversation_history.cpp
 * @brief Tests for the bounded chat history and response cleanup
 */

#include <gtest/gtest.h>

#include <string>

#include "parley/features/conversation/conversation_history.h"

using parley::ConversationHistory;
using parley::HistoryStats;
using parley::MessageRole;

namespace {

// Alternating user/assistant messages named m<start>..m<start+count-1>
void add_turns(ConversationHistory& history, int count, int start = 0) {
    for (int i = start; i < start + count; ++i) {
        const std::string text = "m" + std::to_string(i);
        if (i % 2 == 0) {
            history.add_user(text);
        } else {
            history.add_assistant(text);
        }
    }
}

}  // namespace

// =============================================================================
// TRIMMING
// =============================================================================

TEST(ConversationHistory, KeepsSystemPromptAndMostRecentMessages) {
    ConversationHistory history(10);
    history.set_system_prompt("be brief");
    add_turns(history, 11);

    const auto& messages = history.messages();
    ASSERT_EQ(messages.size(), 11u);
    EXPECT_EQ(messages[0].role, MessageRole::System);
    EXPECT_EQ(messages[0].content, "be brief");
    EXPECT_EQ(messages[1].content, "m1");
    EXPECT_EQ(messages[10].content, "m10");
}

TEST(ConversationHistory, NoTrimAtLimit) {
    ConversationHistory history(4);
    add_turns(history, 4);
    EXPECT_EQ(history.size(), 4u);
    EXPECT_EQ(history.messages().front().content, "m0");
}

TEST(ConversationHistory, OddLimitKeepsWholePairs) {
    ConversationHistory history(5);
    add_turns(history, 6);

    ASSERT_EQ(history.size(), 4u);
    EXPECT_EQ(history.messages().front().content, "m2");
    EXPECT_EQ(history.messages().front().role, MessageRole::User);
}

TEST(ConversationHistory, SetMaxLengthTrimsImmediately) {
    ConversationHistory history(20);
    add_turns(history, 10);
    history.set_max_length(4);
    EXPECT_EQ(history.max_length(), 4u);
    ASSERT_EQ(history.size(), 4u);
    EXPECT_EQ(history.messages().front().content, "m6");
}

// =============================================================================
// SYSTEM PROMPT / CLEAR
// =============================================================================

TEST(ConversationHistory, SetSystemPromptReplacesExisting) {
    ConversationHistory history;
    history.set_system_prompt("first");
    add_turns(history, 2);
    history.set_system_prompt("second");

    const HistoryStats stats = history.stats();
    EXPECT_EQ(stats.total_messages, 3u);
    EXPECT_TRUE(stats.has_system_prompt);
    EXPECT_EQ(history.messages().front().content, "second");
}

TEST(ConversationHistory, ClearKeepsSystemPrompt) {
    ConversationHistory history;
    history.set_system_prompt("sys");
    add_turns(history, 4);
    history.clear();

    ASSERT_EQ(history.size(), 1u);
    EXPECT_EQ(history.messages()[0].role, MessageRole::System);
}

TEST(ConversationHistory, DiscardLastNeverRemovesSystem) {
    ConversationHistory history;
    history.set_system_prompt("sys");
    history.add_user("question");

    EXPECT_TRUE(history.discard_last());
    EXPECT_FALSE(history.discard_last());
    EXPECT_EQ(history.size(), 1u);

    ConversationHistory empty;
    EXPECT_FALSE(empty.discard_last());
}

TEST(ConversationHistory, Stats) {
    ConversationHistory history;
    add_turns(history, 3);
    const HistoryStats stats = history.stats();
    EXPECT_EQ(stats.total_messages, 3u);
    EXPECT_EQ(stats.user_messages, 2u);
    EXPECT_EQ(stats.assistant_messages, 1u);
    EXPECT_FALSE(stats.has_system_prompt);
}

// =============================================================================
// PROMPT FORMATTING
// =============================================================================

TEST(ConversationHistory, BuildsChatMlPrompt) {
    ConversationHistory history;
    history.set_system_prompt("sys");
    history.add_user("hi");

    EXPECT_EQ(history.build_chatml_prompt(),
              "<|im_start|>system\nsys<|im_end|>\n"
              "<|im_start|>user\nhi<|im_end|>\n"
              "<|im_start|>assistant\n");
}

TEST(ConversationHistory, RoleNames) {
    EXPECT_STREQ(parley::message_role_name(MessageRole::System), "system");
    EXPECT_STREQ(parley::message_role_name(MessageRole::User), "user");
    EXPECT_STREQ(parley::message_role_name(MessageRole::Assistant), "assistant");
}

// =============================================================================
// RESPONSE CLEANUP
// =============================================================================

TEST(ResponseCleanup, StripsChatMarkersAndRolePrefix) {
    EXPECT_EQ(parley::clean_model_response("<|im_start|>assistant\nHello there<|im_end|>"),
              "Hello there");
    EXPECT_EQ(parley::clean_model_response("Assistant: Sure."), "Sure.");
    EXPECT_EQ(parley::clean_model_response("Done</s>"), "Done");
}

TEST(ResponseCleanup, CollapsesBlankLineRuns) {
    EXPECT_EQ(parley::clean_model_response("a\n\n\n\nb"), "a\n\nb");
}

TEST(ResponseCleanup, LeavesPlainTextAlone) {
    EXPECT_EQ(parley::clean_model_response("The assistant said hi."), "The assistant said hi.");
}

TEST(ResponseCleanup, TrimWhitespace) {
    EXPECT_EQ(parley::trim_whitespace("  hi \n"), "hi");
    EXPECT_EQ(parley::trim_whitespace(" \t\n "), "");
    EXPECT_EQ(parley::trim_whitespace(""), "");
}
