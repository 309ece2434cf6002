/**
 * @file test_chat_protocol.cpp
 * @brief Tests for hosted chat API request/response bodies
 */

#include <gtest/gtest.h>

#include <string>

#include "remote/chat_protocol.h"

using namespace parley;

namespace {

ConversationHistory make_history() {
    ConversationHistory history;
    history.set_system_prompt("Be brief.");
    history.add_user("What time is it?");
    return history;
}

ChatRequestOptions make_options() {
    ChatRequestOptions options;
    options.model = "test-model";
    options.max_tokens = 64;
    return options;
}

}  // namespace

// =============================================================================
// PROVIDERS
// =============================================================================

TEST(ChatProtocol, ProviderNames) {
    ChatProvider provider = ChatProvider::OpenAI;
    EXPECT_TRUE(chat_provider_from_string("anthropic", provider));
    EXPECT_EQ(provider, ChatProvider::Anthropic);
    EXPECT_TRUE(chat_provider_from_string("openai", provider));
    EXPECT_EQ(provider, ChatProvider::OpenAI);
    EXPECT_TRUE(chat_provider_from_string("google", provider));
    EXPECT_EQ(provider, ChatProvider::Google);
    EXPECT_FALSE(chat_provider_from_string("mystery", provider));

    EXPECT_EQ(completion_path(ChatProvider::OpenAI, "gpt"), "/chat/completions");
    EXPECT_EQ(completion_path(ChatProvider::Anthropic, "claude"), "/messages");
    EXPECT_EQ(completion_path(ChatProvider::Google, "gemini-1.5-flash"),
              "/models/gemini-1.5-flash:generateContent");
    EXPECT_STREQ(default_base_url(ChatProvider::Anthropic), "https://api.anthropic.com/v1");
    EXPECT_STREQ(default_base_url(ChatProvider::Google),
                 "https://generativelanguage.googleapis.com/v1beta");
}

// =============================================================================
// REQUESTS
// =============================================================================

TEST(ChatProtocol, OpenAiRequestKeepsSystemMessage) {
    const nlohmann::json request =
        build_chat_request(ChatProvider::OpenAI, make_history(), make_options());

    EXPECT_EQ(request.at("model").get<std::string>(), "test-model");
    EXPECT_EQ(request.at("max_tokens").get<int>(), 64);
    EXPECT_FALSE(request.contains("system"));

    const nlohmann::json& messages = request.at("messages");
    ASSERT_EQ(messages.size(), 2u);
    EXPECT_EQ(messages[0].at("role").get<std::string>(), "system");
    EXPECT_EQ(messages[1].at("role").get<std::string>(), "user");
    EXPECT_EQ(messages[1].at("content").get<std::string>(), "What time is it?");
}

TEST(ChatProtocol, AnthropicRequestLiftsSystemPrompt) {
    const nlohmann::json request =
        build_chat_request(ChatProvider::Anthropic, make_history(), make_options());

    EXPECT_EQ(request.at("system").get<std::string>(), "Be brief.");
    const nlohmann::json& messages = request.at("messages");
    ASSERT_EQ(messages.size(), 1u);
    EXPECT_EQ(messages[0].at("role").get<std::string>(), "user");
}

TEST(ChatProtocol, GoogleRequestUsesContentsAndModelRole) {
    ConversationHistory history = make_history();
    history.add_assistant("Noon.");
    history.add_user("Thanks");
    const nlohmann::json request = build_chat_request(ChatProvider::Google, history, make_options());

    EXPECT_FALSE(request.contains("messages"));
    EXPECT_FALSE(request.contains("model"));
    EXPECT_EQ(request.at("systemInstruction").at("parts")[0].at("text").get<std::string>(),
              "Be brief.");
    EXPECT_EQ(request.at("generationConfig").at("maxOutputTokens").get<int>(), 64);
    EXPECT_DOUBLE_EQ(request.at("generationConfig").at("topP").get<double>(), 0.9);

    const nlohmann::json& contents = request.at("contents");
    ASSERT_EQ(contents.size(), 3u);
    EXPECT_EQ(contents[0].at("role").get<std::string>(), "user");
    EXPECT_EQ(contents[1].at("role").get<std::string>(), "model");
    EXPECT_EQ(contents[1].at("parts")[0].at("text").get<std::string>(), "Noon.");
    EXPECT_EQ(contents[2].at("role").get<std::string>(), "user");
}

TEST(ChatProtocol, GoogleRequestWithoutSystemPrompt) {
    ConversationHistory history;
    history.add_user("Hi");
    const nlohmann::json request = build_chat_request(ChatProvider::Google, history, make_options());
    EXPECT_FALSE(request.contains("systemInstruction"));
    EXPECT_EQ(request.at("contents").size(), 1u);
}

// =============================================================================
// RESPONSES
// =============================================================================

TEST(ChatProtocol, ParsesOpenAiResponse) {
    std::string text;
    std::string error;
    const std::string body = R"({"choices":[{"message":{"role":"assistant","content":"Noon."}}]})";
    ASSERT_EQ(parse_chat_response(ChatProvider::OpenAI, body, text, error), ErrorCode::Success);
    EXPECT_EQ(text, "Noon.");
}

TEST(ChatProtocol, ParsesAnthropicTextBlocks) {
    std::string text;
    std::string error;
    const std::string body =
        R"({"content":[{"type":"text","text":"It is "},{"type":"tool_use"},{"type":"text","text":"noon."}]})";
    ASSERT_EQ(parse_chat_response(ChatProvider::Anthropic, body, text, error), ErrorCode::Success);
    EXPECT_EQ(text, "It is noon.");
}

TEST(ChatProtocol, ParsesGoogleCandidateParts) {
    std::string text;
    std::string error;
    const std::string body =
        R"({"candidates":[{"content":{"role":"model","parts":[{"text":"It is "},{"text":"noon."}]},)"
        R"("finishReason":"STOP","index":0}]})";
    ASSERT_EQ(parse_chat_response(ChatProvider::Google, body, text, error), ErrorCode::Success);
    EXPECT_EQ(text, "It is noon.");
}

TEST(ChatProtocol, GoogleSafetyBlockAndEmptyCandidates) {
    std::string text;
    std::string error;
    EXPECT_EQ(parse_chat_response(ChatProvider::Google,
                                  R"({"candidates":[{"finishReason":"SAFETY","index":0}]})", text,
                                  error),
              ErrorCode::ContentFiltered);
    EXPECT_EQ(parse_chat_response(ChatProvider::Google, R"({"candidates":[]})", text, error),
              ErrorCode::InvalidResponse);
    EXPECT_EQ(parse_chat_response(ChatProvider::Google,
                                  R"({"candidates":[{"content":{"parts":[{"text":""}]}}]})", text,
                                  error),
              ErrorCode::InvalidResponse);
}

TEST(ChatProtocol, MalformedResponses) {
    std::string text;
    std::string error;
    EXPECT_EQ(parse_chat_response(ChatProvider::OpenAI, "not json", text, error),
              ErrorCode::InvalidResponse);
    EXPECT_EQ(parse_chat_response(ChatProvider::OpenAI, R"({"choices":[]})", text, error),
              ErrorCode::InvalidResponse);
    EXPECT_EQ(parse_chat_response(ChatProvider::Anthropic, R"({"content":[{"type":"image"}]})",
                                  text, error),
              ErrorCode::InvalidResponse);
    EXPECT_FALSE(error.empty());
}

// =============================================================================
// ERRORS / URLS
// =============================================================================

TEST(ChatProtocol, MapsHttpStatus) {
    EXPECT_EQ(map_http_status(200), ErrorCode::Success);
    EXPECT_EQ(map_http_status(401), ErrorCode::InvalidApiKey);
    EXPECT_EQ(map_http_status(429), ErrorCode::RateLimited);
    EXPECT_EQ(map_http_status(400), ErrorCode::InvalidArgument);
    EXPECT_EQ(map_http_status(503), ErrorCode::ServerError);
    EXPECT_EQ(map_http_status(404), ErrorCode::NetworkError);
}

TEST(ChatProtocol, GoogleBadKeyIsAuthFailure) {
    const std::string bad_key =
        R"({"error":{"code":400,"message":"API key not valid. Please pass a valid API key.","status":"INVALID_ARGUMENT","details":[{"reason":"API_KEY_INVALID"}]}})";
    EXPECT_EQ(map_api_failure(ChatProvider::Google, 400, bad_key), ErrorCode::InvalidApiKey);
    EXPECT_EQ(map_api_failure(ChatProvider::OpenAI, 400, bad_key), ErrorCode::InvalidArgument);
    EXPECT_EQ(map_api_failure(ChatProvider::Google, 400, R"({"error":{"message":"bad field"}})"),
              ErrorCode::InvalidArgument);
    EXPECT_EQ(map_api_failure(ChatProvider::Google, 429, "{}"), ErrorCode::RateLimited);
}

TEST(ChatProtocol, ExtractsApiErrorMessage) {
    EXPECT_EQ(extract_api_error(R"({"error":{"message":"bad key","type":"auth"}})"), "bad key");
    EXPECT_EQ(extract_api_error(R"({"error":"overloaded"})"), "overloaded");
    EXPECT_EQ(extract_api_error("<html>"), "");
}

TEST(ChatProtocol, SplitsBaseUrl) {
    UrlParts parts;
    ASSERT_TRUE(split_base_url("https://api.openai.com/v1/", parts));
    EXPECT_EQ(parts.origin, "https://api.openai.com");
    EXPECT_EQ(parts.path_prefix, "/v1");

    ASSERT_TRUE(split_base_url("http://localhost:8080", parts));
    EXPECT_EQ(parts.origin, "http://localhost:8080");
    EXPECT_EQ(parts.path_prefix, "");

    EXPECT_FALSE(split_base_url("ftp://example.com", parts));
    EXPECT_FALSE(split_base_url("api.openai.com/v1", parts));
    EXPECT_FALSE(split_base_url("https:///v1", parts));
}
