/**
 * @file chat_protocol.cpp
 * @brief Parley - Request/response bodies for hosted chat APIs
 */

#include "chat_protocol.h"

namespace parley {

using Json = nlohmann::json;

bool chat_provider_from_string(const std::string& name, ChatProvider& out) {
    if (name == "openai") {
        out = ChatProvider::OpenAI;
        return true;
    }
    if (name == "anthropic") {
        out = ChatProvider::Anthropic;
        return true;
    }
    if (name == "google") {
        out = ChatProvider::Google;
        return true;
    }
    return false;
}

const char* default_base_url(ChatProvider provider) {
    switch (provider) {
        case ChatProvider::OpenAI:
            return "https://api.openai.com/v1";
        case ChatProvider::Anthropic:
            return "https://api.anthropic.com/v1";
        case ChatProvider::Google:
            return "https://generativelanguage.googleapis.com/v1beta";
    }
    return "https://api.openai.com/v1";
}

std::string completion_path(ChatProvider provider, const std::string& model) {
    switch (provider) {
        case ChatProvider::OpenAI:
            return "/chat/completions";
        case ChatProvider::Anthropic:
            return "/messages";
        case ChatProvider::Google:
            return "/models/" + model + ":generateContent";
    }
    return "/chat/completions";
}

// =============================================================================
// Requests
// =============================================================================

namespace {

Json build_google_request(const ConversationHistory& history, const ChatRequestOptions& options) {
    Json contents = Json::array();
    std::string system_prompt;
    for (const auto& message : history.messages()) {
        if (message.role == MessageRole::System) {
            system_prompt = message.content;
            continue;
        }
        const char* role = message.role == MessageRole::Assistant ? "model" : "user";
        contents.push_back({{"role", role}, {"parts", Json::array({{{"text", message.content}}})}});
    }

    Json request = {{"contents", std::move(contents)},
                    {"generationConfig",
                     {{"maxOutputTokens", options.max_tokens},
                      {"temperature", options.temperature},
                      {"topP", options.top_p}}}};
    if (!system_prompt.empty()) {
        request["systemInstruction"] = {{"parts", Json::array({{{"text", system_prompt}}})}};
    }
    return request;
}

ErrorCode parse_google_response(const Json& json, std::string& out_text, std::string& out_error) {
    const auto candidates = json.find("candidates");
    if (candidates == json.end() || !candidates->is_array() || candidates->empty()) {
        out_error = "no candidates in response";
        return ErrorCode::InvalidResponse;
    }
    const Json& candidate = (*candidates)[0];
    if (candidate.value("finishReason", "") == "SAFETY") {
        out_error = "candidate blocked for safety";
        return ErrorCode::ContentFiltered;
    }

    const Json content = candidate.value("content", Json::object());
    const auto parts = content.find("parts");
    if (parts != content.end() && parts->is_array()) {
        for (const auto& part : *parts) {
            if (part.contains("text") && part.at("text").is_string()) {
                out_text += part.at("text").get<std::string>();
            }
        }
    }
    if (out_text.empty()) {
        out_error = "no text parts in response";
        return ErrorCode::InvalidResponse;
    }
    return ErrorCode::Success;
}

}  // namespace

Json build_chat_request(ChatProvider provider, const ConversationHistory& history,
                        const ChatRequestOptions& options) {
    if (provider == ChatProvider::Google) {
        return build_google_request(history, options);
    }

    Json request = {{"model", options.model},
                    {"max_tokens", options.max_tokens},
                    {"temperature", options.temperature},
                    {"top_p", options.top_p}};

    Json messages = Json::array();
    std::string system_prompt;
    for (const auto& message : history.messages()) {
        if (provider == ChatProvider::Anthropic && message.role == MessageRole::System) {
            system_prompt = message.content;
            continue;
        }
        messages.push_back({{"role", message_role_name(message.role)}, {"content", message.content}});
    }
    request["messages"] = std::move(messages);

    if (provider == ChatProvider::Anthropic && !system_prompt.empty()) {
        request["system"] = system_prompt;
    }
    return request;
}

// =============================================================================
// Responses
// =============================================================================

ErrorCode parse_chat_response(ChatProvider provider, const std::string& body,
                              std::string& out_text, std::string& out_error) {
    out_text.clear();
    Json json = Json::parse(body, nullptr, false);
    if (json.is_discarded() || !json.is_object()) {
        out_error = "response is not a JSON object";
        return ErrorCode::InvalidResponse;
    }

    if (provider == ChatProvider::OpenAI) {
        const auto choices = json.find("choices");
        if (choices == json.end() || !choices->is_array() || choices->empty()) {
            out_error = "no choices in response";
            return ErrorCode::InvalidResponse;
        }
        const Json& message = (*choices)[0].value("message", Json::object());
        const auto content = message.find("content");
        if (content == message.end() || !content->is_string()) {
            out_error = "no message content in response";
            return ErrorCode::InvalidResponse;
        }
        out_text = content->get<std::string>();
        return ErrorCode::Success;
    }

    if (provider == ChatProvider::Google) {
        return parse_google_response(json, out_text, out_error);
    }

    const auto content = json.find("content");
    if (content == json.end() || !content->is_array()) {
        out_error = "no content in response";
        return ErrorCode::InvalidResponse;
    }
    bool found = false;
    for (const auto& block : *content) {
        if (block.value("type", "") == "text" && block.contains("text") &&
            block.at("text").is_string()) {
            out_text += block.at("text").get<std::string>();
            found = true;
        }
    }
    if (!found) {
        out_error = "no text block in response";
        return ErrorCode::InvalidResponse;
    }
    return ErrorCode::Success;
}

ErrorCode map_http_status(int status) {
    if (status >= 200 && status < 300) return ErrorCode::Success;
    if (status == 401) return ErrorCode::InvalidApiKey;
    if (status == 429) return ErrorCode::RateLimited;
    if (status == 400) return ErrorCode::InvalidArgument;
    if (status >= 500) return ErrorCode::ServerError;
    return ErrorCode::NetworkError;
}

std::string extract_api_error(const std::string& body) {
    Json json = Json::parse(body, nullptr, false);
    if (json.is_discarded() || !json.is_object()) {
        return "";
    }
    const auto error = json.find("error");
    if (error == json.end()) {
        return "";
    }
    if (error->is_string()) {
        return error->get<std::string>();
    }
    if (error->is_object()) {
        const auto message = error->find("message");
        if (message != error->end() && message->is_string()) {
            return message->get<std::string>();
        }
    }
    return "";
}

ErrorCode map_api_failure(ChatProvider provider, int status, const std::string& body) {
    const ErrorCode code = map_http_status(status);
    if (provider == ChatProvider::Google && status == 400 &&
        body.find("API_KEY") != std::string::npos) {
        return ErrorCode::InvalidApiKey;
    }
    return code;
}

bool split_base_url(const std::string& url, UrlParts& out) {
    const size_t scheme_end = url.find("://");
    if (scheme_end == std::string::npos || scheme_end == 0) {
        return false;
    }
    const std::string scheme = url.substr(0, scheme_end);
    if (scheme != "http" && scheme != "https") {
        return false;
    }
    const size_t host_begin = scheme_end + 3;
    const size_t path_begin = url.find('/', host_begin);
    if (path_begin == host_begin) {
        return false;
    }

    if (path_begin == std::string::npos) {
        out.origin = url;
        out.path_prefix.clear();
    } else {
        out.origin = url.substr(0, path_begin);
        out.path_prefix = url.substr(path_begin);
    }
    if (out.origin.size() <= host_begin) {
        return false;
    }
    while (!out.path_prefix.empty() && out.path_prefix.back() == '/') {
        out.path_prefix.pop_back();
    }
    return true;
}

}  // namespace parley
