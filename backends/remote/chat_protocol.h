/**
 * @file chat_protocol.h
 * @brief Parley - Request/response bodies for hosted chat APIs
 *
 * OpenAI-compatible:  POST {base}/chat/completions, Bearer auth
 * Anthropic:          POST {base}/messages, x-api-key auth, system prompt
 *                     carried outside the message list
 * Google:             POST {base}/models/{model}:generateContent,
 *                     x-goog-api-key auth, "model" role for the assistant
 */

#ifndef PARLEY_BACKENDS_REMOTE_CHAT_PROTOCOL_H
#define PARLEY_BACKENDS_REMOTE_CHAT_PROTOCOL_H

#include <nlohmann/json.hpp>

#include <string>

#include "parley/core/parley_error.h"
#include "parley/features/conversation/conversation_history.h"

namespace parley {

enum class ChatProvider { OpenAI, Anthropic, Google };

struct ChatRequestOptions {
    std::string model;
    int max_tokens = 256;
    double temperature = 0.7;
    double top_p = 0.9;
};

bool chat_provider_from_string(const std::string& name, ChatProvider& out);

// Default API root for the provider, without a trailing slash
const char* default_base_url(ChatProvider provider);

// Path appended to the base URL's path; Google names the model in the path
std::string completion_path(ChatProvider provider, const std::string& model);

nlohmann::json build_chat_request(ChatProvider provider, const ConversationHistory& history,
                                  const ChatRequestOptions& options);

// Extracts the assistant text. InvalidResponse when the body has no text,
// ContentFiltered when Google withheld the candidate for safety.
ErrorCode parse_chat_response(ChatProvider provider, const std::string& body,
                              std::string& out_text, std::string& out_error);

// 401 -> InvalidApiKey, 429 -> RateLimited, 400 -> InvalidArgument,
// 5xx -> ServerError, other non-2xx -> NetworkError
ErrorCode map_http_status(int status);

// Pulls error.message out of an API error body, empty when absent
std::string extract_api_error(const std::string& body);

// map_http_status, except that Google reports a bad key as a 400 carrying
// an API_KEY_* reason
ErrorCode map_api_failure(ChatProvider provider, int status, const std::string& body);

struct UrlParts {
    std::string origin;       // scheme://host[:port]
    std::string path_prefix;  // "/v1" or empty
};

// Splits "https://api.openai.com/v1" into origin and path prefix
bool split_base_url(const std::string& url, UrlParts& out);

}  // namespace parley

#endif  // PARLEY_BACKENDS_REMOTE_CHAT_PROTOCOL_H
