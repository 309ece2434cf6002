// =============================================================================
// RemoteChatGenerator - Implementation
// =============================================================================

#include "remote_chat_generator.h"

#include <httplib.h>

#include <chrono>

#include "parley/core/logger.h"

namespace parley {

namespace {
constexpr const char* kLogCat = "RemoteLLM";
constexpr const char* kAnthropicVersion = "2023-06-01";
}  // namespace

RemoteChatGenerator::RemoteChatGenerator(const RemoteChatConfig& config)
    : config_(config), history_(config.max_history) {}

RemoteChatGenerator::~RemoteChatGenerator() {
    const ErrorCode code = shutdown();
    if (failed(code)) {
        PARLEY_LOG_WARNING(kLogCat, "Shutdown in destructor failed: %s", error_message(code));
    }
}

void RemoteChatGenerator::set_error(const std::string& message) {
    PARLEY_LOG_ERROR(kLogCat, "%s", message.c_str());
    std::lock_guard<std::mutex> lock(error_mutex_);
    last_error_ = message;
}

std::string RemoteChatGenerator::last_error() const {
    std::lock_guard<std::mutex> lock(error_mutex_);
    return last_error_;
}

ErrorCode RemoteChatGenerator::initialize(const std::string& system_prompt) {
    if (config_.api_key.empty()) {
        set_error("API key is required");
        return ErrorCode::InvalidApiKey;
    }

    if (config_.provider == ChatProvider::Google && config_.request.model.empty()) {
        set_error("A model name is required for the Google API");
        return ErrorCode::InvalidArgument;
    }

    const std::string base =
        config_.base_url.empty() ? default_base_url(config_.provider) : config_.base_url;
    if (!split_base_url(base, url_)) {
        set_error("Invalid base URL: " + base);
        return ErrorCode::InvalidArgument;
    }

    {
        std::lock_guard<std::mutex> lock(client_mutex_);
        client_ = std::make_unique<httplib::Client>(url_.origin);
        const auto timeout = std::chrono::milliseconds(config_.timeout_ms);
        client_->set_connection_timeout(timeout);
        client_->set_read_timeout(timeout);
        client_->set_write_timeout(timeout);
        cancelled_ = false;
    }

    if (!system_prompt.empty()) {
        std::lock_guard<std::mutex> lock(history_mutex_);
        history_.set_system_prompt(system_prompt);
    }

    PARLEY_LOG_INFO(kLogCat, "Ready: %s%s (model=%s)", url_.origin.c_str(),
                    url_.path_prefix.c_str(), config_.request.model.c_str());
    return ErrorCode::Success;
}

ErrorCode RemoteChatGenerator::generate(const std::string& user_text, std::string& out_text) {
    out_text.clear();
    std::lock_guard<std::mutex> request_lock(request_mutex_);

    {
        std::lock_guard<std::mutex> lock(history_mutex_);
        history_.add_user(user_text);
    }

    std::string reply;
    const ErrorCode code = post_history(reply);

    std::lock_guard<std::mutex> lock(history_mutex_);
    if (failed(code)) {
        // An unanswered user turn would break user/assistant alternation
        history_.discard_last();
        return code;
    }

    out_text = clean_model_response(reply);
    if (!out_text.empty()) {
        history_.add_assistant(out_text);
    }
    return ErrorCode::Success;
}

ErrorCode RemoteChatGenerator::post_history(std::string& out_text) {
    nlohmann::json body;
    {
        std::lock_guard<std::mutex> lock(history_mutex_);
        body = build_chat_request(config_.provider, history_, config_.request);
    }

    httplib::Headers headers;
    switch (config_.provider) {
        case ChatProvider::Anthropic:
            headers.emplace("x-api-key", config_.api_key);
            headers.emplace("anthropic-version", kAnthropicVersion);
            break;
        case ChatProvider::Google:
            headers.emplace("x-goog-api-key", config_.api_key);
            break;
        case ChatProvider::OpenAI:
            headers.emplace("Authorization", "Bearer " + config_.api_key);
            break;
    }

    const std::string path =
        url_.path_prefix + completion_path(config_.provider, config_.request.model);
    const auto start = std::chrono::steady_clock::now();

    httplib::Client* client = nullptr;
    {
        std::lock_guard<std::mutex> lock(client_mutex_);
        if (!client_) {
            return ErrorCode::NotInitialized;
        }
        client = client_.get();
        in_flight_ = true;
        cancelled_ = false;
    }

    auto result = client->Post(path, headers, body.dump(), "application/json");

    {
        std::lock_guard<std::mutex> lock(client_mutex_);
        in_flight_ = false;
        if (cancelled_) {
            cancelled_ = false;
            PARLEY_LOG_INFO(kLogCat, "Request cancelled");
            return ErrorCode::Cancelled;
        }
    }

    if (!result) {
        const httplib::Error error = result.error();
        if (error == httplib::Error::Read || error == httplib::Error::ConnectionTimeout) {
            set_error("Request timed out after " + std::to_string(config_.timeout_ms) + " ms");
            return ErrorCode::Timeout;
        }
        set_error("Request failed: " + httplib::to_string(error));
        return ErrorCode::NetworkError;
    }

    const ErrorCode status_code = map_api_failure(config_.provider, result->status, result->body);
    if (failed(status_code)) {
        std::string detail = extract_api_error(result->body);
        if (detail.empty()) {
            detail = error_message(status_code);
        }
        set_error("HTTP " + std::to_string(result->status) + ": " + detail);
        return status_code;
    }

    std::string parse_error;
    const ErrorCode parse_code =
        parse_chat_response(config_.provider, result->body, out_text, parse_error);
    if (failed(parse_code)) {
        set_error("Unexpected response: " + parse_error);
        return parse_code;
    }

    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);
    PARLEY_LOG_DEBUG(kLogCat, "Reply of %zu chars in %lld ms", out_text.size(),
                     static_cast<long long>(elapsed.count()));
    return ErrorCode::Success;
}

void RemoteChatGenerator::set_system_prompt(const std::string& prompt) {
    std::lock_guard<std::mutex> lock(history_mutex_);
    history_.set_system_prompt(prompt);
}

void RemoteChatGenerator::clear_history() {
    std::lock_guard<std::mutex> lock(history_mutex_);
    history_.clear();
}

void RemoteChatGenerator::set_max_history_length(size_t max_length) {
    std::lock_guard<std::mutex> lock(history_mutex_);
    history_.set_max_length(max_length);
}

HistoryStats RemoteChatGenerator::history_stats() const {
    std::lock_guard<std::mutex> lock(history_mutex_);
    return history_.stats();
}

void RemoteChatGenerator::cancel() {
    std::lock_guard<std::mutex> lock(client_mutex_);
    if (client_ && in_flight_) {
        cancelled_ = true;
        client_->stop();
    }
}

ErrorCode RemoteChatGenerator::shutdown() {
    cancel();
    std::lock_guard<std::mutex> request_lock(request_mutex_);
    std::lock_guard<std::mutex> lock(client_mutex_);
    client_.reset();
    cancelled_ = false;
    return ErrorCode::Success;
}

}  // namespace parley
