#ifndef PARLEY_BACKENDS_REMOTE_CHAT_GENERATOR_H
#define PARLEY_BACKENDS_REMOTE_CHAT_GENERATOR_H

// =============================================================================
// RemoteChatGenerator - response generation through a hosted chat API
// =============================================================================
// Keeps the conversation in a ConversationHistory and sends the whole
// (trimmed) history with every request. Timeouts are enforced by the HTTP
// client and reported as ErrorCode::Timeout.
// =============================================================================

#include <memory>
#include <mutex>
#include <string>

#include "chat_protocol.h"
#include "parley/features/conversation/capabilities.h"
#include "parley/features/conversation/conversation_history.h"

namespace httplib {
class Client;
}

namespace parley {

struct RemoteChatConfig {
    ChatProvider provider = ChatProvider::OpenAI;
    std::string base_url;  // empty selects default_base_url(provider)
    std::string api_key;
    ChatRequestOptions request;
    int timeout_ms = 30000;
    size_t max_history = ConversationHistory::kDefaultMaxLength;
};

class RemoteChatGenerator : public IResponseGenerator {
   public:
    explicit RemoteChatGenerator(const RemoteChatConfig& config);
    ~RemoteChatGenerator() override;

    RemoteChatGenerator(const RemoteChatGenerator&) = delete;
    RemoteChatGenerator& operator=(const RemoteChatGenerator&) = delete;

    ErrorCode initialize(const std::string& system_prompt) override;
    ErrorCode generate(const std::string& user_text, std::string& out_text) override;
    void set_system_prompt(const std::string& prompt) override;
    void clear_history() override;

    // Closes the socket of an in-flight request
    void cancel() override;

    ErrorCode shutdown() override;
    std::string last_error() const override;

    void set_max_history_length(size_t max_length);
    HistoryStats history_stats() const;

   private:
    ErrorCode post_history(std::string& out_text);
    void set_error(const std::string& message);

    RemoteChatConfig config_;
    UrlParts url_;

    mutable std::mutex history_mutex_;
    ConversationHistory history_;

    std::mutex request_mutex_;  // one request at a time
    std::mutex client_mutex_;
    std::unique_ptr<httplib::Client> client_;
    bool in_flight_ = false;
    bool cancelled_ = false;

    mutable std::mutex error_mutex_;
    std::string last_error_;
};

}  // namespace parley

#endif  // PARLEY_BACKENDS_REMOTE_CHAT_GENERATOR_H
