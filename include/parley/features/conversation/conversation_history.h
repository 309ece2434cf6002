/**
 * @file conversation_history.h
 * @brief Parley - Bounded chat history with pair-preserving trimming
 *
 * Used by response generators that keep their own message list. When the
 * list grows past max_length, every system message is kept and only the
 * most recent floor(max_length / 2) * 2 user/assistant messages survive, so
 * the cut never splits a user/assistant pair.
 */

#ifndef PARLEY_FEATURES_CONVERSATION_HISTORY_H
#define PARLEY_FEATURES_CONVERSATION_HISTORY_H

#include <cstdint>
#include <string>
#include <vector>

namespace parley {

enum class MessageRole { System, User, Assistant };

const char* message_role_name(MessageRole role);

struct ConversationMessage {
    MessageRole role = MessageRole::User;
    std::string content;
    int64_t timestamp_ms = 0;  // wall clock, milliseconds since epoch
};

struct HistoryStats {
    size_t total_messages = 0;
    size_t user_messages = 0;
    size_t assistant_messages = 0;
    bool has_system_prompt = false;
};

class ConversationHistory {
   public:
    static constexpr size_t kDefaultMaxLength = 10;

    explicit ConversationHistory(size_t max_length = kDefaultMaxLength);

    void add_user(const std::string& content);
    void add_assistant(const std::string& content);
    void add(MessageRole role, const std::string& content);

    // Replaces the first system message, or inserts one at the front
    void set_system_prompt(const std::string& prompt);

    // Drops user/assistant messages, keeps system messages
    void clear();

    // Removes the newest message unless it is a system message
    bool discard_last();

    // Applies the new limit immediately
    void set_max_length(size_t max_length);
    size_t max_length() const { return max_length_; }

    void trim();

    const std::vector<ConversationMessage>& messages() const { return messages_; }
    size_t size() const { return messages_.size(); }
    HistoryStats stats() const;

    // ChatML prompt ending with an open assistant turn
    std::string build_chatml_prompt() const;

   private:
    std::vector<ConversationMessage> messages_;
    size_t max_length_;
};

// Strips ChatML markers and leading role labels a model may echo back
std::string clean_model_response(const std::string& text);

// Whitespace trim on both ends
std::string trim_whitespace(const std::string& text);

}  // namespace parley

#endif  // PARLEY_FEATURES_CONVERSATION_HISTORY_H
