#include "parley/features/conversation/conversation_history.h"

#include <chrono>
#include <regex>

namespace parley {

namespace {

int64_t now_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}

ConversationMessage make_message(MessageRole role, const std::string& content) {
    ConversationMessage message;
    message.role = role;
    message.content = content;
    message.timestamp_ms = now_ms();
    return message;
}

}  // namespace

const char* message_role_name(MessageRole role) {
    switch (role) {
        case MessageRole::System:
            return "system";
        case MessageRole::User:
            return "user";
        case MessageRole::Assistant:
            return "assistant";
    }
    return "user";
}

ConversationHistory::ConversationHistory(size_t max_length) : max_length_(max_length) {}

void ConversationHistory::add_user(const std::string& content) {
    add(MessageRole::User, content);
}

void ConversationHistory::add_assistant(const std::string& content) {
    add(MessageRole::Assistant, content);
}

void ConversationHistory::add(MessageRole role, const std::string& content) {
    messages_.push_back(make_message(role, content));
    trim();
}

void ConversationHistory::set_system_prompt(const std::string& prompt) {
    for (auto& message : messages_) {
        if (message.role == MessageRole::System) {
            message.content = prompt;
            message.timestamp_ms = now_ms();
            return;
        }
    }
    messages_.insert(messages_.begin(), make_message(MessageRole::System, prompt));
}

void ConversationHistory::clear() {
    std::vector<ConversationMessage> kept;
    for (auto& message : messages_) {
        if (message.role == MessageRole::System) {
            kept.push_back(std::move(message));
        }
    }
    messages_ = std::move(kept);
}

bool ConversationHistory::discard_last() {
    if (messages_.empty() || messages_.back().role == MessageRole::System) {
        return false;
    }
    messages_.pop_back();
    return true;
}

void ConversationHistory::set_max_length(size_t max_length) {
    max_length_ = max_length;
    trim();
}

void ConversationHistory::trim() {
    if (messages_.size() <= max_length_) {
        return;
    }

    std::vector<ConversationMessage> system;
    std::vector<ConversationMessage> turns;
    for (auto& message : messages_) {
        if (message.role == MessageRole::System) {
            system.push_back(std::move(message));
        } else {
            turns.push_back(std::move(message));
        }
    }

    const size_t keep = (max_length_ / 2) * 2;
    const size_t drop = turns.size() > keep ? turns.size() - keep : 0;

    messages_ = std::move(system);
    for (size_t i = drop; i < turns.size(); ++i) {
        messages_.push_back(std::move(turns[i]));
    }
}

HistoryStats ConversationHistory::stats() const {
    HistoryStats stats;
    stats.total_messages = messages_.size();
    for (const auto& message : messages_) {
        switch (message.role) {
            case MessageRole::System:
                stats.has_system_prompt = true;
                break;
            case MessageRole::User:
                ++stats.user_messages;
                break;
            case MessageRole::Assistant:
                ++stats.assistant_messages;
                break;
        }
    }
    return stats;
}

std::string ConversationHistory::build_chatml_prompt() const {
    std::string prompt;
    for (const auto& message : messages_) {
        prompt += "<|im_start|>";
        prompt += message_role_name(message.role);
        prompt += "\n";
        prompt += message.content;
        prompt += "<|im_end|>\n";
    }
    prompt += "<|im_start|>assistant\n";
    return prompt;
}

std::string trim_whitespace(const std::string& text) {
    const char* ws = " \t\r\n\f\v";
    const size_t begin = text.find_first_not_of(ws);
    if (begin == std::string::npos) {
        return {};
    }
    const size_t end = text.find_last_not_of(ws);
    return text.substr(begin, end - begin + 1);
}

std::string clean_model_response(const std::string& text) {
    static const std::regex kChatMarkers("<\\|im_(start|end)\\|>|<\\|endoftext\\|>|</s>");
    static const std::regex kRolePrefix("^\\s*(assistant|Assistant|AI|Bot)\\s*:?\\s*\\n?");
    static const std::regex kBlankRuns("\\n{3,}");

    std::string cleaned = std::regex_replace(text, kChatMarkers, "");
    cleaned = std::regex_replace(cleaned, kRolePrefix, "", std::regex_constants::format_first_only);
    cleaned = std::regex_replace(cleaned, kBlankRuns, "\n\n");
    return trim_whitespace(cleaned);
}

}  // namespace parley
