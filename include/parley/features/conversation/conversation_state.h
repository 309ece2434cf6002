#ifndef PARLEY_FEATURES_CONVERSATION_STATE_H
#define PARLEY_FEATURES_CONVERSATION_STATE_H

#include <string>

#include "parley/core/parley_error.h"

namespace parley {

enum class ConversationState { Idle, Listening, Thinking, Speaking, Error };

const char* conversation_state_name(ConversationState state);

// What subscribers receive on every change. The error fields stay set after
// the controller falls back to Idle and are cleared by the next
// start_listening() or speak().
struct ConversationSnapshot {
    ConversationState state = ConversationState::Idle;
    bool listening = false;
    bool thinking = false;
    bool speaking = false;
    std::string transcript;
    std::string response;
    ErrorCode error_code = ErrorCode::Success;
    std::string error;
    bool initialized = false;

    bool has_error() const { return error_code != ErrorCode::Success; }
};

bool operator==(const ConversationSnapshot& a, const ConversationSnapshot& b);
inline bool operator!=(const ConversationSnapshot& a, const ConversationSnapshot& b) {
    return !(a == b);
}

}  // namespace parley

#endif  // PARLEY_FEATURES_CONVERSATION_STATE_H
