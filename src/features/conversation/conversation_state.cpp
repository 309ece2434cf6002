#include "parley/features/conversation/conversation_state.h"

namespace parley {

const char* conversation_state_name(ConversationState state) {
    switch (state) {
        case ConversationState::Idle:
            return "Idle";
        case ConversationState::Listening:
            return "Listening";
        case ConversationState::Thinking:
            return "Thinking";
        case ConversationState::Speaking:
            return "Speaking";
        case ConversationState::Error:
            return "Error";
    }
    return "Unknown";
}

bool operator==(const ConversationSnapshot& a, const ConversationSnapshot& b) {
    return a.state == b.state && a.listening == b.listening && a.thinking == b.thinking &&
           a.speaking == b.speaking && a.transcript == b.transcript &&
           a.response == b.response && a.error_code == b.error_code && a.error == b.error &&
           a.initialized == b.initialized;
}

}  // namespace parley
