#ifndef PARLEY_FEATURES_CONVERSATION_AUTO_MODE_H
#define PARLEY_FEATURES_CONVERSATION_AUTO_MODE_H

// =============================================================================
// AutoModeDriver - hands-free conversation loop on top of the controller
// =============================================================================
// While enabled and a conversation is running, every Speaking -> Idle
// transition schedules start_listening() after a settle delay. Leaving Idle,
// disabling, or ending the conversation cancels a pending restart.
//
// Must be destroyed before the controller it drives.
// =============================================================================

#include <chrono>
#include <memory>
#include <string>

#include "parley/core/parley_error.h"
#include "parley/features/conversation/conversation_controller.h"

namespace parley {

enum class ConversationActivity { Idle, Listening, Processing, Speaking };

const char* conversation_activity_name(ConversationActivity activity);

struct ConversationStatus {
    ConversationActivity activity = ConversationActivity::Idle;
    bool in_conversation = false;
    bool can_interrupt = false;
};

class AutoModeDriver {
   public:
    static constexpr std::chrono::milliseconds kDefaultSettleDelay{1000};

    explicit AutoModeDriver(ConversationController& controller,
                            std::chrono::milliseconds settle_delay = kDefaultSettleDelay);
    ~AutoModeDriver();

    AutoModeDriver(const AutoModeDriver&) = delete;
    AutoModeDriver& operator=(const AutoModeDriver&) = delete;

    // Marks the conversation as running and starts the first listening turn
    ErrorCode start_conversation();

    // Stops listening and speech, disables auto-mode
    ErrorCode end_conversation();

    void set_enabled(bool enabled);
    bool is_enabled() const;
    bool in_conversation() const;
    bool restart_pending() const;

    ConversationStatus status() const;

    // One-line label for a status bar ("Listening...", "Ready", ...)
    std::string status_text() const;

   private:
    struct Impl;
    std::shared_ptr<Impl> impl_;
    ConversationController::Unsubscribe unsubscribe_;
};

}  // namespace parley

#endif  // PARLEY_FEATURES_CONVERSATION_AUTO_MODE_H
