#include "parley/features/conversation/auto_mode.h"

#include <mutex>

#include "parley/core/logger.h"
#include "parley/core/task_queue.h"

namespace parley {

namespace {
constexpr const char* kLogCat = "AutoMode";
}  // namespace

const char* conversation_activity_name(ConversationActivity activity) {
    switch (activity) {
        case ConversationActivity::Idle:
            return "idle";
        case ConversationActivity::Listening:
            return "listening";
        case ConversationActivity::Processing:
            return "processing";
        case ConversationActivity::Speaking:
            return "speaking";
    }
    return "idle";
}

// =============================================================================
// Implementation
// =============================================================================

struct AutoModeDriver::Impl {
    Impl(ConversationController& c, std::chrono::milliseconds delay)
        : controller(c), settle_delay(delay), timer("auto-mode") {}

    void on_state(const ConversationSnapshot& snapshot);
    void cancel_restart_locked();
    void restart(uint64_t generation);

    ConversationController& controller;
    const std::chrono::milliseconds settle_delay;

    mutable std::mutex mutex;
    bool enabled = false;
    bool in_conversation = false;
    ConversationState last_state = ConversationState::Idle;
    TaskQueue::TaskId pending = TaskQueue::kInvalidTask;
    uint64_t generation = 0;

    TaskQueue timer;
};

void AutoModeDriver::Impl::on_state(const ConversationSnapshot& snapshot) {
    std::lock_guard<std::mutex> lock(mutex);
    const ConversationState previous = last_state;
    last_state = snapshot.state;

    if (snapshot.state != ConversationState::Idle) {
        cancel_restart_locked();
        return;
    }
    if (previous != ConversationState::Speaking || !enabled || !in_conversation ||
        pending != TaskQueue::kInvalidTask) {
        return;
    }

    const uint64_t current = ++generation;
    pending = timer.post_delayed(settle_delay, [this, current]() { restart(current); });
    PARLEY_LOG_DEBUG(kLogCat, "Restarting listening in %lld ms",
                     static_cast<long long>(settle_delay.count()));
}

void AutoModeDriver::Impl::cancel_restart_locked() {
    if (pending != TaskQueue::kInvalidTask) {
        timer.cancel(pending);
        pending = TaskQueue::kInvalidTask;
    }
    ++generation;
}

void AutoModeDriver::Impl::restart(uint64_t expected) {
    {
        std::lock_guard<std::mutex> lock(mutex);
        if (expected != generation || !enabled || !in_conversation) {
            return;
        }
        pending = TaskQueue::kInvalidTask;
    }
    const ErrorCode code = controller.start_listening();
    if (failed(code)) {
        PARLEY_LOG_WARNING(kLogCat, "Auto restart failed: %s", error_message(code));
    }
}

// =============================================================================
// AutoModeDriver
// =============================================================================

AutoModeDriver::AutoModeDriver(ConversationController& controller,
                               std::chrono::milliseconds settle_delay)
    : impl_(std::make_shared<Impl>(controller, settle_delay)) {
    impl_->last_state = controller.state();
    // The callback keeps Impl alive while a delivery is in flight
    std::shared_ptr<Impl> impl = impl_;
    unsubscribe_ =
        controller.subscribe([impl](const ConversationSnapshot& snapshot) { impl->on_state(snapshot); });
}

AutoModeDriver::~AutoModeDriver() {
    if (unsubscribe_) {
        unsubscribe_();
    }
    {
        std::lock_guard<std::mutex> lock(impl_->mutex);
        impl_->enabled = false;
        impl_->cancel_restart_locked();
    }
    impl_->timer.shutdown();
}

ErrorCode AutoModeDriver::start_conversation() {
    {
        std::lock_guard<std::mutex> lock(impl_->mutex);
        impl_->in_conversation = true;
    }
    PARLEY_LOG_INFO(kLogCat, "Conversation started");
    return impl_->controller.start_listening();
}

ErrorCode AutoModeDriver::end_conversation() {
    {
        std::lock_guard<std::mutex> lock(impl_->mutex);
        impl_->in_conversation = false;
        impl_->enabled = false;
        impl_->cancel_restart_locked();
    }
    PARLEY_LOG_INFO(kLogCat, "Conversation ended");

    ErrorCode code = impl_->controller.stop_listening();
    if (failed(code)) {
        return code;
    }
    return impl_->controller.interrupt_speech();
}

void AutoModeDriver::set_enabled(bool enabled) {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    impl_->enabled = enabled;
    if (!enabled) {
        impl_->cancel_restart_locked();
    }
    PARLEY_LOG_INFO(kLogCat, "Auto mode %s", enabled ? "enabled" : "disabled");
}

bool AutoModeDriver::is_enabled() const {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    return impl_->enabled;
}

bool AutoModeDriver::in_conversation() const {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    return impl_->in_conversation;
}

bool AutoModeDriver::restart_pending() const {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    return impl_->pending != TaskQueue::kInvalidTask;
}

ConversationStatus AutoModeDriver::status() const {
    const ConversationSnapshot snapshot = impl_->controller.snapshot();
    ConversationStatus status;
    if (snapshot.listening) {
        status.activity = ConversationActivity::Listening;
    } else if (snapshot.thinking) {
        status.activity = ConversationActivity::Processing;
    } else if (snapshot.speaking) {
        status.activity = ConversationActivity::Speaking;
    }
    status.in_conversation = in_conversation();
    status.can_interrupt = snapshot.speaking;
    return status;
}

std::string AutoModeDriver::status_text() const {
    const ConversationSnapshot snapshot = impl_->controller.snapshot();
    if (snapshot.has_error()) return "Error occurred";
    if (snapshot.listening) return "Listening...";
    if (snapshot.thinking) return "Thinking...";
    if (snapshot.speaking) return "Speaking...";
    if (!snapshot.initialized) return "Initializing...";
    if (in_conversation()) return "In conversation";
    return "Ready";
}

}  // namespace parley
