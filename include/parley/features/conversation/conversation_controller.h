#ifndef PARLEY_FEATURES_CONVERSATION_CONTROLLER_H
#define PARLEY_FEATURES_CONVERSATION_CONTROLLER_H

// =============================================================================
// ConversationController
// =============================================================================
// Drives one voice session:
//   Idle -> Listening -> Thinking -> Speaking -> Idle
// with Error reachable from any state (always followed by Idle) and
// Speaking -> Listening on barge-in.
//
// Live frames feed the VAD and the audio buffer. End of speech, the hard
// recording ceiling or an explicit stop_listening() moves the session to
// Thinking, after which the buffered utterance runs through
// transcribe -> generate -> speak on a worker thread.
//
// Collaborator failures are never returned from the public operations; they
// surface on the state channel (snapshot() / subscribe()).
// =============================================================================

#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "parley/core/parley_error.h"
#include "parley/core/task_queue.h"
#include "parley/features/audio/audio_buffer.h"
#include "parley/features/conversation/capabilities.h"
#include "parley/features/conversation/conversation_state.h"
#include "parley/features/vad/energy_vad.h"

namespace parley {

// =============================================================================
// Configuration
// =============================================================================

struct ControllerConfig {
    int sample_rate = 16000;

    // VAD settings
    bool vad_enabled = true;
    VadConfig vad;

    // Capture settings
    int max_recording_ms = 10000;      // hard ceiling per listening turn
    int capture_start_attempts = 3;
    int capture_retry_backoff_ms = 500;

    // Buffer caps
    size_t max_buffer_frames = 2048;
    double max_buffer_seconds = 30.0;

    // Fallback when the speaker cannot report playback end
    int speech_ms_per_char = 50;

    std::string system_prompt =
        "You are a helpful AI assistant. Keep your responses concise and conversational.";
};

// =============================================================================
// Controller
// =============================================================================

class ConversationController {
   public:
    using StateCallback = std::function<void(const ConversationSnapshot&)>;
    using Unsubscribe = std::function<void()>;

    // A null generator selects speech-only mode (NullResponseGenerator)
    ConversationController(const ControllerConfig& config, std::shared_ptr<ICaptureSource> capture,
                           std::shared_ptr<ITranscriber> transcriber,
                           std::shared_ptr<IResponseGenerator> generator,
                           std::shared_ptr<ISpeaker> speaker);
    ~ConversationController();

    ConversationController(const ConversationController&) = delete;
    ConversationController& operator=(const ConversationController&) = delete;

    // Initializes capture, transcriber, generator and speaker in that order
    ErrorCode initialize();

    ErrorCode start_listening();
    ErrorCode stop_listening();

    // Speaks text directly. Not allowed while Listening or Thinking.
    ErrorCode speak(const std::string& text);

    // No-op unless Speaking
    ErrorCode interrupt_speech();

    ErrorCode set_system_prompt(const std::string& prompt);
    ErrorCode clear_history();
    ErrorCode set_vad_thresholds(float energy_threshold, float silence_threshold);
    ErrorCode set_vad_enabled(bool enabled);

    // Terminal. Every later call returns ErrorCode::AlreadyDisposed.
    ErrorCode dispose();

    ConversationSnapshot snapshot() const;
    ConversationState state() const;
    bool is_disposed() const;
    ControllerConfig config() const;
    AudioBufferUsage buffer_usage() const { return buffer_.get_memory_usage(); }

    // Callbacks run on whichever thread made the change, in change order. A
    // new subscriber only sees changes made after it subscribed. The returned
    // function must not be called after the controller is destroyed.
    Unsubscribe subscribe(StateCallback callback);

   private:
    struct PendingNotification {
        uint64_t sequence = 0;
        ConversationSnapshot snapshot;
    };
    struct Subscriber {
        uint64_t first_sequence = 0;
        StateCallback callback;
    };

    // Caller holds mutex_
    bool turn_is_current_locked(uint64_t turn, ConversationState expected) const;
    void commit_locked();
    void fail_locked(ErrorCode code, const std::string& detail);
    void cancel_timer_locked(TaskQueue::TaskId& id);

    void deliver_pending();

    ErrorCode stop_listening_for(uint64_t turn, const char* reason);
    void begin_capture(uint64_t turn, int attempt);
    void schedule_capture_retry(uint64_t turn, int next_attempt);
    void on_frame(uint64_t turn, const float* samples, size_t count);
    void finish_capture(uint64_t turn);
    void run_turn(uint64_t turn);
    void perform_speech(uint64_t speech, const std::string& text);
    void stop_speaker(uint64_t in_flight, uint64_t epoch);
    bool speech_in_progress() const;
    void on_speech_estimate_elapsed(uint64_t speech);

    ControllerConfig config_;

    std::shared_ptr<ICaptureSource> capture_;
    std::shared_ptr<ITranscriber> transcriber_;
    std::shared_ptr<IResponseGenerator> generator_;
    std::shared_ptr<ISpeaker> speaker_;

    // Orders speaker stops against the start of the next utterance; taken
    // before mutex_
    std::mutex speaker_stop_mutex_;

    mutable std::mutex mutex_;
    ConversationSnapshot state_;
    ConversationSnapshot published_;
    bool disposed_ = false;
    bool capturing_ = false;
    uint64_t turn_id_ = 0;    // bumped per listening turn, invalidates stale pipeline work
    uint64_t speech_id_ = 0;  // bumped per utterance spoken or interrupted
    uint64_t stream_samples_ = 0;
    int capture_rate_;  // reported by the capture source, config_.sample_rate until then
    TaskQueue::TaskId ceiling_timer_ = TaskQueue::kInvalidTask;
    TaskQueue::TaskId retry_timer_ = TaskQueue::kInvalidTask;
    TaskQueue::TaskId speech_timer_ = TaskQueue::kInvalidTask;
    uint64_t speech_in_flight_ = 0;  // speech id whose speak() call has not returned

    EnergyVad vad_;
    AudioBufferManager buffer_;

    // Notifications, guarded by mutex_
    std::deque<PendingNotification> pending_;
    std::map<uint64_t, Subscriber> subscribers_;
    uint64_t next_subscriber_id_ = 1;
    uint64_t notification_sequence_ = 0;
    bool delivering_ = false;

    std::unique_ptr<TaskQueue> pipeline_;
    std::unique_ptr<TaskQueue> timers_;
};

}  // namespace parley

#endif  // PARLEY_FEATURES_CONVERSATION_CONTROLLER_H
