// =============================================================================
// ConversationController - Implementation
// =============================================================================
// Threads involved:
//   - host threads calling the public operations
//   - the capture thread delivering frames (on_frame)
//   - pipeline_: capture start/stop and transcribe -> generate -> speak
//   - timers_: recording ceiling, capture retry backoff, speech estimate
//
// mutex_ guards all session state. Collaborators are never called while it
// is held. Work that outlives a state change carries the turn or speech id it
// was started for and is dropped when that id is no longer current.
// =============================================================================

#include "parley/features/conversation/conversation_controller.h"

#include <chrono>
#include <exception>
#include <thread>
#include <utility>

#include "parley/core/logger.h"
#include "parley/features/conversation/conversation_history.h"
#include "parley/features/conversation/null_response_generator.h"

namespace parley {

namespace {
constexpr const char* kLogCat = "Controller";
constexpr std::chrono::milliseconds kStopRetryInterval(20);

std::string describe_failure(ErrorCode code, const std::string& collaborator_error) {
    if (!collaborator_error.empty()) {
        return collaborator_error;
    }
    return error_message(code);
}
}  // namespace

// =============================================================================
// Lifecycle
// =============================================================================

ConversationController::ConversationController(const ControllerConfig& config,
                                               std::shared_ptr<ICaptureSource> capture,
                                               std::shared_ptr<ITranscriber> transcriber,
                                               std::shared_ptr<IResponseGenerator> generator,
                                               std::shared_ptr<ISpeaker> speaker)
    : config_(config),
      capture_(std::move(capture)),
      transcriber_(std::move(transcriber)),
      generator_(std::move(generator)),
      speaker_(std::move(speaker)),
      capture_rate_(config.sample_rate),
      vad_(config.vad),
      buffer_(config.sample_rate, config.max_buffer_frames, config.max_buffer_seconds),
      pipeline_(std::make_unique<TaskQueue>("conversation-pipeline")),
      timers_(std::make_unique<TaskQueue>("conversation-timers")) {
    if (!generator_) {
        PARLEY_LOG_INFO(kLogCat, "No response generator configured, running speech-only");
        generator_ = std::make_shared<NullResponseGenerator>();
    }
}

ConversationController::~ConversationController() {
    if (!is_disposed()) {
        const ErrorCode code = dispose();
        if (failed(code)) {
            PARLEY_LOG_WARNING(kLogCat, "Dispose on destruction reported: %s", error_message(code));
        }
    }
}

ErrorCode ConversationController::initialize() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (disposed_) {
            return ErrorCode::AlreadyDisposed;
        }
        if (state_.initialized) {
            return ErrorCode::Success;
        }
    }

    auto fail = [this](const char* what, ErrorCode code, const std::string& detail) {
        PARLEY_LOG_ERROR(kLogCat, "Failed to initialize %s: %s", what, detail.c_str());
        {
            std::lock_guard<std::mutex> lock(mutex_);
            fail_locked(code, std::string(what) + ": " + detail);
        }
        deliver_pending();
        return code;
    };

    if (!capture_ || !transcriber_ || !speaker_) {
        return fail("controller", ErrorCode::InvalidArgument, "missing collaborator");
    }

    ErrorCode code = capture_->initialize();
    if (failed(code)) {
        return fail("capture source", code, describe_failure(code, capture_->last_error()));
    }

    code = transcriber_->initialize();
    if (failed(code)) {
        return fail("transcriber", code, describe_failure(code, transcriber_->last_error()));
    }

    std::string prompt;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        prompt = config_.system_prompt;
    }
    code = generator_->initialize(prompt);
    if (failed(code)) {
        return fail("response generator", code, describe_failure(code, generator_->last_error()));
    }

    code = speaker_->initialize();
    if (failed(code)) {
        return fail("speaker", code, describe_failure(code, speaker_->last_error()));
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (disposed_) {
            return ErrorCode::AlreadyDisposed;
        }
        state_.initialized = true;
        commit_locked();
    }
    deliver_pending();
    PARLEY_LOG_INFO(kLogCat, "Initialized (sample_rate=%d)", config_.sample_rate);
    return ErrorCode::Success;
}

ErrorCode ConversationController::dispose() {
    bool was_capturing = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (disposed_) {
            return ErrorCode::AlreadyDisposed;
        }
        disposed_ = true;
        ++turn_id_;
        ++speech_id_;
        was_capturing = capturing_;
        capturing_ = false;
        cancel_timer_locked(ceiling_timer_);
        cancel_timer_locked(retry_timer_);
        cancel_timer_locked(speech_timer_);

        state_.state = ConversationState::Idle;
        state_.initialized = false;
        commit_locked();
    }
    deliver_pending();

    PARLEY_LOG_INFO(kLogCat, "Disposing");

    // Ask in-flight work to finish early, then stop the workers
    if (transcriber_) {
        transcriber_->cancel();
    }
    generator_->cancel();
    if (speaker_) {
        speaker_->stop();
    }
    if (was_capturing && capture_) {
        capture_->stop();
    }
    timers_->shutdown();
    if (speaker_) {
        while (speech_in_progress()) {
            std::this_thread::sleep_for(kStopRetryInterval);
            speaker_->stop();
        }
    }
    pipeline_->shutdown();

    buffer_.clear();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        vad_.reset();
    }

    // Every collaborator gets its shutdown, whatever the others do
    int failures = 0;
    auto shutdown_one = [&failures](const char* name, auto& collaborator) {
        if (!collaborator) {
            return;
        }
        try {
            const ErrorCode code = collaborator->shutdown();
            if (failed(code)) {
                ++failures;
                PARLEY_LOG_ERROR(kLogCat, "Shutdown of %s failed: %s", name,
                                 describe_failure(code, collaborator->last_error()).c_str());
            }
        } catch (const std::exception& e) {
            ++failures;
            PARLEY_LOG_ERROR(kLogCat, "Shutdown of %s threw: %s", name, e.what());
        }
    };
    shutdown_one("capture source", capture_);
    shutdown_one("transcriber", transcriber_);
    shutdown_one("response generator", generator_);
    shutdown_one("speaker", speaker_);

    {
        std::lock_guard<std::mutex> lock(mutex_);
        subscribers_.clear();
        pending_.clear();
    }

    PARLEY_LOG_INFO(kLogCat, "Disposed (%d shutdown failure(s))", failures);
    return failures == 0 ? ErrorCode::Success : ErrorCode::ShutdownFailed;
}

// =============================================================================
// Listening
// =============================================================================

ErrorCode ConversationController::start_listening() {
    bool barge_in = false;
    uint64_t in_flight = 0;
    uint64_t epoch = 0;
    uint64_t turn = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (disposed_) {
            return ErrorCode::AlreadyDisposed;
        }
        if (!state_.initialized) {
            PARLEY_LOG_WARNING(kLogCat, "start_listening before initialize");
            return ErrorCode::NotInitialized;
        }
        if (state_.state == ConversationState::Listening) {
            return ErrorCode::Success;
        }
        if (state_.state == ConversationState::Thinking) {
            PARLEY_LOG_DEBUG(kLogCat, "start_listening ignored, turn still processing");
            return ErrorCode::InvalidState;
        }

        barge_in = state_.state == ConversationState::Speaking;
        in_flight = speech_in_flight_;
        epoch = ++speech_id_;
        cancel_timer_locked(speech_timer_);

        state_.error_code = ErrorCode::Success;
        state_.error.clear();
        state_.transcript.clear();
        state_.state = ConversationState::Listening;
        buffer_.clear();
        vad_.reset();
        stream_samples_ = 0;
        turn = ++turn_id_;

        ceiling_timer_ = timers_->post_delayed(std::chrono::milliseconds(config_.max_recording_ms),
                                               [this, turn]() {
                                                   const ErrorCode code =
                                                       stop_listening_for(turn, "recording ceiling");
                                                   if (failed(code)) {
                                                       PARLEY_LOG_DEBUG(kLogCat, "Ceiling stop: %s",
                                                                        error_message(code));
                                                   }
                                               });
        commit_locked();
    }
    deliver_pending();

    if (barge_in) {
        PARLEY_LOG_INFO(kLogCat, "Barge-in: stopping playback");
        stop_speaker(in_flight, epoch);
    }

    pipeline_->post([this, turn]() { begin_capture(turn, 1); });
    PARLEY_LOG_INFO(kLogCat, "Listening (turn %llu)", static_cast<unsigned long long>(turn));
    return ErrorCode::Success;
}

ErrorCode ConversationController::stop_listening() {
    uint64_t turn = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (disposed_) {
            return ErrorCode::AlreadyDisposed;
        }
        turn = turn_id_;
    }
    return stop_listening_for(turn, "requested");
}

ErrorCode ConversationController::stop_listening_for(uint64_t turn, const char* reason) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (disposed_) {
            return ErrorCode::AlreadyDisposed;
        }
        if (!turn_is_current_locked(turn, ConversationState::Listening)) {
            return ErrorCode::Success;
        }
        cancel_timer_locked(ceiling_timer_);
        cancel_timer_locked(retry_timer_);
        state_.state = ConversationState::Thinking;
        commit_locked();
    }
    deliver_pending();

    PARLEY_LOG_INFO(kLogCat, "Stop listening (%s)", reason);
    pipeline_->post([this, turn]() { finish_capture(turn); });
    return ErrorCode::Success;
}

void ConversationController::begin_capture(uint64_t turn, int attempt) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (disposed_ || !turn_is_current_locked(turn, ConversationState::Listening)) {
            return;
        }
    }

    // Frames are timed and transcribed at the rate the device actually runs at
    const int rate = capture_->sample_rate();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (rate > 0 && rate != capture_rate_) {
            PARLEY_LOG_WARNING(kLogCat, "Capture runs at %d Hz (configured %d Hz)", rate,
                               config_.sample_rate);
            capture_rate_ = rate;
            buffer_.set_sample_rate(rate);
        }
    }

    const ErrorCode code = capture_->start(
        [this, turn](const float* samples, size_t count) { on_frame(turn, samples, count); });

    if (succeeded(code)) {
        bool stale = false;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            stale = disposed_ || !turn_is_current_locked(turn, ConversationState::Listening);
            if (!stale) {
                capturing_ = true;
            }
        }
        if (stale) {
            capture_->stop();
        } else {
            PARLEY_LOG_DEBUG(kLogCat, "Capture started (attempt %d)", attempt);
        }
        return;
    }

    const std::string detail = describe_failure(code, capture_->last_error());
    PARLEY_LOG_WARNING(kLogCat, "Capture start attempt %d/%d failed: %s", attempt,
                       config_.capture_start_attempts, detail.c_str());

    if (attempt < config_.capture_start_attempts) {
        schedule_capture_retry(turn, attempt + 1);
        return;
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (disposed_ || !turn_is_current_locked(turn, ConversationState::Listening)) {
            return;
        }
        cancel_timer_locked(ceiling_timer_);
        fail_locked(ErrorCode::CaptureFailed, detail);
    }
    deliver_pending();
}

void ConversationController::schedule_capture_retry(uint64_t turn, int next_attempt) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (disposed_ || !turn_is_current_locked(turn, ConversationState::Listening)) {
        return;
    }
    retry_timer_ = timers_->post_delayed(
        std::chrono::milliseconds(config_.capture_retry_backoff_ms), [this, turn, next_attempt]() {
            pipeline_->post([this, turn, next_attempt]() {
                {
                    std::lock_guard<std::mutex> lock(mutex_);
                    if (disposed_ || !turn_is_current_locked(turn, ConversationState::Listening)) {
                        return;
                    }
                    retry_timer_ = TaskQueue::kInvalidTask;
                }
                // Reinitialize the capture subsystem before the next attempt
                const ErrorCode shutdown_code = capture_->shutdown();
                if (failed(shutdown_code)) {
                    PARLEY_LOG_WARNING(kLogCat, "Capture shutdown before retry failed: %s",
                                       error_message(shutdown_code));
                }
                const ErrorCode init_code = capture_->initialize();
                if (failed(init_code)) {
                    PARLEY_LOG_WARNING(kLogCat, "Capture reinitialize failed: %s",
                                       error_message(init_code));
                }
                begin_capture(turn, next_attempt);
            });
        });
}

void ConversationController::on_frame(uint64_t turn, const float* samples, size_t count) {
    bool speech_end = false;
    double timestamp = 0.0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (disposed_ || !turn_is_current_locked(turn, ConversationState::Listening)) {
            return;
        }
        buffer_.add_buffer(samples, count);
        stream_samples_ += count;
        if (config_.vad_enabled) {
            timestamp = static_cast<double>(stream_samples_) / static_cast<double>(capture_rate_);
            speech_end = vad_.process_sample(samples, count, timestamp).speech_end;
        }
    }

    if (speech_end) {
        PARLEY_LOG_DEBUG(kLogCat, "End of utterance at %.2fs", timestamp);
        const ErrorCode code = stop_listening_for(turn, "end of speech");
        if (failed(code)) {
            PARLEY_LOG_DEBUG(kLogCat, "VAD stop: %s", error_message(code));
        }
    }
}

// =============================================================================
// Turn pipeline (runs on pipeline_)
// =============================================================================

void ConversationController::finish_capture(uint64_t turn) {
    bool was_capturing = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (disposed_ || !turn_is_current_locked(turn, ConversationState::Thinking)) {
            return;
        }
        was_capturing = capturing_;
        capturing_ = false;
    }

    std::vector<float> recording;
    if (was_capturing) {
        recording = capture_->stop();
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (disposed_ || !turn_is_current_locked(turn, ConversationState::Thinking)) {
            return;
        }
        // The full recording supersedes what the live frames collected
        if (!recording.empty()) {
            buffer_.replace(recording);
        }
    }

    run_turn(turn);
}

void ConversationController::run_turn(uint64_t turn) {
    const std::vector<float> samples = buffer_.get_concatenated_buffer();
    const int rate = buffer_.sample_rate();
    if (samples.empty()) {
        PARLEY_LOG_INFO(kLogCat, "No audio captured, back to idle");
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!disposed_ && turn_is_current_locked(turn, ConversationState::Thinking)) {
                state_.state = ConversationState::Idle;
                commit_locked();
            }
        }
        deliver_pending();
        return;
    }

    PARLEY_LOG_INFO(kLogCat, "Transcribing %.2fs of audio",
                    static_cast<double>(samples.size()) / rate);

    std::string transcript;
    ErrorCode code = transcriber_->transcribe(samples, rate, transcript);
    transcript = trim_whitespace(transcript);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (disposed_ || !turn_is_current_locked(turn, ConversationState::Thinking)) {
            PARLEY_LOG_DEBUG(kLogCat, "Dropping stale transcription result");
            return;
        }
        if (failed(code)) {
            fail_locked(ErrorCode::TranscriptionFailed,
                        describe_failure(code, transcriber_->last_error()));
        } else if (transcript.empty()) {
            state_.state = ConversationState::Idle;
            commit_locked();
        } else {
            state_.transcript = transcript;
            commit_locked();
        }
    }
    deliver_pending();
    if (failed(code) || transcript.empty()) {
        if (succeeded(code)) {
            PARLEY_LOG_INFO(kLogCat, "Empty transcript, back to idle");
        }
        return;
    }

    PARLEY_LOG_INFO(kLogCat, "User: %s", transcript.c_str());

    std::string response;
    code = generator_->generate(transcript, response);
    response = trim_whitespace(response);

    uint64_t speech = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (disposed_ || !turn_is_current_locked(turn, ConversationState::Thinking)) {
            PARLEY_LOG_DEBUG(kLogCat, "Dropping stale response");
            return;
        }
        if (failed(code)) {
            fail_locked(ErrorCode::GenerationFailed,
                        describe_failure(code, generator_->last_error()));
        } else if (response.empty()) {
            state_.state = ConversationState::Idle;
            commit_locked();
        } else {
            state_.response = response;
            state_.state = ConversationState::Speaking;
            speech = ++speech_id_;
            commit_locked();
        }
    }
    deliver_pending();
    if (speech == 0) {
        return;
    }

    PARLEY_LOG_INFO(kLogCat, "Assistant: %s", response.c_str());
    perform_speech(speech, response);
}

void ConversationController::perform_speech(uint64_t speech, const std::string& text) {
    {
        std::lock_guard<std::mutex> stop_lock(speaker_stop_mutex_);
        std::lock_guard<std::mutex> lock(mutex_);
        if (disposed_ || speech != speech_id_ || state_.state != ConversationState::Speaking) {
            return;
        }
        speech_in_flight_ = speech;
    }

    const ErrorCode code = speaker_->speak(text);
    const bool confirmed = speaker_->reports_completion();
    const std::string detail = failed(code) ? describe_failure(code, speaker_->last_error()) : "";

    {
        std::lock_guard<std::mutex> lock(mutex_);
        speech_in_flight_ = 0;
        if (disposed_ || speech != speech_id_ || state_.state != ConversationState::Speaking) {
            return;
        }
        if (failed(code)) {
            fail_locked(ErrorCode::SpeechFailed, detail);
        } else if (confirmed) {
            state_.state = ConversationState::Idle;
            commit_locked();
        } else {
            const auto estimate = std::chrono::milliseconds(
                static_cast<int64_t>(text.size()) * config_.speech_ms_per_char);
            speech_timer_ = timers_->post_delayed(
                estimate, [this, speech]() { on_speech_estimate_elapsed(speech); });
        }
    }
    deliver_pending();
}

void ConversationController::on_speech_estimate_elapsed(uint64_t speech) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (disposed_ || speech != speech_id_ || state_.state != ConversationState::Speaking) {
            return;
        }
        speech_timer_ = TaskQueue::kInvalidTask;
        state_.state = ConversationState::Idle;
        commit_locked();
    }
    deliver_pending();
}

// =============================================================================
// Speech
// =============================================================================

ErrorCode ConversationController::speak(const std::string& text) {
    const std::string utterance = trim_whitespace(text);
    bool replace_current = false;
    uint64_t in_flight = 0;
    uint64_t speech = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (disposed_) {
            return ErrorCode::AlreadyDisposed;
        }
        if (!state_.initialized) {
            return ErrorCode::NotInitialized;
        }
        if (state_.state == ConversationState::Listening ||
            state_.state == ConversationState::Thinking) {
            return ErrorCode::InvalidState;
        }
        if (utterance.empty()) {
            return ErrorCode::InvalidArgument;
        }

        replace_current = state_.state == ConversationState::Speaking;
        in_flight = speech_in_flight_;
        cancel_timer_locked(speech_timer_);
        state_.error_code = ErrorCode::Success;
        state_.error.clear();
        state_.state = ConversationState::Speaking;
        speech = ++speech_id_;
        commit_locked();
    }
    deliver_pending();

    if (replace_current) {
        stop_speaker(in_flight, speech);
    }
    pipeline_->post([this, speech, utterance]() { perform_speech(speech, utterance); });
    return ErrorCode::Success;
}

// A stop() that lands before speak() has started playback finds nothing to
// stop, so it is repeated until the interrupted speak() call returns.
// `epoch` is speech_id_ right after the interruption; once a newer utterance
// takes the speaker nothing is stopped on behalf of the old one.
void ConversationController::stop_speaker(uint64_t in_flight, uint64_t epoch) {
    std::lock_guard<std::mutex> stop_lock(speaker_stop_mutex_);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (disposed_ || speech_id_ != epoch) {
            return;
        }
        if (in_flight != 0 && speech_in_flight_ != in_flight) {
            return;
        }
    }

    speaker_->stop();
    if (in_flight == 0) {
        return;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (!disposed_ && speech_in_flight_ == in_flight) {
        timers_->post_delayed(kStopRetryInterval, [this, in_flight, epoch]() {
            PARLEY_LOG_DEBUG(kLogCat, "Repeating stop for utterance %llu",
                             static_cast<unsigned long long>(in_flight));
            stop_speaker(in_flight, epoch);
        });
    }
}

bool ConversationController::speech_in_progress() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return speech_in_flight_ != 0;
}

ErrorCode ConversationController::interrupt_speech() {
    uint64_t in_flight = 0;
    uint64_t epoch = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (disposed_) {
            return ErrorCode::AlreadyDisposed;
        }
        if (state_.state != ConversationState::Speaking) {
            return ErrorCode::Success;
        }
        epoch = ++speech_id_;
        cancel_timer_locked(speech_timer_);
        in_flight = speech_in_flight_;
        state_.state = ConversationState::Idle;
        commit_locked();
    }
    deliver_pending();

    stop_speaker(in_flight, epoch);
    PARLEY_LOG_INFO(kLogCat, "Speech interrupted");
    return ErrorCode::Success;
}

// =============================================================================
// Configuration pass-through
// =============================================================================

ErrorCode ConversationController::set_system_prompt(const std::string& prompt) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (disposed_) {
            return ErrorCode::AlreadyDisposed;
        }
        config_.system_prompt = prompt;
    }
    generator_->set_system_prompt(prompt);
    return ErrorCode::Success;
}

ErrorCode ConversationController::clear_history() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (disposed_) {
            return ErrorCode::AlreadyDisposed;
        }
    }
    generator_->clear_history();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (disposed_) {
            return ErrorCode::AlreadyDisposed;
        }
        state_.transcript.clear();
        state_.response.clear();
        commit_locked();
    }
    deliver_pending();
    return ErrorCode::Success;
}

ErrorCode ConversationController::set_vad_thresholds(float energy_threshold,
                                                     float silence_threshold) {
    if (energy_threshold < 0.0f || silence_threshold < 0.0f) {
        return ErrorCode::InvalidArgument;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    if (disposed_) {
        return ErrorCode::AlreadyDisposed;
    }
    vad_.set_thresholds(energy_threshold, silence_threshold);
    config_.vad.energy_threshold = energy_threshold;
    config_.vad.silence_threshold = silence_threshold;
    return ErrorCode::Success;
}

ErrorCode ConversationController::set_vad_enabled(bool enabled) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (disposed_) {
        return ErrorCode::AlreadyDisposed;
    }
    config_.vad_enabled = enabled;
    return ErrorCode::Success;
}

// =============================================================================
// Observation
// =============================================================================

ConversationSnapshot ConversationController::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

ConversationState ConversationController::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_.state;
}

bool ConversationController::is_disposed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return disposed_;
}

ControllerConfig ConversationController::config() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return config_;
}

ConversationController::Unsubscribe ConversationController::subscribe(StateCallback callback) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (disposed_ || !callback) {
        return []() {};
    }
    const uint64_t id = next_subscriber_id_++;
    Subscriber subscriber;
    subscriber.first_sequence = notification_sequence_ + 1;
    subscriber.callback = std::move(callback);
    subscribers_.emplace(id, std::move(subscriber));

    return [this, id]() {
        std::lock_guard<std::mutex> inner(mutex_);
        subscribers_.erase(id);
    };
}

// =============================================================================
// Internals
// =============================================================================

bool ConversationController::turn_is_current_locked(uint64_t turn,
                                                    ConversationState expected) const {
    return turn == turn_id_ && state_.state == expected;
}

void ConversationController::commit_locked() {
    state_.listening = state_.state == ConversationState::Listening;
    state_.thinking = state_.state == ConversationState::Thinking;
    state_.speaking = state_.state == ConversationState::Speaking;
    if (state_ == published_) {
        return;
    }
    if (state_.state != published_.state) {
        PARLEY_LOG_DEBUG(kLogCat, "%s -> %s", conversation_state_name(published_.state),
                         conversation_state_name(state_.state));
    }
    published_ = state_;
    PendingNotification notification;
    notification.sequence = ++notification_sequence_;
    notification.snapshot = state_;
    pending_.push_back(std::move(notification));
}

void ConversationController::fail_locked(ErrorCode code, const std::string& detail) {
    const ErrorInfo info = make_error_info(code, detail);
    PARLEY_LOG_ERROR(kLogCat, "[%s] %s", info.category.c_str(), info.message.c_str());

    state_.error_code = code;
    state_.error = info.message;
    state_.state = ConversationState::Error;
    commit_locked();

    state_.state = ConversationState::Idle;
    commit_locked();
}

void ConversationController::cancel_timer_locked(TaskQueue::TaskId& id) {
    if (id != TaskQueue::kInvalidTask) {
        timers_->cancel(id);
        id = TaskQueue::kInvalidTask;
    }
}

// Delivers queued snapshots in order. Only one thread delivers at a time; a
// change made while another thread is delivering (or from inside a callback)
// is picked up by the loop already running.
void ConversationController::deliver_pending() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (delivering_) {
            return;
        }
        delivering_ = true;
    }

    while (true) {
        PendingNotification next;
        std::vector<StateCallback> targets;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (pending_.empty()) {
                delivering_ = false;
                return;
            }
            next = std::move(pending_.front());
            pending_.pop_front();
            for (const auto& entry : subscribers_) {
                if (next.sequence >= entry.second.first_sequence) {
                    targets.push_back(entry.second.callback);
                }
            }
        }

        for (const auto& callback : targets) {
            try {
                callback(next.snapshot);
            } catch (const std::exception& e) {
                PARLEY_LOG_ERROR(kLogCat, "State subscriber threw: %s", e.what());
            }
        }
    }
}

}  // namespace parley
