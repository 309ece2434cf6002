// =============================================================================
// WhisperTranscriber - Implementation
// =============================================================================

#include "whisper_transcriber.h"

#include <whisper.h>

#include <chrono>

#include "parley/core/logger.h"
#include "parley/features/audio/audio_utils.h"

namespace parley {

namespace {
constexpr const char* kLogCat = "Whisper";
constexpr int kWhisperSampleRate = 16000;
}  // namespace

WhisperTranscriber::WhisperTranscriber(const WhisperTranscriberConfig& config) : config_(config) {}

WhisperTranscriber::~WhisperTranscriber() {
    const ErrorCode code = shutdown();
    if (failed(code)) {
        PARLEY_LOG_WARNING(kLogCat, "Shutdown in destructor failed: %s", error_message(code));
    }
}

ErrorCode WhisperTranscriber::initialize() {
    std::lock_guard<std::mutex> lock(context_mutex_);
    if (context_) {
        return ErrorCode::Success;
    }
    if (config_.model_path.empty()) {
        std::lock_guard<std::mutex> error_lock(error_mutex_);
        last_error_ = "No whisper model path configured";
        return ErrorCode::InvalidArgument;
    }

    whisper_context_params cparams = whisper_context_default_params();
    cparams.use_gpu = config_.use_gpu;

    context_ = whisper_init_from_file_with_params(config_.model_path.c_str(), cparams);
    if (!context_) {
        std::lock_guard<std::mutex> error_lock(error_mutex_);
        last_error_ = "Failed to load whisper model: " + config_.model_path;
        PARLEY_LOG_ERROR(kLogCat, "%s", last_error_.c_str());
        return ErrorCode::InitializationFailed;
    }

    PARLEY_LOG_INFO(kLogCat, "Loaded %s (%d threads, language=%s)", config_.model_path.c_str(),
                    config_.threads, config_.language.c_str());
    return ErrorCode::Success;
}

bool WhisperTranscriber::abort_requested(void* user_data) {
    return static_cast<WhisperTranscriber*>(user_data)->cancel_requested_.load();
}

ErrorCode WhisperTranscriber::transcribe(const std::vector<float>& samples, int sample_rate,
                                         std::string& out_text) {
    out_text.clear();
    if (samples.empty()) {
        return ErrorCode::Success;
    }

    std::lock_guard<std::mutex> lock(context_mutex_);
    if (!context_) {
        return ErrorCode::NotInitialized;
    }
    cancel_requested_ = false;

    const std::vector<float> audio = sample_rate == kWhisperSampleRate
                                         ? samples
                                         : resample_linear(samples, sample_rate, kWhisperSampleRate);

    whisper_full_params params = whisper_full_default_params(WHISPER_SAMPLING_GREEDY);
    params.n_threads = config_.threads;
    params.language = config_.language.c_str();
    params.translate = config_.translate;
    params.print_progress = false;
    params.print_realtime = false;
    params.print_timestamps = false;
    params.print_special = false;
    params.no_speech_thold = config_.no_speech_threshold;
    params.abort_callback = &WhisperTranscriber::abort_requested;
    params.abort_callback_user_data = this;

    const auto start = std::chrono::steady_clock::now();
    const int rc = whisper_full(context_, params, audio.data(), static_cast<int>(audio.size()));
    if (cancel_requested_) {
        PARLEY_LOG_INFO(kLogCat, "Transcription cancelled");
        return ErrorCode::Cancelled;
    }
    if (rc != 0) {
        std::lock_guard<std::mutex> error_lock(error_mutex_);
        last_error_ = "whisper_full failed with code " + std::to_string(rc);
        PARLEY_LOG_ERROR(kLogCat, "%s", last_error_.c_str());
        return ErrorCode::TranscriptionFailed;
    }

    const int n_segments = whisper_full_n_segments(context_);
    for (int i = 0; i < n_segments; ++i) {
        out_text += whisper_full_get_segment_text(context_, i);
    }

    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);
    PARLEY_LOG_DEBUG(kLogCat, "%d segment(s) in %lld ms", n_segments,
                     static_cast<long long>(elapsed.count()));
    return ErrorCode::Success;
}

void WhisperTranscriber::cancel() {
    cancel_requested_ = true;
}

ErrorCode WhisperTranscriber::shutdown() {
    cancel_requested_ = true;
    std::lock_guard<std::mutex> lock(context_mutex_);
    if (context_) {
        whisper_free(context_);
        context_ = nullptr;
        PARLEY_LOG_DEBUG(kLogCat, "Model released");
    }
    return ErrorCode::Success;
}

std::string WhisperTranscriber::last_error() const {
    std::lock_guard<std::mutex> lock(error_mutex_);
    return last_error_;
}

}  // namespace parley
