#ifndef PARLEY_BACKENDS_WHISPER_TRANSCRIBER_H
#define PARLEY_BACKENDS_WHISPER_TRANSCRIBER_H

// =============================================================================
// WhisperTranscriber - whisper.cpp speech-to-text
// =============================================================================

#include <atomic>
#include <mutex>
#include <string>
#include <vector>

#include "parley/features/conversation/capabilities.h"

struct whisper_context;

namespace parley {

struct WhisperTranscriberConfig {
    std::string model_path;  // ggml model file
    std::string language = "en";
    int threads = 4;
    bool translate = false;
    bool use_gpu = false;
    float no_speech_threshold = 0.6f;
};

class WhisperTranscriber : public ITranscriber {
   public:
    explicit WhisperTranscriber(const WhisperTranscriberConfig& config);
    ~WhisperTranscriber() override;

    WhisperTranscriber(const WhisperTranscriber&) = delete;
    WhisperTranscriber& operator=(const WhisperTranscriber&) = delete;

    ErrorCode initialize() override;
    ErrorCode transcribe(const std::vector<float>& samples, int sample_rate,
                         std::string& out_text) override;

    // Aborts a running whisper_full() at its next check point
    void cancel() override;

    ErrorCode shutdown() override;
    std::string last_error() const override;

   private:
    static bool abort_requested(void* user_data);

    WhisperTranscriberConfig config_;
    whisper_context* context_ = nullptr;

    std::mutex context_mutex_;  // whisper contexts are single-user
    std::atomic<bool> cancel_requested_{false};

    mutable std::mutex error_mutex_;
    std::string last_error_;
};

}  // namespace parley

#endif  // PARLEY_BACKENDS_WHISPER_TRANSCRIBER_H
