#ifndef PARLEY_BACKENDS_ALSA_CAPTURE_SOURCE_H
#define PARLEY_BACKENDS_ALSA_CAPTURE_SOURCE_H

// =============================================================================
// AlsaCaptureSource - microphone input through ALSA
// =============================================================================
// 16-bit PCM capture converted to float frames of period_frames samples.
// Frames are delivered on an internal capture thread; the whole recording is
// kept and returned by stop().
// =============================================================================

#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "parley/features/conversation/capabilities.h"

namespace parley {

struct AlsaCaptureConfig {
    std::string device = "default";  // ALSA device ("default", "plughw:0,0", ...)
    uint32_t sample_rate = 16000;
    uint32_t channels = 1;
    uint32_t buffer_frames = 6400;
    uint32_t period_frames = 1600;
};

class AlsaCaptureSource : public ICaptureSource {
   public:
    explicit AlsaCaptureSource(const AlsaCaptureConfig& config = AlsaCaptureConfig());
    ~AlsaCaptureSource() override;

    AlsaCaptureSource(const AlsaCaptureSource&) = delete;
    AlsaCaptureSource& operator=(const AlsaCaptureSource&) = delete;

    ErrorCode initialize() override;
    ErrorCode start(FrameCallback on_frame) override;
    std::vector<float> stop() override;
    bool is_running() const override;
    int sample_rate() const override;
    ErrorCode shutdown() override;
    std::string last_error() const override;

    const AlsaCaptureConfig& config() const { return config_; }

    // Capture-capable PCM device names, "default" first
    static std::vector<std::string> list_devices();

   private:
    struct Impl;
    std::unique_ptr<Impl> impl_;

    AlsaCaptureConfig config_;
    mutable std::mutex error_mutex_;
    std::string last_error_;

    void set_error(const std::string& message);
};

}  // namespace parley

#endif  // PARLEY_BACKENDS_ALSA_CAPTURE_SOURCE_H
