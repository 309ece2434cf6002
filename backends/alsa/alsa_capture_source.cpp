// =============================================================================
// AlsaCaptureSource - Implementation
// =============================================================================

#include "alsa_capture_source.h"

#include <alsa/asoundlib.h>

#include <atomic>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <thread>

#include "parley/core/logger.h"

namespace parley {

namespace {
constexpr const char* kLogCat = "ALSA";
}  // namespace

// =============================================================================
// Implementation
// =============================================================================

struct AlsaCaptureSource::Impl {
    snd_pcm_t* pcm_handle = nullptr;
    std::thread capture_thread;
    std::atomic<bool> running{false};
    std::vector<int16_t> period;

    std::mutex recording_mutex;
    std::vector<float> recording;
};

AlsaCaptureSource::AlsaCaptureSource(const AlsaCaptureConfig& config)
    : impl_(std::make_unique<Impl>()), config_(config) {}

AlsaCaptureSource::~AlsaCaptureSource() {
    const ErrorCode code = shutdown();
    if (failed(code)) {
        PARLEY_LOG_WARNING(kLogCat, "Shutdown in destructor failed: %s", error_message(code));
    }
}

void AlsaCaptureSource::set_error(const std::string& message) {
    PARLEY_LOG_ERROR(kLogCat, "%s", message.c_str());
    std::lock_guard<std::mutex> lock(error_mutex_);
    last_error_ = message;
}

std::string AlsaCaptureSource::last_error() const {
    std::lock_guard<std::mutex> lock(error_mutex_);
    return last_error_;
}

ErrorCode AlsaCaptureSource::initialize() {
    if (impl_->pcm_handle) {
        return ErrorCode::Success;
    }

    int err = snd_pcm_open(&impl_->pcm_handle, config_.device.c_str(), SND_PCM_STREAM_CAPTURE, 0);
    if (err < 0) {
        impl_->pcm_handle = nullptr;
        set_error("Cannot open audio device '" + config_.device + "': " + snd_strerror(err));
        return ErrorCode::DeviceNotFound;
    }

    auto fail = [this](const char* what, int code) {
        set_error(std::string(what) + ": " + snd_strerror(code));
        snd_pcm_close(impl_->pcm_handle);
        impl_->pcm_handle = nullptr;
        return ErrorCode::CaptureFailed;
    };

    snd_pcm_hw_params_t* hw_params;
    snd_pcm_hw_params_alloca(&hw_params);
    snd_pcm_hw_params_any(impl_->pcm_handle, hw_params);

    err = snd_pcm_hw_params_set_access(impl_->pcm_handle, hw_params, SND_PCM_ACCESS_RW_INTERLEAVED);
    if (err < 0) return fail("Cannot set access type", err);

    err = snd_pcm_hw_params_set_format(impl_->pcm_handle, hw_params, SND_PCM_FORMAT_S16_LE);
    if (err < 0) return fail("Cannot set sample format", err);

    unsigned int rate = config_.sample_rate;
    err = snd_pcm_hw_params_set_rate_near(impl_->pcm_handle, hw_params, &rate, nullptr);
    if (err < 0) return fail("Cannot set sample rate", err);
    if (rate != config_.sample_rate) {
        PARLEY_LOG_WARNING(kLogCat, "Device rate %u differs from requested %u", rate,
                           config_.sample_rate);
        config_.sample_rate = rate;
    }

    err = snd_pcm_hw_params_set_channels(impl_->pcm_handle, hw_params, config_.channels);
    if (err < 0) return fail("Cannot set channels", err);

    snd_pcm_uframes_t buffer_size = config_.buffer_frames;
    err = snd_pcm_hw_params_set_buffer_size_near(impl_->pcm_handle, hw_params, &buffer_size);
    if (err < 0) return fail("Cannot set buffer size", err);
    config_.buffer_frames = static_cast<uint32_t>(buffer_size);

    snd_pcm_uframes_t period_size = config_.period_frames;
    err = snd_pcm_hw_params_set_period_size_near(impl_->pcm_handle, hw_params, &period_size,
                                                 nullptr);
    if (err < 0) return fail("Cannot set period size", err);
    config_.period_frames = static_cast<uint32_t>(period_size);

    err = snd_pcm_hw_params(impl_->pcm_handle, hw_params);
    if (err < 0) return fail("Cannot set hardware parameters", err);

    impl_->period.resize(static_cast<size_t>(config_.period_frames) * config_.channels);

    PARLEY_LOG_INFO(kLogCat, "Opened '%s' at %u Hz, period %u frames", config_.device.c_str(),
                    config_.sample_rate, config_.period_frames);
    return ErrorCode::Success;
}

ErrorCode AlsaCaptureSource::start(FrameCallback on_frame) {
    if (!impl_->pcm_handle) {
        set_error("Capture device not initialized");
        return ErrorCode::NotInitialized;
    }
    if (impl_->running) {
        return ErrorCode::Success;
    }

    int err = snd_pcm_prepare(impl_->pcm_handle);
    if (err < 0) {
        set_error(std::string("Cannot prepare device: ") + snd_strerror(err));
        return ErrorCode::CaptureFailed;
    }

    {
        std::lock_guard<std::mutex> lock(impl_->recording_mutex);
        impl_->recording.clear();
    }
    impl_->running = true;

    impl_->capture_thread = std::thread([this, on_frame]() {
        const uint32_t channels = config_.channels;
        std::vector<float> mono;
        while (impl_->running) {
            snd_pcm_sframes_t frames =
                snd_pcm_readi(impl_->pcm_handle, impl_->period.data(), config_.period_frames);

            if (frames < 0) {
                if (frames == -EPIPE) {
                    PARLEY_LOG_WARNING(kLogCat, "Overrun, recovering");
                    snd_pcm_prepare(impl_->pcm_handle);
                    continue;
                } else if (frames == -EAGAIN) {
                    continue;
                }
                set_error(std::string("Read failed: ") + snd_strerror(static_cast<int>(frames)));
                impl_->running = false;
                break;
            }
            if (frames == 0) {
                continue;
            }

            // Downmix to mono float
            mono.resize(static_cast<size_t>(frames));
            for (snd_pcm_sframes_t i = 0; i < frames; ++i) {
                int32_t sum = 0;
                for (uint32_t ch = 0; ch < channels; ++ch) {
                    sum += impl_->period[static_cast<size_t>(i) * channels + ch];
                }
                mono[static_cast<size_t>(i)] =
                    static_cast<float>(sum) / (32768.0f * static_cast<float>(channels));
            }

            {
                std::lock_guard<std::mutex> lock(impl_->recording_mutex);
                impl_->recording.insert(impl_->recording.end(), mono.begin(), mono.end());
            }
            if (on_frame) {
                on_frame(mono.data(), mono.size());
            }
        }
    });

    PARLEY_LOG_DEBUG(kLogCat, "Capture started");
    return ErrorCode::Success;
}

std::vector<float> AlsaCaptureSource::stop() {
    if (impl_->capture_thread.joinable()) {
        impl_->running = false;
        if (std::this_thread::get_id() == impl_->capture_thread.get_id()) {
            impl_->capture_thread.detach();
        } else {
            impl_->capture_thread.join();
        }
        if (impl_->pcm_handle) {
            snd_pcm_drop(impl_->pcm_handle);
        }
        PARLEY_LOG_DEBUG(kLogCat, "Capture stopped");
    }

    std::lock_guard<std::mutex> lock(impl_->recording_mutex);
    std::vector<float> recording;
    recording.swap(impl_->recording);
    return recording;
}

bool AlsaCaptureSource::is_running() const {
    return impl_->running;
}

int AlsaCaptureSource::sample_rate() const {
    return static_cast<int>(config_.sample_rate);
}

ErrorCode AlsaCaptureSource::shutdown() {
    stop();
    if (impl_->pcm_handle) {
        const int err = snd_pcm_close(impl_->pcm_handle);
        impl_->pcm_handle = nullptr;
        if (err < 0) {
            set_error(std::string("Cannot close device: ") + snd_strerror(err));
            return ErrorCode::ShutdownFailed;
        }
    }
    return ErrorCode::Success;
}

std::vector<std::string> AlsaCaptureSource::list_devices() {
    std::vector<std::string> devices;
    devices.push_back("default");

    void** hints = nullptr;
    if (snd_device_name_hint(-1, "pcm", &hints) < 0) {
        return devices;
    }

    for (void** hint = hints; *hint != nullptr; ++hint) {
        char* name = snd_device_name_get_hint(*hint, "NAME");
        char* ioid = snd_device_name_get_hint(*hint, "IOID");

        // IOID is absent for devices that support both directions
        if (name && (!ioid || strcmp(ioid, "Input") == 0) && strcmp(name, "default") != 0) {
            devices.push_back(name);
        }

        if (name) free(name);
        if (ioid) free(ioid);
    }

    snd_device_name_free_hint(hints);
    return devices;
}

}  // namespace parley
