/**
 * @file energy_vad.cpp
 * @brief Parley - Energy-based voice activity detector
 */

#include "parley/features/vad/energy_vad.h"

#include "parley/core/logger.h"
#include "parley/features/audio/audio_utils.h"

namespace parley {

VadResult EnergyVad::process_sample(const float* samples, size_t count, double timestamp_sec) {
    VadResult result;

    const float energy = mean_energy(samples, count);
    last_energy_ = energy;

    if (energy > config_.energy_threshold) {
        if (!is_speaking_) {
            is_speaking_ = true;
            has_speech_start_ = true;
            speech_start_time_ = timestamp_sec;
            result.speech_start = true;
            PARLEY_LOG_DEBUG("VAD", "Speech start at %.3fs (energy=%.6f)", timestamp_sec,
                             static_cast<double>(energy));
        }
        // Any loud frame breaks the current silence run
        has_silence_start_ = false;
        silence_start_time_ = 0.0;
    } else if (energy < config_.silence_threshold && is_speaking_) {
        if (!has_silence_start_) {
            has_silence_start_ = true;
            silence_start_time_ = timestamp_sec;
        } else if (timestamp_sec - silence_start_time_ > config_.max_silence_duration_sec) {
            const double speech_duration =
                has_speech_start_ ? timestamp_sec - speech_start_time_ : 0.0;
            if (speech_duration > config_.min_speech_duration_sec) {
                result.speech_end = true;
                PARLEY_LOG_DEBUG("VAD", "Speech end at %.3fs (%.2fs of audio)", timestamp_sec,
                                 speech_duration);
            } else {
                PARLEY_LOG_DEBUG("VAD", "Discarding %.2fs blip", speech_duration);
            }
            reset();
        }
    }

    result.is_speaking = is_speaking_;
    return result;
}

void EnergyVad::reset() {
    is_speaking_ = false;
    has_speech_start_ = false;
    has_silence_start_ = false;
    speech_start_time_ = 0.0;
    silence_start_time_ = 0.0;
}

void EnergyVad::set_thresholds(float energy_threshold, float silence_threshold) {
    config_.energy_threshold = energy_threshold;
    config_.silence_threshold = silence_threshold;
    PARLEY_LOG_INFO("VAD", "Thresholds set: energy=%.6f silence=%.6f",
                    static_cast<double>(energy_threshold), static_cast<double>(silence_threshold));
}

}  // namespace parley
