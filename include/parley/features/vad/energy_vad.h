/**
 * @file energy_vad.h
 * @brief Parley - Energy-based voice activity detector
 *
 * Classifies streaming frames as speech or silence from their mean-square
 * energy and reports utterance boundaries. Two thresholds give hysteresis:
 * frames between them change nothing.
 *
 * Not thread-safe; owned and driven by a single caller.
 */

#ifndef PARLEY_FEATURES_VAD_ENERGY_VAD_H
#define PARLEY_FEATURES_VAD_ENERGY_VAD_H

#include <cstddef>
#include <vector>

namespace parley {

struct VadConfig {
    float energy_threshold = 0.001f;   // mean-square energy that starts speech
    float silence_threshold = 0.0005f; // mean-square energy counted as silence
    double min_speech_duration_sec = 0.5;
    double max_silence_duration_sec = 2.0;
};

struct VadResult {
    bool is_speaking = false;
    bool speech_start = false;  // this frame opened a speech segment
    bool speech_end = false;    // this frame closed a long-enough speech segment
};

class EnergyVad {
   public:
    EnergyVad() = default;
    explicit EnergyVad(const VadConfig& config) : config_(config) {}

    // timestamp_sec must be monotonic within a listening turn
    VadResult process_sample(const float* samples, size_t count, double timestamp_sec);
    VadResult process_sample(const std::vector<float>& frame, double timestamp_sec) {
        return process_sample(frame.data(), frame.size(), timestamp_sec);
    }

    // Clears the speaking flag and both timers
    void reset();

    // Takes effect on the next processed frame
    void set_thresholds(float energy_threshold, float silence_threshold);

    bool is_speaking() const { return is_speaking_; }
    float last_energy() const { return last_energy_; }
    const VadConfig& config() const { return config_; }

   private:
    VadConfig config_;

    bool is_speaking_ = false;
    bool has_speech_start_ = false;
    bool has_silence_start_ = false;
    double speech_start_time_ = 0.0;
    double silence_start_time_ = 0.0;
    float last_energy_ = 0.0f;
};

}  // namespace parley

#endif  // PARLEY_FEATURES_VAD_ENERGY_VAD_H
