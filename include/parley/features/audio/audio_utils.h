/**
 * @file audio_utils.h
 * @brief Parley - PCM helpers
 *
 * Float samples are normalized to [-1.0, 1.0]; PCM16 is signed 16-bit.
 */

#ifndef PARLEY_FEATURES_AUDIO_UTILS_H
#define PARLEY_FEATURES_AUDIO_UTILS_H

#include <cstddef>
#include <cstdint>
#include <vector>

namespace parley {

// sample / 32768
std::vector<float> pcm16_to_float(const int16_t* samples, size_t count);
std::vector<float> pcm16_to_float(const std::vector<int16_t>& samples);

// clamp to [-1, 1], then * 32767
std::vector<int16_t> float_to_pcm16(const std::vector<float>& samples);

// Linear interpolation; output length is round(n * out_rate / in_rate)
std::vector<float> resample_linear(const std::vector<float>& samples, int in_rate, int out_rate);

// Scales so the absolute peak becomes 0.95; silent input is returned as-is
std::vector<float> normalize_peak(const std::vector<float>& samples);

// Mean of squares; 0 for an empty frame
float mean_energy(const float* samples, size_t count);

float compute_rms(const float* samples, size_t count);

}  // namespace parley

#endif  // PARLEY_FEATURES_AUDIO_UTILS_H
