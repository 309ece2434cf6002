#include "parley/features/audio/audio_utils.h"

#include <algorithm>
#include <cmath>

namespace parley {

namespace {
constexpr float kPcm16InScale = 32768.0f;
constexpr float kPcm16OutScale = 32767.0f;
constexpr float kNormalizePeak = 0.95f;
}  // namespace

std::vector<float> pcm16_to_float(const int16_t* samples, size_t count) {
    std::vector<float> out(count);
    for (size_t i = 0; i < count; ++i) {
        out[i] = static_cast<float>(samples[i]) / kPcm16InScale;
    }
    return out;
}

std::vector<float> pcm16_to_float(const std::vector<int16_t>& samples) {
    return pcm16_to_float(samples.data(), samples.size());
}

std::vector<int16_t> float_to_pcm16(const std::vector<float>& samples) {
    std::vector<int16_t> out(samples.size());
    for (size_t i = 0; i < samples.size(); ++i) {
        const float clamped = std::max(-1.0f, std::min(1.0f, samples[i]));
        out[i] = static_cast<int16_t>(clamped * kPcm16OutScale);
    }
    return out;
}

std::vector<float> resample_linear(const std::vector<float>& samples, int in_rate, int out_rate) {
    if (in_rate <= 0 || out_rate <= 0 || in_rate == out_rate || samples.empty()) {
        return samples;
    }

    const double ratio = static_cast<double>(in_rate) / static_cast<double>(out_rate);
    const size_t out_len = static_cast<size_t>(
        std::llround(static_cast<double>(samples.size()) * out_rate / in_rate));
    std::vector<float> out(out_len);

    const size_t last = samples.size() - 1;
    for (size_t i = 0; i < out_len; ++i) {
        const double pos = static_cast<double>(i) * ratio;
        const size_t index = static_cast<size_t>(pos);
        const double frac = pos - static_cast<double>(index);
        if (index >= last) {
            out[i] = samples[last];
        } else {
            out[i] = static_cast<float>(samples[index] * (1.0 - frac) + samples[index + 1] * frac);
        }
    }
    return out;
}

std::vector<float> normalize_peak(const std::vector<float>& samples) {
    float peak = 0.0f;
    for (float s : samples) {
        peak = std::max(peak, std::fabs(s));
    }
    if (peak <= 0.0f) {
        return samples;
    }

    const float gain = kNormalizePeak / peak;
    std::vector<float> out(samples.size());
    for (size_t i = 0; i < samples.size(); ++i) {
        out[i] = samples[i] * gain;
    }
    return out;
}

float mean_energy(const float* samples, size_t count) {
    if (samples == nullptr || count == 0) {
        return 0.0f;
    }
    double sum = 0.0;
    for (size_t i = 0; i < count; ++i) {
        sum += static_cast<double>(samples[i]) * samples[i];
    }
    return static_cast<float>(sum / static_cast<double>(count));
}

float compute_rms(const float* samples, size_t count) {
    return std::sqrt(mean_energy(samples, count));
}

}  // namespace parley
