/**
 * @file audio_buffer.cpp
 * @brief Parley - Memory-bounded audio frame accumulator
 */

#include "parley/features/audio/audio_buffer.h"

#include <algorithm>
#include <cmath>

#include "parley/core/logger.h"

namespace parley {

namespace {

size_t samples_for(double seconds, int sample_rate) {
    return std::max<size_t>(
        1, static_cast<size_t>(std::llround(seconds * static_cast<double>(sample_rate))));
}

}  // namespace

AudioBufferManager::AudioBufferManager(int sample_rate, size_t max_frames, double max_seconds)
    : max_frames_(std::max<size_t>(1, max_frames)),
      max_seconds_(max_seconds),
      sample_rate_(sample_rate > 0 ? sample_rate : kDefaultSampleRate),
      max_total_samples_(samples_for(max_seconds, sample_rate_)) {}

void AudioBufferManager::set_sample_rate(int sample_rate) {
    if (sample_rate <= 0) {
        return;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    if (sample_rate == sample_rate_) {
        return;
    }
    sample_rate_ = sample_rate;
    max_total_samples_ = samples_for(max_seconds_, sample_rate_);
    evict_locked();
    if (total_samples_ > max_total_samples_) {
        std::vector<float>& only = frames_.front();
        only.erase(only.begin(), only.end() - static_cast<std::ptrdiff_t>(max_total_samples_));
        total_samples_ = only.size();
        ++truncations_;
    }
}

int AudioBufferManager::sample_rate() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sample_rate_;
}

size_t AudioBufferManager::max_total_samples() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return max_total_samples_;
}

void AudioBufferManager::add_buffer(const float* samples, size_t count) {
    if (samples == nullptr || count == 0) {
        return;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    append_locked(samples, count);
    evict_locked();
}

void AudioBufferManager::replace(const std::vector<float>& samples) {
    std::lock_guard<std::mutex> lock(mutex_);
    frames_.clear();
    total_samples_ = 0;
    if (!samples.empty()) {
        append_locked(samples.data(), samples.size());
    }
}

void AudioBufferManager::append_locked(const float* samples, size_t count) {
    // A single frame longer than the cap keeps only its most recent samples
    if (count > max_total_samples_) {
        PARLEY_LOG_WARNING("AudioBuffer", "Frame of %zu samples exceeds cap of %zu, keeping tail",
                           count, max_total_samples_);
        samples += count - max_total_samples_;
        count = max_total_samples_;
        ++truncations_;
    }
    frames_.emplace_back(samples, samples + count);
    total_samples_ += count;
}

void AudioBufferManager::evict_locked() {
    while (frames_.size() > max_frames_) {
        total_samples_ -= frames_.front().size();
        frames_.pop_front();
    }
    while (total_samples_ > max_total_samples_ && frames_.size() > 1) {
        total_samples_ -= frames_.front().size();
        frames_.pop_front();
    }
}

std::vector<float> AudioBufferManager::get_concatenated_buffer() const {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<float> out;
    out.reserve(total_samples_);
    for (const auto& frame : frames_) {
        out.insert(out.end(), frame.begin(), frame.end());
    }

    if (out.size() > max_total_samples_) {
        PARLEY_LOG_WARNING("AudioBuffer", "Concatenated buffer too large (%zu samples), truncating",
                           out.size());
        out.erase(out.begin(), out.end() - static_cast<std::ptrdiff_t>(max_total_samples_));
        ++truncations_;
    }
    return out;
}

void AudioBufferManager::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    frames_.clear();
    frames_.shrink_to_fit();
    total_samples_ = 0;
}

double AudioBufferManager::get_duration() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<double>(total_samples_) / static_cast<double>(sample_rate_);
}

AudioBufferUsage AudioBufferManager::get_memory_usage() const {
    std::lock_guard<std::mutex> lock(mutex_);
    AudioBufferUsage usage;
    usage.frame_count = frames_.size();
    usage.total_samples = total_samples_;
    const double mb =
        static_cast<double>(total_samples_ * sizeof(float)) / (1024.0 * 1024.0);
    usage.memory_mb = std::round(mb * 100.0) / 100.0;
    return usage;
}

size_t AudioBufferManager::frame_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return frames_.size();
}

size_t AudioBufferManager::total_samples() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return total_samples_;
}

bool AudioBufferManager::empty() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return total_samples_ == 0;
}

size_t AudioBufferManager::truncation_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return truncations_;
}

}  // namespace parley
