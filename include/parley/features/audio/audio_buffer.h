/**
 * @file audio_buffer.h
 * @brief Parley - Memory-bounded audio frame accumulator
 *
 * Frames are copied on add and evicted oldest-first when either the frame
 * count cap or the total sample cap is exceeded. After every call
 * total_samples() <= max_total_samples() and frame_count() <= max_frames().
 */

#ifndef PARLEY_FEATURES_AUDIO_BUFFER_H
#define PARLEY_FEATURES_AUDIO_BUFFER_H

#include <cstddef>
#include <deque>
#include <mutex>
#include <vector>

namespace parley {

struct AudioBufferUsage {
    size_t frame_count = 0;
    size_t total_samples = 0;
    double memory_mb = 0.0;  // float32 payload, rounded to 2 decimals
};

class AudioBufferManager {
   public:
    static constexpr int kDefaultSampleRate = 16000;
    static constexpr size_t kDefaultMaxFrames = 10;
    static constexpr double kDefaultMaxSeconds = 30.0;

    explicit AudioBufferManager(int sample_rate = kDefaultSampleRate,
                                size_t max_frames = kDefaultMaxFrames,
                                double max_seconds = kDefaultMaxSeconds);

    AudioBufferManager(const AudioBufferManager&) = delete;
    AudioBufferManager& operator=(const AudioBufferManager&) = delete;

    // Copies the frame; empty frames are ignored
    void add_buffer(const float* samples, size_t count);
    void add_buffer(const std::vector<float>& frame) { add_buffer(frame.data(), frame.size()); }

    // Discards everything and stores `samples` as the only frame
    void replace(const std::vector<float>& samples);

    // All retained samples, oldest first. Never longer than max_total_samples().
    std::vector<float> get_concatenated_buffer() const;

    void clear();

    // Changes the rate used for durations and rescales the sample cap to the
    // same number of seconds; retained frames are kept and re-evicted.
    void set_sample_rate(int sample_rate);

    double get_duration() const;
    AudioBufferUsage get_memory_usage() const;

    size_t frame_count() const;
    size_t total_samples() const;
    bool empty() const;

    // Number of times a frame or a concatenation had to be tail-truncated
    size_t truncation_count() const;

    int sample_rate() const;
    size_t max_frames() const { return max_frames_; }
    size_t max_total_samples() const;

   private:
    void append_locked(const float* samples, size_t count);
    void evict_locked();

    const size_t max_frames_;
    const double max_seconds_;

    // Guarded by mutex_
    int sample_rate_;
    size_t max_total_samples_;

    mutable std::mutex mutex_;
    std::deque<std::vector<float>> frames_;
    size_t total_samples_ = 0;
    mutable size_t truncations_ = 0;
};

}  // namespace parley

#endif  // PARLEY_FEATURES_AUDIO_BUFFER_H
