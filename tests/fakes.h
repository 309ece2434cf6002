/**
 * @file fakes.h
 * @brief Scriptable collaborators and helpers for controller tests
 */

#ifndef PARLEY_TESTS_FAKES_H
#define PARLEY_TESTS_FAKES_H

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "parley/features/conversation/capabilities.h"
#include "parley/features/conversation/conversation_controller.h"

namespace parley_test {

using parley::ErrorCode;

// Polls `predicate` until it holds or the timeout expires
inline bool wait_until(const std::function<bool()>& predicate,
                       std::chrono::milliseconds timeout = std::chrono::milliseconds(3000)) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (predicate()) {
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(2));
    }
    return predicate();
}

inline std::vector<float> make_frame(size_t samples, float amplitude) {
    return std::vector<float>(samples, amplitude);
}

// =============================================================================
// Capture source: frames are pushed by the test
// =============================================================================

class FakeCaptureSource : public parley::ICaptureSource {
   public:
    ErrorCode initialize() override {
        ++initialize_calls;
        return initialize_result;
    }

    ErrorCode start(parley::FrameCallback on_frame) override {
        ++start_calls;
        if (failing_starts.load() > 0) {
            --failing_starts;
            return ErrorCode::CaptureFailed;
        }
        std::lock_guard<std::mutex> lock(mutex_);
        callback_ = std::move(on_frame);
        running_ = true;
        return ErrorCode::Success;
    }

    std::vector<float> stop() override {
        ++stop_calls;
        std::lock_guard<std::mutex> lock(mutex_);
        running_ = false;
        return final_recording;
    }

    bool is_running() const override {
        std::lock_guard<std::mutex> lock(mutex_);
        return running_;
    }

    int sample_rate() const override { return rate.load(); }

    ErrorCode shutdown() override {
        ++shutdown_calls;
        return shutdown_result;
    }

    // Delivers a frame on the calling thread, like a capture thread would
    bool push(const std::vector<float>& frame) {
        parley::FrameCallback callback;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!running_ || !callback_) {
                return false;
            }
            callback = callback_;
        }
        callback(frame.data(), frame.size());
        return true;
    }

    std::atomic<int> initialize_calls{0};
    std::atomic<int> start_calls{0};
    std::atomic<int> stop_calls{0};
    std::atomic<int> shutdown_calls{0};
    std::atomic<int> failing_starts{0};
    std::atomic<int> rate{16000};
    ErrorCode initialize_result = ErrorCode::Success;
    ErrorCode shutdown_result = ErrorCode::Success;
    std::vector<float> final_recording;

   private:
    mutable std::mutex mutex_;
    parley::FrameCallback callback_;
    bool running_ = false;
};

// =============================================================================
// Transcriber
// =============================================================================

class FakeTranscriber : public parley::ITranscriber {
   public:
    ErrorCode initialize() override {
        ++initialize_calls;
        return ErrorCode::Success;
    }

    ErrorCode transcribe(const std::vector<float>& samples, int sample_rate,
                         std::string& out_text) override {
        {
            std::unique_lock<std::mutex> lock(mutex_);
            ++calls;
            last_samples = samples;
            last_sample_rate = sample_rate;
            if (block) {
                cv_.wait(lock, [this] { return cancelled_; });
                return ErrorCode::Cancelled;
            }
        }
        out_text = text;
        return result;
    }

    void cancel() override {
        ++cancel_calls;
        std::lock_guard<std::mutex> lock(mutex_);
        cancelled_ = true;
        cv_.notify_all();
    }

    ErrorCode shutdown() override {
        ++shutdown_calls;
        return shutdown_result;
    }

    std::string last_error() const override { return error_text; }

    size_t last_sample_count() {
        std::lock_guard<std::mutex> lock(mutex_);
        return last_samples.size();
    }

    std::atomic<int> initialize_calls{0};
    std::atomic<int> calls{0};
    std::atomic<int> cancel_calls{0};
    std::atomic<int> shutdown_calls{0};
    std::string text = "hello";
    ErrorCode result = ErrorCode::Success;
    ErrorCode shutdown_result = ErrorCode::Success;
    std::string error_text;
    bool block = false;
    std::vector<float> last_samples;
    int last_sample_rate = 0;

   private:
    std::mutex mutex_;
    std::condition_variable cv_;
    bool cancelled_ = false;
};

// =============================================================================
// Response generator
// =============================================================================

class FakeGenerator : public parley::IResponseGenerator {
   public:
    ErrorCode initialize(const std::string& system_prompt) override {
        ++initialize_calls;
        std::lock_guard<std::mutex> lock(mutex_);
        prompt = system_prompt;
        return initialize_result;
    }

    ErrorCode generate(const std::string& user_text, std::string& out_text) override {
        ++calls;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            last_input = user_text;
        }
        out_text = response;
        return result;
    }

    void set_system_prompt(const std::string& value) override {
        ++set_prompt_calls;
        std::lock_guard<std::mutex> lock(mutex_);
        prompt = value;
    }

    void clear_history() override { ++clear_calls; }

    ErrorCode shutdown() override {
        ++shutdown_calls;
        if (throw_on_shutdown) {
            throw std::runtime_error("generator exploded");
        }
        return shutdown_result;
    }

    std::string current_prompt() {
        std::lock_guard<std::mutex> lock(mutex_);
        return prompt;
    }

    std::string input() {
        std::lock_guard<std::mutex> lock(mutex_);
        return last_input;
    }

    std::atomic<int> initialize_calls{0};
    std::atomic<int> calls{0};
    std::atomic<int> set_prompt_calls{0};
    std::atomic<int> clear_calls{0};
    std::atomic<int> shutdown_calls{0};
    std::string response = "hi there";
    ErrorCode result = ErrorCode::Success;
    ErrorCode initialize_result = ErrorCode::Success;
    ErrorCode shutdown_result = ErrorCode::Success;
    bool throw_on_shutdown = false;

   private:
    std::mutex mutex_;
    std::string prompt;
    std::string last_input;
};

// =============================================================================
// Speaker
// =============================================================================

class FakeSpeaker : public parley::ISpeaker {
   public:
    ErrorCode initialize() override {
        ++initialize_calls;
        return ErrorCode::Success;
    }

    // With block_until_stopped the call plays "forever" until stop(). With
    // hold_start() the call waits before playback begins, and a stop() that
    // arrives in that gap is forgotten like a real player would.
    ErrorCode speak(const std::string& text) override {
        std::unique_lock<std::mutex> lock(mutex_);
        spoken.push_back(text);
        entered_ = true;
        cv_.notify_all();
        cv_.wait(lock, [this] { return !held_; });
        stopped_ = false;
        if (block_until_stopped) {
            playing_ = true;
            cv_.wait(lock, [this] { return stopped_; });
            playing_ = false;
        }
        entered_ = false;
        ++finished;
        return result;
    }

    void hold_start() {
        std::lock_guard<std::mutex> lock(mutex_);
        held_ = true;
    }

    void release_start() {
        std::lock_guard<std::mutex> lock(mutex_);
        held_ = false;
        cv_.notify_all();
    }

    bool waiting_to_start() {
        std::lock_guard<std::mutex> lock(mutex_);
        return entered_ && held_;
    }

    void stop() override {
        ++stop_calls;
        std::lock_guard<std::mutex> lock(mutex_);
        stopped_ = true;
        cv_.notify_all();
    }

    bool reports_completion() const override { return completion; }

    ErrorCode shutdown() override {
        ++shutdown_calls;
        return ErrorCode::Success;
    }

    size_t spoken_count() {
        std::lock_guard<std::mutex> lock(mutex_);
        return spoken.size();
    }

    std::vector<std::string> spoken_texts() {
        std::lock_guard<std::mutex> lock(mutex_);
        return spoken;
    }

    bool playing() {
        std::lock_guard<std::mutex> lock(mutex_);
        return playing_;
    }

    std::atomic<int> initialize_calls{0};
    std::atomic<int> stop_calls{0};
    std::atomic<int> shutdown_calls{0};
    std::atomic<int> finished{0};
    ErrorCode result = ErrorCode::Success;
    bool block_until_stopped = false;
    bool completion = true;

   private:
    std::mutex mutex_;
    std::condition_variable cv_;
    std::vector<std::string> spoken;
    bool stopped_ = false;
    bool playing_ = false;
    bool entered_ = false;
    bool held_ = false;
};

// =============================================================================
// State recorder
// =============================================================================

class StateRecorder {
   public:
    explicit StateRecorder(parley::ConversationController& controller) {
        unsubscribe_ = controller.subscribe([this](const parley::ConversationSnapshot& snapshot) {
            std::lock_guard<std::mutex> lock(mutex_);
            snapshots_.push_back(snapshot);
        });
    }

    ~StateRecorder() { unsubscribe_(); }

    std::vector<parley::ConversationSnapshot> snapshots() {
        std::lock_guard<std::mutex> lock(mutex_);
        return snapshots_;
    }

    // Distinct consecutive states in delivery order
    std::vector<parley::ConversationState> states() {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<parley::ConversationState> out;
        for (const auto& snapshot : snapshots_) {
            if (out.empty() || out.back() != snapshot.state) {
                out.push_back(snapshot.state);
            }
        }
        return out;
    }

    size_t count() {
        std::lock_guard<std::mutex> lock(mutex_);
        return snapshots_.size();
    }

    void unsubscribe() { unsubscribe_(); }

   private:
    std::mutex mutex_;
    std::vector<parley::ConversationSnapshot> snapshots_;
    parley::ConversationController::Unsubscribe unsubscribe_;
};

}  // namespace parley_test

#endif  // PARLEY_TESTS_FAKES_H
