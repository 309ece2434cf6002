#ifndef PARLEY_FEATURES_CONVERSATION_CAPABILITIES_H
#define PARLEY_FEATURES_CONVERSATION_CAPABILITIES_H

// =============================================================================
// Collaborator capabilities consumed by ConversationController
// =============================================================================
// Implementations own their own thread-safety. The controller calls each
// blocking method from its pipeline thread and may call cancel()/stop() from
// any thread to ask an in-flight call to finish early.
// =============================================================================

#include <functional>
#include <string>
#include <vector>

#include "parley/core/parley_error.h"

namespace parley {

// Speech-to-text over a complete utterance
class ITranscriber {
   public:
    virtual ~ITranscriber() = default;

    virtual ErrorCode initialize() = 0;

    // Blocks until the transcript is ready or cancel() is called
    virtual ErrorCode transcribe(const std::vector<float>& samples, int sample_rate,
                                 std::string& out_text) = 0;

    virtual void cancel() {}
    virtual ErrorCode shutdown() = 0;
    virtual std::string last_error() const { return {}; }
};

// Produces the assistant reply for one user utterance. Owns the chat history.
class IResponseGenerator {
   public:
    virtual ~IResponseGenerator() = default;

    virtual ErrorCode initialize(const std::string& system_prompt) = 0;

    virtual ErrorCode generate(const std::string& user_text, std::string& out_text) = 0;

    virtual void set_system_prompt(const std::string& prompt) = 0;

    // Keeps the system prompt, drops user/assistant turns
    virtual void clear_history() = 0;

    virtual void cancel() {}
    virtual ErrorCode shutdown() = 0;
    virtual std::string last_error() const { return {}; }
};

// Text-to-speech playback
class ISpeaker {
   public:
    virtual ~ISpeaker() = default;

    virtual ErrorCode initialize() = 0;

    // Returns when playback ends, or when stop() interrupts it. Speakers that
    // cannot observe playback end return as soon as playback has started and
    // report false from reports_completion().
    virtual ErrorCode speak(const std::string& text) = 0;

    // Safe to call when nothing is playing
    virtual void stop() = 0;

    virtual bool reports_completion() const { return true; }
    virtual ErrorCode shutdown() = 0;
    virtual std::string last_error() const { return {}; }
};

// Receives live frames on the capture thread. The pointer is only valid for
// the duration of the call.
using FrameCallback = std::function<void(const float* samples, size_t count)>;

// Microphone or any other live sample stream
class ICaptureSource {
   public:
    virtual ~ICaptureSource() = default;

    virtual ErrorCode initialize() = 0;

    virtual ErrorCode start(FrameCallback on_frame) = 0;

    // Stops delivery and returns the full recording made since start(). May
    // return an empty vector when the source does not keep one.
    virtual std::vector<float> stop() = 0;

    virtual bool is_running() const = 0;

    // Rate of the delivered frames; valid after initialize()
    virtual int sample_rate() const = 0;

    virtual ErrorCode shutdown() = 0;
    virtual std::string last_error() const { return {}; }
};

}  // namespace parley

#endif  // PARLEY_FEATURES_CONVERSATION_CAPABILITIES_H
