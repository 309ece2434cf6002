#ifndef PARLEY_BACKENDS_COMMAND_SPEAKER_H
#define PARLEY_BACKENDS_COMMAND_SPEAKER_H

// =============================================================================
// CommandSpeaker - speech through an external TTS program
// =============================================================================
// Runs `command args... <text>` (espeak-ng, piper wrappers, say, ...) and
// waits for it to exit, which gives a real playback-complete signal.
// Arguments may contain {voice}, {rate} and {pitch} placeholders.
// =============================================================================

#include <sys/types.h>

#include <mutex>
#include <string>
#include <vector>

#include "parley/features/conversation/capabilities.h"

namespace parley {

struct CommandSpeakerConfig {
    std::string command = "espeak-ng";
    std::vector<std::string> args;
    std::string voice = "en-US";
    double rate = 0.5;   // 0..1, host-defined scale
    double pitch = 1.0;
};

class CommandSpeaker : public ISpeaker {
   public:
    explicit CommandSpeaker(const CommandSpeakerConfig& config);
    ~CommandSpeaker() override;

    CommandSpeaker(const CommandSpeaker&) = delete;
    CommandSpeaker& operator=(const CommandSpeaker&) = delete;

    ErrorCode initialize() override;
    ErrorCode speak(const std::string& text) override;
    void stop() override;
    bool reports_completion() const override { return true; }
    ErrorCode shutdown() override;
    std::string last_error() const override;

    // Final argv for `text`, placeholders expanded
    std::vector<std::string> build_argv(const std::string& text) const;

   private:
    void set_error(const std::string& message);

    CommandSpeakerConfig config_;

    mutable std::mutex mutex_;
    pid_t child_ = -1;
    bool stop_requested_ = false;
    std::string last_error_;
};

}  // namespace parley

#endif  // PARLEY_BACKENDS_COMMAND_SPEAKER_H
