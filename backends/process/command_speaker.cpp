// =============================================================================
// CommandSpeaker - Implementation
// =============================================================================

#include "command_speaker.h"

#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>

#include "parley/core/logger.h"

namespace parley {

namespace {

constexpr const char* kLogCat = "Speaker";
constexpr int kExecFailedStatus = 127;

void replace_all(std::string& text, const std::string& from, const std::string& to) {
    size_t pos = 0;
    while ((pos = text.find(from, pos)) != std::string::npos) {
        text.replace(pos, from.size(), to);
        pos += to.size();
    }
}

std::string format_number(double value) {
    char buffer[32];
    snprintf(buffer, sizeof(buffer), "%g", value);
    return buffer;
}

// True when `command` names an executable, directly or through PATH
bool command_exists(const std::string& command) {
    if (command.find('/') != std::string::npos) {
        return access(command.c_str(), X_OK) == 0;
    }
    const char* path = std::getenv("PATH");
    if (!path) {
        return false;
    }
    std::string dirs(path);
    size_t begin = 0;
    while (begin <= dirs.size()) {
        size_t end = dirs.find(':', begin);
        if (end == std::string::npos) end = dirs.size();
        const std::string dir = dirs.substr(begin, end - begin);
        const std::string candidate = (dir.empty() ? "." : dir) + "/" + command;
        if (access(candidate.c_str(), X_OK) == 0) {
            return true;
        }
        begin = end + 1;
    }
    return false;
}

}  // namespace

CommandSpeaker::CommandSpeaker(const CommandSpeakerConfig& config) : config_(config) {}

CommandSpeaker::~CommandSpeaker() {
    stop();
}

void CommandSpeaker::set_error(const std::string& message) {
    PARLEY_LOG_ERROR(kLogCat, "%s", message.c_str());
    std::lock_guard<std::mutex> lock(mutex_);
    last_error_ = message;
}

std::string CommandSpeaker::last_error() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_error_;
}

ErrorCode CommandSpeaker::initialize() {
    if (config_.command.empty()) {
        set_error("No TTS command configured");
        return ErrorCode::InvalidArgument;
    }
    if (!command_exists(config_.command)) {
        set_error("TTS command not found: " + config_.command);
        return ErrorCode::FileNotFound;
    }
    PARLEY_LOG_INFO(kLogCat, "Using '%s' (voice=%s)", config_.command.c_str(),
                    config_.voice.c_str());
    return ErrorCode::Success;
}

std::vector<std::string> CommandSpeaker::build_argv(const std::string& text) const {
    std::vector<std::string> argv;
    argv.push_back(config_.command);
    for (std::string arg : config_.args) {
        replace_all(arg, "{voice}", config_.voice);
        replace_all(arg, "{rate}", format_number(config_.rate));
        replace_all(arg, "{pitch}", format_number(config_.pitch));
        argv.push_back(std::move(arg));
    }
    argv.push_back(text);
    return argv;
}

ErrorCode CommandSpeaker::speak(const std::string& text) {
    if (text.empty()) {
        return ErrorCode::Success;
    }

    const std::vector<std::string> args = build_argv(text);
    std::vector<char*> argv;
    argv.reserve(args.size() + 1);
    for (const auto& arg : args) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);

    pid_t pid;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (child_ > 0) {
            last_error_ = "Speech already in progress";
            return ErrorCode::InvalidState;
        }
        stop_requested_ = false;

        pid = fork();
        if (pid == -1) {
            last_error_ = std::string("fork failed: ") + strerror(errno);
            PARLEY_LOG_ERROR(kLogCat, "%s", last_error_.c_str());
            return ErrorCode::SpeechFailed;
        }
        if (pid == 0) {
            execvp(argv[0], argv.data());
            _exit(kExecFailedStatus);
        }
        child_ = pid;
    }

    PARLEY_LOG_DEBUG(kLogCat, "Speaking %zu chars (pid %d)", text.size(), static_cast<int>(pid));

    int status = 0;
    pid_t waited;
    do {
        waited = waitpid(pid, &status, 0);
    } while (waited == -1 && errno == EINTR);

    bool stopped;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        child_ = -1;
        stopped = stop_requested_;
        stop_requested_ = false;
    }

    if (waited == -1) {
        set_error(std::string("waitpid failed: ") + strerror(errno));
        return ErrorCode::SpeechFailed;
    }
    if (stopped) {
        PARLEY_LOG_DEBUG(kLogCat, "Playback stopped");
        return ErrorCode::Success;
    }
    if (WIFEXITED(status) && WEXITSTATUS(status) == 0) {
        return ErrorCode::Success;
    }
    if (WIFEXITED(status)) {
        const int exit_code = WEXITSTATUS(status);
        set_error(exit_code == kExecFailedStatus
                      ? "Cannot run " + config_.command
                      : config_.command + " exited with code " + std::to_string(exit_code));
    } else if (WIFSIGNALED(status)) {
        set_error(config_.command + " killed by signal " + std::to_string(WTERMSIG(status)));
    }
    return ErrorCode::SpeechFailed;
}

void CommandSpeaker::stop() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (child_ > 0) {
        stop_requested_ = true;
        if (kill(child_, SIGTERM) == -1 && errno != ESRCH) {
            PARLEY_LOG_WARNING(kLogCat, "kill(%d) failed: %s", static_cast<int>(child_),
                               strerror(errno));
        }
    }
}

ErrorCode CommandSpeaker::shutdown() {
    stop();
    return ErrorCode::Success;
}

}  // namespace parley
