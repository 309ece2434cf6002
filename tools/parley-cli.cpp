// =============================================================================
// parley-cli - Interactive voice conversation host
// =============================================================================
// Microphone (ALSA) -> VAD -> whisper.cpp -> hosted chat model -> TTS command
//
// Usage: ./parley-cli [options]
//
// Options:
//   --config <file>          JSON configuration file
//   --list-devices           List available capture devices
//   --input <device>         ALSA capture device (default: "default")
//   --whisper-model <path>   whisper.cpp ggml model
//   --provider <name>        openai | anthropic | google | none (speech-only)
//   --llm-url <url>          API base URL
//   --llm-model <name>       Model name sent to the API
//   --speaker-cmd <cmd>      TTS command (default: espeak-ng)
//   --auto                   Start in auto mode (hands-free loop)
//   --max-record-ms <n>      Hard ceiling per listening turn
//   --log-level <level>      trace | debug | info | warn | error
//   --help                   Show this help message
//
// Controls (type + Enter):
//   <empty>   start listening / stop listening
//   i         interrupt speech
//   a         toggle auto mode
//   c         clear conversation history
//   q         quit
// =============================================================================

#include <poll.h>
#include <unistd.h>

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <memory>
#include <string>

#include "alsa/alsa_capture_source.h"
#include "parley/config/parley_config.h"
#include "parley/core/logger.h"
#include "parley/features/conversation/auto_mode.h"
#include "parley/features/conversation/conversation_controller.h"
#include "process/command_speaker.h"
#include "remote/remote_chat_generator.h"
#include "whispercpp/whisper_transcriber.h"

// =============================================================================
// Global State
// =============================================================================

std::atomic<bool> g_running{true};

void signal_handler(int signum) {
    (void)signum;
    g_running = false;
}

// =============================================================================
// Command Line Arguments
// =============================================================================

struct CliOptions {
    std::string config_path;
    bool list_devices = false;
    bool show_help = false;
    bool bad_args = false;

    // Overrides applied on top of the config file
    std::string input_device;
    std::string whisper_model;
    std::string provider;
    std::string llm_url;
    std::string llm_model;
    std::string speaker_cmd;
    std::string log_level;
    bool auto_mode = false;
    int max_record_ms = 0;
};

void print_usage(const char* prog_name) {
    std::cout << "parley - voice conversation host\n\n"
              << "Usage: " << prog_name << " [options]\n\n"
              << "Options:\n"
              << "  --config <file>          JSON configuration file\n"
              << "  --list-devices           List available capture devices\n"
              << "  --input <device>         ALSA capture device (default: \"default\")\n"
              << "  --whisper-model <path>   whisper.cpp ggml model\n"
              << "  --provider <name>        openai | anthropic | google | none (speech-only)\n"
              << "  --llm-url <url>          API base URL\n"
              << "  --llm-model <name>       Model name sent to the API\n"
              << "  --speaker-cmd <cmd>      TTS command (default: espeak-ng)\n"
              << "  --auto                   Start in auto mode (hands-free loop)\n"
              << "  --max-record-ms <n>      Hard ceiling per listening turn\n"
              << "  --log-level <level>      trace | debug | info | warn | error\n"
              << "  --help                   Show this help message\n\n"
              << "Controls (type + Enter):\n"
              << "  <empty>   start / stop listening\n"
              << "  i         interrupt speech\n"
              << "  a         toggle auto mode\n"
              << "  c         clear conversation history\n"
              << "  q         quit\n"
              << std::endl;
}

CliOptions parse_args(int argc, char* argv[]) {
    CliOptions options;

    for (int i = 1; i < argc; ++i) {
        const bool has_value = i + 1 < argc;
        if (strcmp(argv[i], "--config") == 0 && has_value) {
            options.config_path = argv[++i];
        } else if (strcmp(argv[i], "--list-devices") == 0) {
            options.list_devices = true;
        } else if (strcmp(argv[i], "--input") == 0 && has_value) {
            options.input_device = argv[++i];
        } else if (strcmp(argv[i], "--whisper-model") == 0 && has_value) {
            options.whisper_model = argv[++i];
        } else if (strcmp(argv[i], "--provider") == 0 && has_value) {
            options.provider = argv[++i];
        } else if (strcmp(argv[i], "--llm-url") == 0 && has_value) {
            options.llm_url = argv[++i];
        } else if (strcmp(argv[i], "--llm-model") == 0 && has_value) {
            options.llm_model = argv[++i];
        } else if (strcmp(argv[i], "--speaker-cmd") == 0 && has_value) {
            options.speaker_cmd = argv[++i];
        } else if (strcmp(argv[i], "--auto") == 0) {
            options.auto_mode = true;
        } else if (strcmp(argv[i], "--max-record-ms") == 0 && has_value) {
            options.max_record_ms = std::atoi(argv[++i]);
        } else if (strcmp(argv[i], "--log-level") == 0 && has_value) {
            options.log_level = argv[++i];
        } else if (strcmp(argv[i], "--help") == 0 || strcmp(argv[i], "-h") == 0) {
            options.show_help = true;
        } else {
            std::cerr << "Unknown or incomplete option: " << argv[i] << "\n";
            options.bad_args = true;
        }
    }

    return options;
}

void apply_cli_overrides(const CliOptions& options, parley::AppConfig& config) {
    if (!options.input_device.empty()) config.audio.device = options.input_device;
    if (!options.whisper_model.empty()) config.whisper.model_path = options.whisper_model;
    if (!options.provider.empty()) config.llm.provider = options.provider;
    if (!options.llm_url.empty()) config.llm.base_url = options.llm_url;
    if (!options.llm_model.empty()) config.llm.model = options.llm_model;
    if (!options.speaker_cmd.empty()) config.speaker.command = options.speaker_cmd;
    if (!options.log_level.empty()) config.log_level = options.log_level;
    if (options.auto_mode) config.auto_mode.enabled = true;
    if (options.max_record_ms > 0) config.controller.max_recording_ms = options.max_record_ms;
}

void list_audio_devices() {
    std::cout << "Input devices (microphones):\n";
    for (const auto& dev : parley::AlsaCaptureSource::list_devices()) {
        std::cout << "  " << dev << "\n";
    }
    std::cout << std::endl;
}

// =============================================================================
// Collaborators
// =============================================================================

std::shared_ptr<parley::IResponseGenerator> make_generator(const parley::AppConfig& config) {
    if (config.llm.provider == "none") {
        return nullptr;
    }

    parley::RemoteChatConfig remote;
    if (!parley::chat_provider_from_string(config.llm.provider, remote.provider)) {
        return nullptr;
    }
    remote.base_url = config.llm.base_url;
    remote.api_key = config.llm.api_key;
    remote.request.model = config.llm.model;
    remote.request.max_tokens = config.llm.max_tokens;
    remote.request.temperature = config.llm.temperature;
    remote.request.top_p = config.llm.top_p;
    remote.timeout_ms = config.llm.timeout_ms;
    remote.max_history = config.llm.max_history;
    return std::make_shared<parley::RemoteChatGenerator>(remote);
}

void print_snapshot(const parley::ConversationSnapshot& snapshot,
                    parley::ConversationSnapshot& last) {
    if (snapshot.state != last.state) {
        std::cout << "[" << parley::conversation_state_name(snapshot.state) << "]" << std::endl;
    }
    if (!snapshot.transcript.empty() && snapshot.transcript != last.transcript) {
        std::cout << "You: " << snapshot.transcript << std::endl;
    }
    if (!snapshot.response.empty() && snapshot.response != last.response) {
        std::cout << "Assistant: " << snapshot.response << std::endl;
    }
    if (snapshot.has_error() && snapshot.error != last.error) {
        std::cerr << "Error: " << snapshot.error << std::endl;
    }
    last = snapshot;
}

// Waits up to timeout_ms for a line on stdin
bool read_line(std::string& line, int timeout_ms) {
    struct pollfd pfd;
    pfd.fd = STDIN_FILENO;
    pfd.events = POLLIN;
    pfd.revents = 0;
    if (poll(&pfd, 1, timeout_ms) <= 0) {
        return false;
    }
    if (!std::getline(std::cin, line)) {
        g_running = false;
        return false;
    }
    return true;
}

// =============================================================================
// Main
// =============================================================================

int main(int argc, char* argv[]) {
    const CliOptions options = parse_args(argc, argv);

    if (options.show_help || options.bad_args) {
        print_usage(argv[0]);
        return options.bad_args ? 2 : 0;
    }

    if (options.list_devices) {
        list_audio_devices();
        return 0;
    }

    parley::AppConfig config;
    std::string error;
    if (!options.config_path.empty() &&
        parley::failed(parley::load_config_file(options.config_path, config, error))) {
        std::cerr << "ERROR: " << error << std::endl;
        return 1;
    }
    parley::apply_env_overrides(config);
    apply_cli_overrides(options, config);

    if (parley::failed(parley::validate_config(config, error))) {
        std::cerr << "ERROR: invalid configuration: " << error << std::endl;
        return 1;
    }

    parley::LogLevel level = parley::LogLevel::Info;
    if (parley::Logger::level_from_string(config.log_level, level)) {
        parley::Logger::instance().set_min_level(level);
    }

    signal(SIGINT, signal_handler);
    signal(SIGTERM, signal_handler);

    // Collaborators
    parley::AlsaCaptureConfig capture_config;
    capture_config.device = config.audio.device;
    capture_config.sample_rate = static_cast<uint32_t>(config.controller.sample_rate);
    capture_config.period_frames = static_cast<uint32_t>(config.audio.period_frames);
    capture_config.buffer_frames = capture_config.period_frames * 4;

    parley::WhisperTranscriberConfig whisper_config;
    whisper_config.model_path = config.whisper.model_path;
    whisper_config.language = config.whisper.language;
    whisper_config.threads = config.whisper.threads;
    whisper_config.translate = config.whisper.translate;

    parley::CommandSpeakerConfig speaker_config;
    speaker_config.command = config.speaker.command;
    speaker_config.args = config.speaker.args;
    speaker_config.voice = config.speaker.voice;
    speaker_config.rate = config.speaker.rate;
    speaker_config.pitch = config.speaker.pitch;

    parley::ConversationController controller(
        config.controller, std::make_shared<parley::AlsaCaptureSource>(capture_config),
        std::make_shared<parley::WhisperTranscriber>(whisper_config), make_generator(config),
        std::make_shared<parley::CommandSpeaker>(speaker_config));

    parley::ConversationSnapshot last_seen;
    auto unsubscribe = controller.subscribe(
        [&last_seen](const parley::ConversationSnapshot& s) { print_snapshot(s, last_seen); });

    std::cout << "========================================\n"
              << "    parley\n"
              << "========================================\n"
              << std::endl;

    if (parley::failed(controller.initialize())) {
        std::cerr << "ERROR: initialization failed: " << controller.snapshot().error << std::endl;
        unsubscribe();
        const parley::ErrorCode code = controller.dispose();
        if (parley::failed(code)) {
            std::cerr << "WARNING: " << parley::error_message(code) << std::endl;
        }
        return 1;
    }

    int exit_code = 0;
    {
        parley::AutoModeDriver auto_mode(
            controller, std::chrono::milliseconds(config.auto_mode.settle_delay_ms));
        auto_mode.set_enabled(config.auto_mode.enabled);
        if (config.auto_mode.enabled) {
            const parley::ErrorCode code = auto_mode.start_conversation();
            if (parley::failed(code)) {
                std::cerr << "ERROR: " << parley::error_message(code) << std::endl;
            }
        }

        std::cout << "Press Enter to talk, 'q' + Enter to quit.\n" << std::endl;

        std::string line;
        while (g_running) {
            if (!read_line(line, 200)) {
                continue;
            }

            parley::ErrorCode code = parley::ErrorCode::Success;
            if (line.empty()) {
                code = controller.state() == parley::ConversationState::Listening
                           ? controller.stop_listening()
                           : controller.start_listening();
            } else if (line == "i") {
                code = controller.interrupt_speech();
            } else if (line == "a") {
                const bool enable = !auto_mode.is_enabled();
                auto_mode.set_enabled(enable);
                code = enable ? auto_mode.start_conversation() : auto_mode.end_conversation();
            } else if (line == "c") {
                code = controller.clear_history();
                std::cout << "History cleared" << std::endl;
            } else if (line == "q") {
                g_running = false;
            } else {
                std::cout << "Status: " << auto_mode.status_text() << std::endl;
            }

            if (parley::failed(code)) {
                std::cerr << "! " << parley::error_message(code) << std::endl;
            }
        }
    }

    std::cout << "\nShutting down..." << std::endl;
    unsubscribe();
    const parley::ErrorCode code = controller.dispose();
    if (parley::failed(code)) {
        std::cerr << "WARNING: shutdown reported " << parley::error_message(code) << std::endl;
        exit_code = 1;
    }
    return exit_code;
}
