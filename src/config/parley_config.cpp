/**
 * @file parley_config.cpp
 * @brief Parley - Application configuration
 */

#include "parley/config/parley_config.h"

#include <cstdlib>
#include <fstream>
#include <sstream>

#include "parley/core/logger.h"

namespace parley {

using Json = nlohmann::json;

namespace {

constexpr const char* kLogCat = "Config";

// Reads optional keys of one JSON object, stopping at the first type error
class SectionReader {
   public:
    SectionReader(const Json& root, const char* section, std::string& error)
        : section_(section), error_(error) {
        if (!root.contains(section)) {
            return;
        }
        const Json& value = root.at(section);
        if (!value.is_object()) {
            fail(section, "an object");
            return;
        }
        object_ = &value;
    }

    template <typename T>
    void read(const char* key, T& out) {
        if (!ok() || object_ == nullptr || !object_->contains(key)) {
            return;
        }
        try {
            out = object_->at(key).get<T>();
        } catch (const Json::exception& e) {
            error_ = std::string(section_) + "." + key + ": " + e.what();
        }
    }

    bool ok() const { return error_.empty(); }

   private:
    void fail(const char* key, const char* expected) {
        error_ = std::string(key) + ": expected " + expected;
    }

    const char* section_;
    std::string& error_;
    const Json* object_ = nullptr;
};

std::string env_or_empty(const char* name) {
    const char* value = std::getenv(name);
    if (value && value[0] != '\0') return std::string(value);
    return "";
}

}  // namespace

// =============================================================================
// Parsing
// =============================================================================

ErrorCode parse_config(const Json& json, AppConfig& out, std::string& out_error) {
    out_error.clear();
    if (!json.is_object()) {
        out_error = "configuration root must be an object";
        return ErrorCode::ConfigParseFailed;
    }

    AppConfig config = out;
    std::string error;

    if (json.contains("log_level")) {
        if (!json.at("log_level").is_string()) {
            out_error = "log_level: expected a string";
            return ErrorCode::ConfigParseFailed;
        }
        config.log_level = json.at("log_level").get<std::string>();
    }

    SectionReader controller(json, "controller", error);
    controller.read("sample_rate", config.controller.sample_rate);
    controller.read("max_recording_ms", config.controller.max_recording_ms);
    controller.read("capture_start_attempts", config.controller.capture_start_attempts);
    controller.read("capture_retry_backoff_ms", config.controller.capture_retry_backoff_ms);
    controller.read("max_buffer_frames", config.controller.max_buffer_frames);
    controller.read("max_buffer_seconds", config.controller.max_buffer_seconds);
    controller.read("speech_ms_per_char", config.controller.speech_ms_per_char);
    controller.read("system_prompt", config.controller.system_prompt);

    SectionReader vad(json, "vad", error);
    vad.read("enabled", config.controller.vad_enabled);
    vad.read("energy_threshold", config.controller.vad.energy_threshold);
    vad.read("silence_threshold", config.controller.vad.silence_threshold);
    vad.read("min_speech_duration_sec", config.controller.vad.min_speech_duration_sec);
    vad.read("max_silence_duration_sec", config.controller.vad.max_silence_duration_sec);

    SectionReader audio(json, "audio", error);
    audio.read("device", config.audio.device);
    audio.read("period_frames", config.audio.period_frames);

    SectionReader whisper(json, "whisper", error);
    whisper.read("model_path", config.whisper.model_path);
    whisper.read("language", config.whisper.language);
    whisper.read("threads", config.whisper.threads);
    whisper.read("translate", config.whisper.translate);

    SectionReader llm(json, "llm", error);
    llm.read("provider", config.llm.provider);
    llm.read("base_url", config.llm.base_url);
    llm.read("api_key", config.llm.api_key);
    llm.read("model", config.llm.model);
    llm.read("max_tokens", config.llm.max_tokens);
    llm.read("temperature", config.llm.temperature);
    llm.read("top_p", config.llm.top_p);
    llm.read("timeout_ms", config.llm.timeout_ms);
    llm.read("max_history", config.llm.max_history);

    SectionReader speaker(json, "speaker", error);
    speaker.read("command", config.speaker.command);
    speaker.read("args", config.speaker.args);
    speaker.read("voice", config.speaker.voice);
    speaker.read("rate", config.speaker.rate);
    speaker.read("pitch", config.speaker.pitch);

    SectionReader auto_mode(json, "auto_mode", error);
    auto_mode.read("enabled", config.auto_mode.enabled);
    auto_mode.read("settle_delay_ms", config.auto_mode.settle_delay_ms);

    if (!error.empty()) {
        out_error = error;
        return ErrorCode::ConfigParseFailed;
    }

    out = std::move(config);
    return ErrorCode::Success;
}

ErrorCode parse_config_string(const std::string& text, AppConfig& out, std::string& out_error) {
    Json json;
    try {
        json = Json::parse(text);
    } catch (const Json::parse_error& e) {
        out_error = std::string("invalid JSON: ") + e.what();
        return ErrorCode::ConfigParseFailed;
    }
    return parse_config(json, out, out_error);
}

ErrorCode load_config_file(const std::string& path, AppConfig& out, std::string& out_error) {
    std::ifstream file(path);
    if (!file.is_open()) {
        out_error = "cannot open " + path;
        return ErrorCode::FileNotFound;
    }

    std::stringstream contents;
    contents << file.rdbuf();
    const ErrorCode code = parse_config_string(contents.str(), out, out_error);
    if (failed(code)) {
        PARLEY_LOG_ERROR(kLogCat, "Failed to load %s: %s", path.c_str(), out_error.c_str());
        return code;
    }

    PARLEY_LOG_INFO(kLogCat, "Loaded configuration from %s", path.c_str());
    return ErrorCode::Success;
}

// =============================================================================
// Serialization
// =============================================================================

Json config_to_json(const AppConfig& config) {
    const ControllerConfig& c = config.controller;
    return {
        {"log_level", config.log_level},
        {"controller",
         {{"sample_rate", c.sample_rate},
          {"max_recording_ms", c.max_recording_ms},
          {"capture_start_attempts", c.capture_start_attempts},
          {"capture_retry_backoff_ms", c.capture_retry_backoff_ms},
          {"max_buffer_frames", c.max_buffer_frames},
          {"max_buffer_seconds", c.max_buffer_seconds},
          {"speech_ms_per_char", c.speech_ms_per_char},
          {"system_prompt", c.system_prompt}}},
        {"vad",
         {{"enabled", c.vad_enabled},
          {"energy_threshold", c.vad.energy_threshold},
          {"silence_threshold", c.vad.silence_threshold},
          {"min_speech_duration_sec", c.vad.min_speech_duration_sec},
          {"max_silence_duration_sec", c.vad.max_silence_duration_sec}}},
        {"audio", {{"device", config.audio.device}, {"period_frames", config.audio.period_frames}}},
        {"whisper",
         {{"model_path", config.whisper.model_path},
          {"language", config.whisper.language},
          {"threads", config.whisper.threads},
          {"translate", config.whisper.translate}}},
        // api_key is never serialized
        {"llm",
         {{"provider", config.llm.provider},
          {"base_url", config.llm.base_url},
          {"model", config.llm.model},
          {"max_tokens", config.llm.max_tokens},
          {"temperature", config.llm.temperature},
          {"top_p", config.llm.top_p},
          {"timeout_ms", config.llm.timeout_ms},
          {"max_history", config.llm.max_history}}},
        {"speaker",
         {{"command", config.speaker.command},
          {"args", config.speaker.args},
          {"voice", config.speaker.voice},
          {"rate", config.speaker.rate},
          {"pitch", config.speaker.pitch}}},
        {"auto_mode",
         {{"enabled", config.auto_mode.enabled},
          {"settle_delay_ms", config.auto_mode.settle_delay_ms}}},
    };
}

void apply_env_overrides(AppConfig& config) {
    std::string value = env_or_empty("PARLEY_LLM_API_KEY");
    if (!value.empty()) config.llm.api_key = value;

    value = env_or_empty("PARLEY_WHISPER_MODEL");
    if (!value.empty()) config.whisper.model_path = value;

    value = env_or_empty("PARLEY_LOG_LEVEL");
    if (!value.empty()) config.log_level = value;
}

ErrorCode validate_config(const AppConfig& config, std::string& out_error) {
    out_error.clear();
    const ControllerConfig& c = config.controller;
    if (c.sample_rate <= 0) {
        out_error = "controller.sample_rate must be positive";
    } else if (c.max_recording_ms <= 0) {
        out_error = "controller.max_recording_ms must be positive";
    } else if (c.capture_start_attempts < 1) {
        out_error = "controller.capture_start_attempts must be at least 1";
    } else if (c.max_buffer_frames == 0 || c.max_buffer_seconds <= 0.0) {
        out_error = "controller buffer caps must be positive";
    } else if (c.vad.silence_threshold > c.vad.energy_threshold) {
        out_error = "vad.silence_threshold must not exceed vad.energy_threshold";
    } else if (config.llm.provider != "openai" && config.llm.provider != "anthropic" &&
               config.llm.provider != "google" && config.llm.provider != "none") {
        out_error = "llm.provider must be one of openai, anthropic, google, none";
    } else {
        LogLevel level;
        if (!Logger::level_from_string(config.log_level, level)) {
            out_error = "unknown log_level '" + config.log_level + "'";
        }
    }

    if (!out_error.empty()) {
        return ErrorCode::InvalidArgument;
    }
    return ErrorCode::Success;
}

}  // namespace parley
