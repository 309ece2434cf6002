/**
 * @file parley_config.h
 * @brief Parley - Application configuration
 *
 * JSON file layout (every key optional, missing keys keep their defaults):
 *
 *   {
 *     "log_level": "info",
 *     "controller": { "sample_rate": 16000, "max_recording_ms": 10000, ... },
 *     "vad":        { "enabled": true, "energy_threshold": 0.001, ... },
 *     "audio":      { "device": "default", "period_frames": 1600 },
 *     "whisper":    { "model_path": "...", "language": "en", "threads": 4 },
 *     "llm":        { "provider": "openai", "base_url": "...", "model": "...", ... },
 *     "speaker":    { "command": "espeak-ng", "args": [], "voice": "en-US", ... },
 *     "auto_mode":  { "enabled": false, "settle_delay_ms": 1000 }
 *   }
 *
 * Environment overrides applied by apply_env_overrides():
 *   PARLEY_LLM_API_KEY, PARLEY_WHISPER_MODEL, PARLEY_LOG_LEVEL
 */

#ifndef PARLEY_CONFIG_PARLEY_CONFIG_H
#define PARLEY_CONFIG_PARLEY_CONFIG_H

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

#include "parley/core/parley_error.h"
#include "parley/features/conversation/conversation_controller.h"

namespace parley {

struct AudioInputConfig {
    std::string device = "default";
    int period_frames = 1600;  // 100 ms at 16 kHz
};

struct WhisperConfig {
    std::string model_path;
    std::string language = "en";
    int threads = 4;
    bool translate = false;
};

struct LlmConfig {
    std::string provider = "openai";  // "openai", "anthropic", "google" or "none"
    std::string base_url;             // empty selects the provider default
    std::string api_key;
    std::string model = "gpt-4o-mini";
    int max_tokens = 256;
    double temperature = 0.7;
    double top_p = 0.9;
    int timeout_ms = 30000;
    size_t max_history = 10;
};

struct SpeakerConfig {
    std::string command = "espeak-ng";
    std::vector<std::string> args;
    std::string voice = "en-US";
    double rate = 0.5;
    double pitch = 1.0;
};

struct AutoModeConfig {
    bool enabled = false;
    int settle_delay_ms = 1000;
};

struct AppConfig {
    ControllerConfig controller;
    AudioInputConfig audio;
    WhisperConfig whisper;
    LlmConfig llm;
    SpeakerConfig speaker;
    AutoModeConfig auto_mode;
    std::string log_level = "info";
};

// Overlays `json` onto `out`. On a type mismatch returns ConfigParseFailed and
// names the offending key in out_error; `out` is left unchanged.
ErrorCode parse_config(const nlohmann::json& json, AppConfig& out, std::string& out_error);

// Same, from JSON text
ErrorCode parse_config_string(const std::string& text, AppConfig& out, std::string& out_error);

ErrorCode load_config_file(const std::string& path, AppConfig& out, std::string& out_error);

nlohmann::json config_to_json(const AppConfig& config);

void apply_env_overrides(AppConfig& config);

// Cross-field checks (thresholds, rates, provider name)
ErrorCode validate_config(const AppConfig& config, std::string& out_error);

}  // namespace parley

#endif  // PARLEY_CONFIG_PARLEY_CONFIG_H
