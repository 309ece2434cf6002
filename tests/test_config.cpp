/**
 * @file test_config.cpp
 * @brief Tests for JSON configuration loading and validation
 */

#include <gtest/gtest.h>

#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <string>

#include "parley/config/parley_config.h"

using namespace parley;

namespace {

AppConfig parse_ok(const std::string& text) {
    AppConfig config;
    std::string error;
    EXPECT_EQ(parse_config_string(text, config, error), ErrorCode::Success) << error;
    return config;
}

}  // namespace

// =============================================================================
// PARSING
// =============================================================================

TEST(Config, EmptyObjectKeepsDefaults) {
    const AppConfig config = parse_ok("{}");
    EXPECT_EQ(config.controller.sample_rate, 16000);
    EXPECT_EQ(config.controller.max_recording_ms, 10000);
    EXPECT_EQ(config.controller.capture_start_attempts, 3);
    EXPECT_TRUE(config.controller.vad_enabled);
    EXPECT_FLOAT_EQ(config.controller.vad.energy_threshold, 0.001f);
    EXPECT_EQ(config.audio.device, "default");
    EXPECT_EQ(config.llm.provider, "openai");
    EXPECT_EQ(config.speaker.command, "espeak-ng");
    EXPECT_FALSE(config.auto_mode.enabled);
    EXPECT_EQ(config.log_level, "info");
}

TEST(Config, OverlaysGivenKeys) {
    const AppConfig config = parse_ok(R"({
        "log_level": "debug",
        "controller": { "max_recording_ms": 8000, "system_prompt": "Be terse." },
        "vad": { "enabled": false, "energy_threshold": 0.02, "silence_threshold": 0.01 },
        "audio": { "device": "hw:1,0" },
        "whisper": { "model_path": "/models/base.en.bin", "threads": 2 },
        "llm": { "provider": "anthropic", "model": "claude-x", "max_history": 6 },
        "speaker": { "args": ["-v", "{voice}"] },
        "auto_mode": { "enabled": true, "settle_delay_ms": 250 }
    })");

    EXPECT_EQ(config.log_level, "debug");
    EXPECT_EQ(config.controller.max_recording_ms, 8000);
    EXPECT_EQ(config.controller.system_prompt, "Be terse.");
    EXPECT_EQ(config.controller.sample_rate, 16000);
    EXPECT_FALSE(config.controller.vad_enabled);
    EXPECT_FLOAT_EQ(config.controller.vad.energy_threshold, 0.02f);
    EXPECT_EQ(config.audio.device, "hw:1,0");
    EXPECT_EQ(config.audio.period_frames, 1600);
    EXPECT_EQ(config.whisper.model_path, "/models/base.en.bin");
    EXPECT_EQ(config.whisper.threads, 2);
    EXPECT_EQ(config.llm.provider, "anthropic");
    EXPECT_EQ(config.llm.max_history, 6u);
    ASSERT_EQ(config.speaker.args.size(), 2u);
    EXPECT_EQ(config.speaker.args[1], "{voice}");
    EXPECT_TRUE(config.auto_mode.enabled);
    EXPECT_EQ(config.auto_mode.settle_delay_ms, 250);
}

TEST(Config, TypeMismatchNamesKeyAndLeavesOutputUnchanged) {
    AppConfig config;
    config.audio.device = "keep-me";
    std::string error;

    EXPECT_EQ(parse_config_string(R"({"audio": {"device": "x"}, "vad": {"energy_threshold": "high"}})",
                                  config, error),
              ErrorCode::ConfigParseFailed);
    EXPECT_EQ(error.rfind("vad.energy_threshold", 0), 0u) << error;
    EXPECT_EQ(config.audio.device, "keep-me");
}

TEST(Config, SectionMustBeObject) {
    AppConfig config;
    std::string error;
    EXPECT_EQ(parse_config_string(R"({"vad": 3})", config, error), ErrorCode::ConfigParseFailed);
    EXPECT_EQ(error, "vad: expected an object");

    EXPECT_EQ(parse_config_string("[]", config, error), ErrorCode::ConfigParseFailed);
    EXPECT_EQ(parse_config_string(R"({"log_level": 2})", config, error),
              ErrorCode::ConfigParseFailed);
}

TEST(Config, InvalidJson) {
    AppConfig config;
    std::string error;
    EXPECT_EQ(parse_config_string("{ not json", config, error), ErrorCode::ConfigParseFailed);
    EXPECT_EQ(error.rfind("invalid JSON", 0), 0u);
}

// =============================================================================
// FILES / ENVIRONMENT
// =============================================================================

TEST(Config, MissingFile) {
    AppConfig config;
    std::string error;
    EXPECT_EQ(load_config_file("/nonexistent/parley.json", config, error), ErrorCode::FileNotFound);
    EXPECT_FALSE(error.empty());
}

TEST(Config, LoadsFile) {
    const std::string path = testing::TempDir() + "parley_config_test.json";
    {
        std::ofstream out(path);
        out << R"({"controller": {"sample_rate": 48000}})";
    }
    AppConfig config;
    std::string error;
    ASSERT_EQ(load_config_file(path, config, error), ErrorCode::Success) << error;
    EXPECT_EQ(config.controller.sample_rate, 48000);
    std::remove(path.c_str());
}

TEST(Config, SerializationOmitsApiKey) {
    AppConfig config;
    config.llm.api_key = "sk-secret";
    config.llm.model = "gpt-test";
    const nlohmann::json json = config_to_json(config);

    EXPECT_FALSE(json.at("llm").contains("api_key"));
    EXPECT_EQ(json.at("llm").at("model").get<std::string>(), "gpt-test");

    AppConfig reparsed;
    std::string error;
    ASSERT_EQ(parse_config(json, reparsed, error), ErrorCode::Success) << error;
    EXPECT_EQ(reparsed.llm.model, "gpt-test");
    EXPECT_TRUE(reparsed.llm.api_key.empty());
}

TEST(Config, EnvironmentOverrides) {
    setenv("PARLEY_LLM_API_KEY", "env-key", 1);
    setenv("PARLEY_WHISPER_MODEL", "/env/model.bin", 1);
    setenv("PARLEY_LOG_LEVEL", "warn", 1);

    AppConfig config;
    apply_env_overrides(config);
    EXPECT_EQ(config.llm.api_key, "env-key");
    EXPECT_EQ(config.whisper.model_path, "/env/model.bin");
    EXPECT_EQ(config.log_level, "warn");

    unsetenv("PARLEY_LLM_API_KEY");
    unsetenv("PARLEY_WHISPER_MODEL");
    unsetenv("PARLEY_LOG_LEVEL");
}

// =============================================================================
// VALIDATION
// =============================================================================

TEST(Config, DefaultsAreValid) {
    std::string error = "stale";
    EXPECT_EQ(validate_config(AppConfig(), error), ErrorCode::Success);
    EXPECT_TRUE(error.empty());
}

TEST(Config, ValidationRejectsBadValues) {
    std::string error;

    AppConfig config;
    config.controller.sample_rate = 0;
    EXPECT_EQ(validate_config(config, error), ErrorCode::InvalidArgument);

    config = AppConfig();
    config.controller.capture_start_attempts = 0;
    EXPECT_EQ(validate_config(config, error), ErrorCode::InvalidArgument);

    config = AppConfig();
    config.controller.vad.silence_threshold = 0.5f;
    EXPECT_EQ(validate_config(config, error), ErrorCode::InvalidArgument);
    EXPECT_NE(error.find("silence_threshold"), std::string::npos);

    config = AppConfig();
    config.llm.provider = "mystery";
    EXPECT_EQ(validate_config(config, error), ErrorCode::InvalidArgument);

    config = AppConfig();
    config.log_level = "chatty";
    EXPECT_EQ(validate_config(config, error), ErrorCode::InvalidArgument);

    config = AppConfig();
    config.llm.provider = "google";
    EXPECT_EQ(validate_config(config, error), ErrorCode::Success);

    config = AppConfig();
    config.llm.provider = "none";
    EXPECT_EQ(validate_config(config, error), ErrorCode::Success);
}
