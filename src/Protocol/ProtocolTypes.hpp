#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

enum class Mode {
    Transcribe,
    Edit
};

const char* ModeToString(Mode mode);
// Returns false and leaves `mode` untouched for unknown names.
bool ModeFromString(const std::string& name, Mode& mode);

// 16-bit little-endian mono PCM.
constexpr unsigned int PCM_BYTES_PER_SAMPLE = 2;
constexpr unsigned int DEFAULT_SAMPLE_RATE = 16000;

struct AudioFrame {
    std::vector<uint8_t> data;
    unsigned int sampleRate = DEFAULT_SAMPLE_RATE;
};

struct ModelSettings {
    std::optional<std::string> asrModel;
    std::optional<std::string> asrProvider;
    std::optional<std::string> asrPrompt;
    std::optional<double> noSpeechThreshold;
    std::optional<std::string> llmProvider;
    std::optional<std::string> llmModel;
    std::optional<double> llmTemperature;
    std::optional<std::string> transcriptionPrompt;
    std::optional<std::string> editingPrompt;
};

// Carries the mode and nothing else so the remote side merges it onto the
// context it already holds.
struct ModeUpdate {
    Mode mode = Mode::Transcribe;
};

struct ConfigSnapshot {
    std::string windowTitle;
    std::string appName;
    std::string selectedText;
    std::vector<std::string> vocabulary;
    ModelSettings modelSettings;
};

using ControlMessage = std::variant<ModeUpdate, ConfigSnapshot>;
using OutboundItem = std::variant<AudioFrame, ControlMessage>;

struct TranscriptError {
    std::string code;
    std::string message;
};

struct TranscriptResponse {
    std::string transcript;
    std::optional<TranscriptError> error;
};

struct TranscriptResult {
    TranscriptResponse response;
    std::vector<uint8_t> audio;
    unsigned int sampleRate = DEFAULT_SAMPLE_RATE;
};
