#pragma once
#include <string>

namespace core {
struct Config {
    // Transcription
    std::string whisper_model = "small"; // or "base", or a path to a .bin/.gguf
    std::string language = "en";         // fixed target language, no detection
    int n_threads = 0;                   // 0 = auto

    // Diarization
    bool enable_diarization = true;
    std::string speaker_model = "models/speaker_embedding.onnx";
    int max_speakers = 8;
    float speaker_threshold = 0.5f; // cosine similarity to join a cluster
    int window_ms = 1500;
    int hop_ms = 750;
    int min_window_ms = 500;
    float min_rms = 0.005f;         // windows quieter than this are not embedded

    std::string log_level = "info";
};

// Reads a JSON settings file. Keys that are absent keep their defaults.
// Throws ConfigError if the file cannot be read, is not valid JSON,
// or holds a value of the wrong type or range.
Config load_config(const std::string& path);

// Process-wide configuration (defaults until set_config is called)
Config get_config();
void set_config(const Config& config);
}
