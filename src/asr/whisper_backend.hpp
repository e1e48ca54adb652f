#pragma once
#include "asr/transcription_provider.hpp"

#include <string>
#include <vector>

struct whisper_context;

namespace asr {

class WhisperBackend : public TranscriptionProvider {
public:
    struct Config {
        std::string model = "small";    // model name under models/, or a path to .bin/.gguf
        std::string language = "en";
        int n_threads = 0;              // 0 = hardware concurrency
        bool use_gpu = false;
    };

    // Loads the model. Throws core::ModelLoadError on failure.
    explicit WhisperBackend(const Config& config);
    ~WhisperBackend() override;

    WhisperBackend(const WhisperBackend&) = delete;
    WhisperBackend& operator=(const WhisperBackend&) = delete;

    // Each call runs on its own whisper_state, so calls may overlap.
    // Throws core::TranscriptionError if inference fails.
    std::vector<TranscriptSegment> transcribe(const float* pcm, size_t samples, int sample_rate) const override;

    // models/<name>.gguf, models/ggml-<name>-q5_1.gguf, models/ggml-<name>.bin, ...
    static std::string resolve_model_path(const std::string& model_name);

private:
    Config m_config;
    whisper_context* m_ctx = nullptr;
};
}
