#pragma once

#include "diar/fbank.hpp"
#include "diar/speaker_embedder.hpp"

#include <vector>
#include <string>
#include <memory>

// Forward declarations to avoid including onnxruntime headers here
namespace Ort {
    struct Env;
    struct Session;
    struct MemoryInfo;
}

namespace diar {

/**
 * ONNX-based neural speaker embedding extractor.
 * Runs Fbank-input models such as WeSpeaker ResNet34 or CAM++
 * (input [1, frames, 80], output [1, dim]).
 */
class OnnxSpeakerEmbedder : public SpeakerEmbedder {
public:
    struct Config {
        std::string model_path = "models/speaker_embedding.onnx";
        int sample_rate = 16000;
        int n_threads = 4;
        bool normalize_output = true;       // L2-normalize embeddings
        bool verbose = false;
    };

    /// @throws core::ModelLoadError if the model cannot be loaded
    explicit OnnxSpeakerEmbedder(const Config& config);
    ~OnnxSpeakerEmbedder() override;

    // Disable copy/move (ONNX session is non-copyable)
    OnnxSpeakerEmbedder(const OnnxSpeakerEmbedder&) = delete;
    OnnxSpeakerEmbedder& operator=(const OnnxSpeakerEmbedder&) = delete;

    /**
     * Extract a speaker embedding.
     * @throws std::runtime_error if the audio is too short for one Fbank frame or inference fails
     */
    std::vector<float> compute_embedding(const float* samples, size_t n) const override;

    int embedding_dim() const override { return m_embedding_dim; }
    int sample_rate() const override { return m_config.sample_rate; }

private:
    Config m_config;
    FbankExtractor m_fbank;

    std::unique_ptr<Ort::Env> m_env;
    std::unique_ptr<Ort::Session> m_session;
    std::unique_ptr<Ort::MemoryInfo> m_memory_info;

    std::vector<std::string> m_input_name_strings;
    std::vector<std::string> m_output_name_strings;
    std::vector<const char*> m_input_names;
    std::vector<const char*> m_output_names;
    int m_embedding_dim = 192;  // Default for ECAPA-TDNN
};

} // namespace diar
