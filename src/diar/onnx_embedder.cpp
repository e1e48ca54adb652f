#include "diar/onnx_embedder.hpp"
#include "core/errors.hpp"
#include "core/logging.hpp"

#include <onnxruntime_cxx_api.h>

#include <cmath>
#include <cstdio>
#include <filesystem>
#include <stdexcept>

#ifdef _WIN32
#define NOMINMAX  // Prevent Windows.h from defining min/max macros
#include <windows.h>
#endif

namespace diar {

namespace {
FbankExtractor::Config fbank_config(int sample_rate) {
    FbankExtractor::Config c;
    c.sample_rate = sample_rate;
    c.frame_length = sample_rate / 40;  // 25ms
    c.frame_shift = sample_rate / 100;  // 10ms
    c.n_mels = 80;
    return c;
}

void l2_normalize(std::vector<float>& emb) {
    double norm = 0.0;
    for (float v : emb) norm += static_cast<double>(v) * v;
    norm = std::sqrt(norm);
    if (norm > 1e-8) {
        for (float& v : emb) v = static_cast<float>(v / norm);
    }
}
} // namespace

OnnxSpeakerEmbedder::OnnxSpeakerEmbedder(const Config& config)
    : m_config(config)
    , m_fbank(fbank_config(config.sample_rate))
{
    if (!std::filesystem::exists(m_config.model_path)) {
        throw core::ModelLoadError("speaker embedding model not found: " + m_config.model_path);
    }
    core::log_info("[onnx] loading speaker embedding model: " + m_config.model_path);

    try {
        m_env = std::make_unique<Ort::Env>(ORT_LOGGING_LEVEL_WARNING, "SpeakerEmbedding");

        Ort::SessionOptions options;
        options.SetIntraOpNumThreads(m_config.n_threads > 0 ? m_config.n_threads : 4);
        options.SetGraphOptimizationLevel(GraphOptimizationLevel::ORT_ENABLE_ALL);

#ifdef _WIN32
        // Windows: convert UTF-8 to wide string
        std::wstring wide_path;
        wide_path.resize(m_config.model_path.size() + 1);
        int len = MultiByteToWideChar(CP_UTF8, 0, m_config.model_path.c_str(),
                                       static_cast<int>(m_config.model_path.size()),
                                       &wide_path[0], static_cast<int>(wide_path.size()));
        wide_path.resize(len);
        m_session = std::make_unique<Ort::Session>(*m_env, wide_path.c_str(), options);
#else
        m_session = std::make_unique<Ort::Session>(*m_env, m_config.model_path.c_str(), options);
#endif

        Ort::AllocatorWithDefaultOptions allocator;
        if (m_session->GetInputCount() < 1 || m_session->GetOutputCount() < 1) {
            throw core::ModelLoadError("speaker embedding model has no input or output: " + m_config.model_path);
        }

        Ort::AllocatedStringPtr input_name = m_session->GetInputNameAllocated(0, allocator);
        m_input_name_strings.emplace_back(input_name.get());
        Ort::AllocatedStringPtr output_name = m_session->GetOutputNameAllocated(0, allocator);
        m_output_name_strings.emplace_back(output_name.get());
        // c_str() pointers stay valid: the string vectors are not touched again
        m_input_names.push_back(m_input_name_strings.back().c_str());
        m_output_names.push_back(m_output_name_strings.back().c_str());

        auto shape = m_session->GetOutputTypeInfo(0).GetTensorTypeAndShapeInfo().GetShape();
        if (shape.size() >= 2 && shape[1] > 0) {
            m_embedding_dim = static_cast<int>(shape[1]);  // (batch, embedding_dim)
        }

        m_memory_info = std::make_unique<Ort::MemoryInfo>(
            Ort::MemoryInfo::CreateCpu(OrtArenaAllocator, OrtMemTypeDefault));

        if (m_config.verbose) {
            fprintf(stderr, "[onnx] input=%s output=%s embedding_dim=%d\n",
                    m_input_name_strings[0].c_str(), m_output_name_strings[0].c_str(), m_embedding_dim);
        }
    } catch (const Ort::Exception& e) {
        throw core::ModelLoadError(std::string("failed to initialize ONNX speaker embedder: ") + e.what());
    }
}

OnnxSpeakerEmbedder::~OnnxSpeakerEmbedder() = default;

std::vector<float> OnnxSpeakerEmbedder::compute_embedding(const float* samples, size_t n) const {
    const int frames = m_fbank.num_frames(n);
    if (!samples || frames <= 0) {
        throw std::runtime_error("audio too short for a speaker embedding (" + std::to_string(n) + " samples)");
    }

    std::vector<float> feats = m_fbank.compute(samples, n);
    const int64_t n_mels = m_fbank.n_mels();
    std::vector<int64_t> input_shape = {1, static_cast<int64_t>(frames), n_mels};

    try {
        Ort::Value input_tensor = Ort::Value::CreateTensor<float>(
            *m_memory_info, feats.data(), feats.size(), input_shape.data(), input_shape.size());

        // Session::Run may be called concurrently
        auto outputs = m_session->Run(Ort::RunOptions{nullptr},
                                      m_input_names.data(), &input_tensor, 1,
                                      m_output_names.data(), 1);

        const float* data = outputs[0].GetTensorData<float>();
        auto shape = outputs[0].GetTensorTypeAndShapeInfo().GetShape();
        const size_t dim = shape.size() >= 2 ? static_cast<size_t>(shape[1]) : static_cast<size_t>(shape[0]);
        std::vector<float> embedding(data, data + dim);

        if (m_config.normalize_output) {
            l2_normalize(embedding);
        }
        return embedding;
    } catch (const Ort::Exception& e) {
        throw std::runtime_error(std::string("speaker embedding inference failed: ") + e.what());
    }
}

} // namespace diar
