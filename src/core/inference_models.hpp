#pragma once

#include "asr/transcription_provider.hpp"
#include "diar/diarization_backend.hpp"

#include <functional>
#include <memory>
#include <mutex>

namespace core {

/**
 * @brief Owns the heavy model handles shared by all processing calls
 *
 * Models are created on first use (or by warm_up()) under a lock and are
 * read-only afterwards. A diarizer that cannot be created is remembered as
 * unavailable for the lifetime of this object; a transcriber that cannot be
 * created raises ModelLoadError and is retried on the next request.
 */
class InferenceModels {
public:
    using TranscriberFactory = std::function<std::shared_ptr<asr::TranscriptionProvider>()>;
    using DiarizerFactory = std::function<std::shared_ptr<diar::DiarizationBackend>()>;

    /// Lazy construction. An empty diarizer factory means diarization is not configured.
    InferenceModels(TranscriberFactory make_transcriber, DiarizerFactory make_diarizer);

    /// Ready-made instances. A null diarizer means diarization is not configured.
    InferenceModels(std::shared_ptr<asr::TranscriptionProvider> transcriber,
                    std::shared_ptr<diar::DiarizationBackend> diarizer);

    InferenceModels(const InferenceModels&) = delete;
    InferenceModels& operator=(const InferenceModels&) = delete;

    std::shared_ptr<asr::TranscriptionProvider> transcriber();

    /// nullptr when diarization is unavailable
    std::shared_ptr<diar::DiarizationBackend> diarizer();

    bool diarization_available();

    /// Load both models now. Throws ModelLoadError if the transcriber fails.
    void warm_up();

private:
    std::mutex m_mutex;
    TranscriberFactory m_make_transcriber;
    DiarizerFactory m_make_diarizer;
    std::shared_ptr<asr::TranscriptionProvider> m_transcriber;
    std::shared_ptr<diar::DiarizationBackend> m_diarizer;
    bool m_diarizer_resolved = false;
};

} // namespace core
