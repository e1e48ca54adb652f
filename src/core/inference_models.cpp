#include "core/inference_models.hpp"
#include "core/errors.hpp"
#include "core/logging.hpp"

namespace core {

InferenceModels::InferenceModels(TranscriberFactory make_transcriber, DiarizerFactory make_diarizer)
    : m_make_transcriber(std::move(make_transcriber))
    , m_make_diarizer(std::move(make_diarizer))
{
}

InferenceModels::InferenceModels(std::shared_ptr<asr::TranscriptionProvider> transcriber,
                                 std::shared_ptr<diar::DiarizationBackend> diarizer)
    : m_transcriber(std::move(transcriber))
    , m_diarizer(std::move(diarizer))
    , m_diarizer_resolved(true)
{
    if (!m_diarizer) {
        log_warn("[models] no diarization backend configured; speaker attribution disabled");
    }
}

std::shared_ptr<asr::TranscriptionProvider> InferenceModels::transcriber() {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_transcriber) return m_transcriber;
    if (!m_make_transcriber) {
        throw ModelLoadError("no transcription provider configured");
    }

    std::shared_ptr<asr::TranscriptionProvider> t;
    try {
        t = m_make_transcriber();
    } catch (const ModelLoadError&) {
        throw;
    } catch (const std::exception& e) {
        throw ModelLoadError(std::string("transcription model failed to load: ") + e.what());
    }
    if (!t) {
        throw ModelLoadError("transcription model factory returned nothing");
    }
    m_transcriber = std::move(t);
    log_info("[models] transcription model ready");
    return m_transcriber;
}

std::shared_ptr<diar::DiarizationBackend> InferenceModels::diarizer() {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_diarizer_resolved) return m_diarizer;
    m_diarizer_resolved = true;

    if (!m_make_diarizer) {
        log_warn("[models] diarization not configured; all speech will be attributed to one speaker");
        return nullptr;
    }
    try {
        m_diarizer = m_make_diarizer();
    } catch (const std::exception& e) {
        log_warn(std::string("[models] diarization model unavailable: ") + e.what());
        m_diarizer.reset();
        return nullptr;
    } catch (...) {
        log_warn("[models] diarization model unavailable: unknown error");
        m_diarizer.reset();
        return nullptr;
    }
    if (m_diarizer) {
        log_info("[models] diarization model ready");
    } else {
        log_warn("[models] diarization model unavailable");
    }
    return m_diarizer;
}

bool InferenceModels::diarization_available() {
    return diarizer() != nullptr;
}

void InferenceModels::warm_up() {
    transcriber();
    diarizer();
}

} // namespace core
