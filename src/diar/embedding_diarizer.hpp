#pragma once

#include "diar/diarization_backend.hpp"
#include "diar/speaker_cluster.hpp"
#include "diar/speaker_embedder.hpp"

#include <memory>
#include <string>
#include <vector>

namespace diar {

/**
 * Whole-recording diarization from speaker embeddings.
 *
 * The recording is cut into overlapping windows (window_ms long, every
 * hop_ms). Each window loud enough to contain speech is embedded; all
 * embeddings are clustered; runs of consecutive windows with the same
 * cluster become one SpeakerTurn. Each window owns the time between the
 * midpoints to its neighbours' centres, so turns never overlap.
 */
class EmbeddingDiarizer : public DiarizationBackend {
public:
    struct Config {
        int window_ms = 1500;
        int hop_ms = 750;
        int min_window_ms = 500;   // shorter recordings produce no turns
        float min_rms = 0.005f;    // quieter windows are treated as silence
        SpeakerClusterer::Config clustering;
        bool verbose = false;
    };

    EmbeddingDiarizer(std::shared_ptr<const SpeakerEmbedder> embedder, const Config& config);

    /// @throws std::invalid_argument if sample_rate differs from the embedder's
    std::vector<SpeakerTurn> diarize(const float* pcm, size_t samples, int sample_rate) const override;

    static std::string speaker_label(int cluster);

private:
    struct Window {
        size_t start;
        size_t end;
        bool voiced;
    };

    std::vector<Window> plan_windows(const float* pcm, size_t samples, int sample_rate) const;

    std::shared_ptr<const SpeakerEmbedder> m_embedder;
    Config m_config;
    SpeakerClusterer m_clusterer;
};

} // namespace diar
