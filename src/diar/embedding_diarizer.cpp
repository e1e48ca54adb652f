#include "diar/embedding_diarizer.hpp"
#include <cmath>
#include <cstdio>
#include <stdexcept>

namespace diar {

namespace {
float rms(const float* x, size_t n) {
    if (n == 0) return 0.0f;
    double acc = 0.0;
    for (size_t i = 0; i < n; ++i) acc += static_cast<double>(x[i]) * x[i];
    return static_cast<float>(std::sqrt(acc / n));
}
} // namespace

EmbeddingDiarizer::EmbeddingDiarizer(std::shared_ptr<const SpeakerEmbedder> embedder, const Config& config)
    : m_embedder(std::move(embedder))
    , m_config(config)
    , m_clusterer(config.clustering)
{
    if (!m_embedder) {
        throw std::invalid_argument("EmbeddingDiarizer needs a speaker embedder");
    }
    if (m_config.window_ms <= 0 || m_config.hop_ms <= 0 || m_config.hop_ms > m_config.window_ms) {
        throw std::invalid_argument("EmbeddingDiarizer: hop_ms must be in (0, window_ms]");
    }
}

std::string EmbeddingDiarizer::speaker_label(int cluster) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "SPEAKER_%02d", cluster);
    return buf;
}

std::vector<EmbeddingDiarizer::Window> EmbeddingDiarizer::plan_windows(const float* pcm, size_t samples,
                                                                        int sample_rate) const {
    const size_t win = static_cast<size_t>(sample_rate) * m_config.window_ms / 1000;
    const size_t hop = static_cast<size_t>(sample_rate) * m_config.hop_ms / 1000;
    const size_t min_win = static_cast<size_t>(sample_rate) * m_config.min_window_ms / 1000;

    std::vector<Window> windows;
    if (samples < win) {
        if (samples >= min_win && samples > 0) windows.push_back({0, samples, true});
    } else {
        size_t start = 0;
        for (; start + win <= samples; start += hop) windows.push_back({start, start + win, true});
        // Cover the tail with one window aligned to the end of the recording
        if (windows.back().end < samples) windows.push_back({samples - win, samples, true});
    }

    for (auto& w : windows) {
        w.voiced = rms(pcm + w.start, w.end - w.start) >= m_config.min_rms;
    }
    return windows;
}

std::vector<SpeakerTurn> EmbeddingDiarizer::diarize(const float* pcm, size_t samples, int sample_rate) const {
    if (sample_rate != m_embedder->sample_rate()) {
        throw std::invalid_argument("speaker embedder expects " + std::to_string(m_embedder->sample_rate()) +
                                    " Hz audio, got " + std::to_string(sample_rate));
    }
    if (!pcm || samples == 0) return {};

    const std::vector<Window> windows = plan_windows(pcm, samples, sample_rate);

    std::vector<std::vector<float>> embeddings;
    std::vector<size_t> voiced_index; // window index of each embedding
    for (size_t i = 0; i < windows.size(); ++i) {
        if (!windows[i].voiced) continue;
        embeddings.push_back(m_embedder->compute_embedding(pcm + windows[i].start, windows[i].end - windows[i].start));
        voiced_index.push_back(i);
    }
    if (m_config.verbose) {
        fprintf(stderr, "[diarizer] %zu windows, %zu voiced\n", windows.size(), embeddings.size());
    }
    if (embeddings.empty()) return {};

    const std::vector<int> clusters = m_clusterer.cluster(embeddings);
    std::vector<int> window_cluster(windows.size(), -1);
    for (size_t k = 0; k < voiced_index.size(); ++k) window_cluster[voiced_index[k]] = clusters[k];

    const double sr = static_cast<double>(sample_rate);
    auto center = [&](size_t i) { return 0.5 * (windows[i].start + windows[i].end) / sr; };
    auto region_start = [&](size_t i) { return i == 0 ? windows[0].start / sr : 0.5 * (center(i - 1) + center(i)); };
    auto region_end = [&](size_t i) {
        return i + 1 == windows.size() ? windows[i].end / sr : 0.5 * (center(i) + center(i + 1));
    };

    std::vector<SpeakerTurn> turns;
    for (size_t i = 0; i < windows.size();) {
        if (window_cluster[i] < 0) { ++i; continue; }
        size_t j = i;
        while (j + 1 < windows.size() && window_cluster[j + 1] == window_cluster[i]) ++j;
        const double t0 = region_start(i);
        const double t1 = region_end(j);
        if (t1 > t0) turns.push_back(SpeakerTurn{t0, t1, speaker_label(window_cluster[i])});
        i = j + 1;
    }
    return turns;
}

} // namespace diar
