#include "diar/speaker_cluster.hpp"
#include <algorithm>
#include <cmath>
#include <cstdio>
#include <stdexcept>
#include <string>

namespace diar {

float cosine_similarity(const std::vector<float>& a, const std::vector<float>& b) {
    if (a.empty() || b.empty() || a.size() != b.size()) return 0.0f;
    double dot = 0.0, na = 0.0, nb = 0.0;
    for (size_t i = 0; i < a.size(); ++i) { dot += a[i]*b[i]; na += a[i]*a[i]; nb += b[i]*b[i]; }
    if (na <= 0.0 || nb <= 0.0) return 0.0f;
    return static_cast<float>(dot / (std::sqrt(na) * std::sqrt(nb) + 1e-8));
}

namespace {
struct Cluster {
    std::vector<float> sum; // cosine is scale-invariant, so the sum stands in for the mean
    int count = 0;
    bool alive = true;
};

void add_into(std::vector<float>& dst, const std::vector<float>& src) {
    if (dst.empty()) { dst = src; return; }
    for (size_t i = 0; i < dst.size() && i < src.size(); ++i) dst[i] += src[i];
}
} // namespace

std::vector<int> SpeakerClusterer::cluster(const std::vector<std::vector<float>>& embeddings) const {
    std::vector<int> labels(embeddings.size(), 0);
    if (embeddings.empty()) return labels;

    for (size_t e = 0; e < embeddings.size(); ++e) {
        for (float v : embeddings[e]) {
            if (!std::isfinite(v)) {
                throw std::runtime_error("speaker embedding " + std::to_string(e) + " has a non-finite value");
            }
        }
    }

    // Online pass
    std::vector<Cluster> clusters;
    for (const auto& emb : embeddings) {
        int best = -1;
        float best_sim = -2.0f;
        for (size_t c = 0; c < clusters.size(); ++c) {
            float sim = cosine_similarity(emb, clusters[c].sum);
            if (sim > best_sim) { best_sim = sim; best = static_cast<int>(c); }
        }
        if (best >= 0 && best_sim >= m_config.threshold) {
            add_into(clusters[best].sum, emb);
            clusters[best].count++;
        } else {
            clusters.push_back(Cluster{emb, 1, true});
        }
    }

    // Agglomerative merge of centroids
    const int max_speakers = std::max(1, m_config.max_speakers);
    int alive = static_cast<int>(clusters.size());
    while (alive > 1) {
        int bi = -1, bj = -1;
        float best_sim = -2.0f;
        for (size_t i = 0; i < clusters.size(); ++i) {
            if (!clusters[i].alive) continue;
            for (size_t j = i + 1; j < clusters.size(); ++j) {
                if (!clusters[j].alive) continue;
                float sim = cosine_similarity(clusters[i].sum, clusters[j].sum);
                if (sim > best_sim) { best_sim = sim; bi = static_cast<int>(i); bj = static_cast<int>(j); }
            }
        }
        if (bi < 0) break;
        if (best_sim < m_config.threshold && alive <= max_speakers) break;

        add_into(clusters[bi].sum, clusters[bj].sum);
        clusters[bi].count += clusters[bj].count;
        clusters[bj].alive = false;
        --alive;
        if (m_config.verbose) {
            fprintf(stderr, "[cluster] merged %d <- %d (sim=%.3f), %d clusters left\n", bi, bj, best_sim, alive);
        }
    }

    // Final nearest-centroid assignment, renumbered by first appearance
    std::vector<int> remap(clusters.size(), -1);
    int next = 0;
    for (size_t e = 0; e < embeddings.size(); ++e) {
        int best = -1;
        float best_sim = -2.0f;
        for (size_t c = 0; c < clusters.size(); ++c) {
            if (!clusters[c].alive) continue;
            float sim = cosine_similarity(embeddings[e], clusters[c].sum);
            if (sim > best_sim) { best_sim = sim; best = static_cast<int>(c); }
        }
        if (best < 0) {
            throw std::runtime_error("speaker embedding " + std::to_string(e) + " matches no cluster");
        }
        if (remap[best] < 0) remap[best] = next++;
        labels[e] = remap[best];
    }

    if (m_config.verbose) {
        fprintf(stderr, "[cluster] %zu embeddings -> %d speakers\n", embeddings.size(), next);
    }
    return labels;
}

} // namespace diar
