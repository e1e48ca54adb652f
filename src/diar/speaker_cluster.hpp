#pragma once
#include <vector>

namespace diar {

float cosine_similarity(const std::vector<float>& a, const std::vector<float>& b);

// Groups the speaker embeddings of one recording into speakers.
//
// 1. Online pass: each embedding joins the most similar centroid, or starts
//    a new one when no centroid reaches `threshold`.
// 2. Centroids are merged pairwise (most similar first) while the pair is
//    above `threshold` or there are more than `max_speakers` clusters.
// 3. Every embedding is reassigned to its nearest final centroid.
//
// Cluster ids in the result are 0, 1, 2, ... in order of first appearance.
// Throws std::runtime_error if an embedding holds NaN or Inf.
class SpeakerClusterer {
public:
    struct Config {
        int max_speakers = 8;
        float threshold = 0.5f;  // cosine similarity
        bool verbose = false;
    };

    SpeakerClusterer() : SpeakerClusterer(Config{}) {}
    explicit SpeakerClusterer(const Config& config) : m_config(config) {}

    std::vector<int> cluster(const std::vector<std::vector<float>>& embeddings) const;

private:
    Config m_config;
};

} // namespace diar
