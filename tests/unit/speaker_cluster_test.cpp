#include <algorithm>
#include <cassert>
#include <cmath>
#include <limits>
#include <stdexcept>
#include <vector>
#include "diar/speaker_cluster.hpp"

static std::vector<float> around(std::vector<float> base, float jitter) {
    for (size_t i = 0; i < base.size(); ++i) base[i] += (i % 2 ? jitter : -jitter);
    return base;
}

int main() {
    using Emb = std::vector<float>;

    // Similarity helper
    assert(std::fabs(diar::cosine_similarity({1, 0}, {2, 0}) - 1.0f) < 1e-4f);
    assert(std::fabs(diar::cosine_similarity({1, 0}, {0, 1})) < 1e-6f);
    assert(diar::cosine_similarity({1, 0}, {-1, 0}) < -0.99f);
    assert(diar::cosine_similarity({}, {}) == 0.0f);
    assert(diar::cosine_similarity({1, 2}, {1, 2, 3}) == 0.0f);
    assert(diar::cosine_similarity({0, 0}, {1, 0}) == 0.0f);

    diar::SpeakerClusterer clusterer;
    assert(clusterer.cluster({}).empty());
    assert(clusterer.cluster(std::vector<Emb>{Emb{1, 0, 0}}) == std::vector<int>({0}));

    // Two well separated voices, interleaved; ids follow first appearance
    const Emb a{1, 0, 0, 0};
    const Emb b{0, 0, 1, 0};
    std::vector<Emb> two{around(b, 0.05f), around(a, 0.05f), around(b, 0.02f), around(a, 0.1f), b};
    auto labels = clusterer.cluster(two);
    assert((labels == std::vector<int>{0, 1, 0, 1, 0}));

    // Same voice with small variation stays one speaker
    std::vector<Emb> one{around(a, 0.01f), around(a, 0.05f), around(a, 0.1f), a};
    for (int l : clusterer.cluster(one)) assert(l == 0);

    // The speaker cap forces the closest clusters together
    const Emb c{0, 1, 0, 0};
    const Emb c2{0, 0.9f, 0.3f, 0};
    std::vector<Emb> three{a, c, c2, a, c};
    diar::SpeakerClusterer::Config capped;
    capped.max_speakers = 2;
    capped.threshold = 0.99f;
    auto capped_labels = diar::SpeakerClusterer(capped).cluster(three);
    int max_label = 0;
    for (int l : capped_labels) max_label = std::max(max_label, l);
    assert(max_label == 1);
    assert(capped_labels[1] == capped_labels[2]);
    assert(capped_labels[0] == capped_labels[3]);
    assert(capped_labels[0] != capped_labels[1]);

    // Without the cap a strict threshold keeps all three apart
    diar::SpeakerClusterer::Config strict;
    strict.threshold = 0.99f;
    auto strict_labels = diar::SpeakerClusterer(strict).cluster(three);
    assert((strict_labels == std::vector<int>{0, 1, 2, 0, 1}));

    // Broken embeddings are an error, not a silent label
    const float nan = std::numeric_limits<float>::quiet_NaN();
    const float inf = std::numeric_limits<float>::infinity();
    std::vector<std::vector<Emb>> broken{
        {Emb{nan, 0, 0}, Emb{nan, 0, 0}},
        {Emb{1, 0, 0}, Emb{0, nan, 1}},
        {Emb{inf, 1, 0}, Emb{1, 0, 0}},
    };
    for (const auto& input : broken) {
        bool threw = false;
        try {
            clusterer.cluster(input);
        } catch (const std::runtime_error&) {
            threw = true;
        }
        assert(threw);
    }

    // max_speakers = 1 collapses everything
    diar::SpeakerClusterer::Config single;
    single.max_speakers = 1;
    for (int l : diar::SpeakerClusterer(single).cluster(two)) assert(l == 0);
    return 0;
}
