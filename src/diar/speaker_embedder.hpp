#pragma once

#include <cstddef>
#include <vector>

namespace diar {

/**
 * Maps a short stretch of audio to a fixed-size vector that captures voice
 * characteristics (not content). Implementations must allow concurrent
 * compute_embedding() calls.
 */
class SpeakerEmbedder {
public:
    virtual ~SpeakerEmbedder() = default;

    /**
     * @param samples Float audio in [-1, 1] at sample_rate()
     * @param n Number of samples
     * @throws std::exception if inference fails
     */
    virtual std::vector<float> compute_embedding(const float* samples, size_t n) const = 0;

    virtual int embedding_dim() const = 0;
    virtual int sample_rate() const = 0;
};

} // namespace diar
