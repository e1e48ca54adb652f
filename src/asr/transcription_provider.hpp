#pragma once
#include <cstddef>
#include <string>
#include <vector>

namespace asr {

struct TranscriptSegment {
    double start_s{};     // >= 0
    double end_s{};       // > start_s
    std::string text;
    float confidence{1.0f}; // [0, 1]
};

/**
 * @brief Speech-to-text capability consumed by the processing core
 *
 * Implementations must be safe to call from several threads at once
 * (serializing internally if the model is not).
 */
class TranscriptionProvider {
public:
    virtual ~TranscriptionProvider() = default;

    /**
     * @brief Transcribe a whole recording
     * @param pcm Mono float samples in [-1, 1]
     * @param samples Number of samples
     * @param sample_rate Sample rate in Hz (16000 expected)
     * @return Segments ordered by start time
     * @throws std::exception on any model failure
     */
    virtual std::vector<TranscriptSegment> transcribe(const float* pcm, size_t samples,
                                                      int sample_rate) const = 0;
};

}
