#pragma once
#include <cstddef>
#include <string>
#include <vector>

namespace diar {
struct SpeakerTurn {
    double start_s{};
    double end_s{};
    std::string speaker_label; // backend-internal, meaningless outside one call
};

// "Who spoke when" over a whole recording. Turns are not required to be sorted.
// May throw for inputs the backend cannot handle.
class DiarizationBackend {
public:
    virtual ~DiarizationBackend() = default;
    virtual std::vector<SpeakerTurn> diarize(const float* pcm, size_t samples, int sample_rate) const = 0;
};
}
