#pragma once
#include <string>
#include <vector>

namespace audio {

struct WavData {
    std::vector<float> samples; // mono, [-1, 1]
    int sample_rate = 0;
    int channels = 0;           // channel count of the file before down-mixing
    double duration_s = 0.0;
};

// Reads a RIFF/WAVE file holding PCM16 or float32 samples and down-mixes it
// to mono by averaging channels. Throws core::InvalidInputError on failure.
WavData read_wav_mono(const std::string& path);

// Linear interpolation on sample positions
std::vector<float> resample_linear(const std::vector<float>& in, int in_hz, int out_hz);

} // namespace audio
