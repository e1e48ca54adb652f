#pragma once

#include <cstddef>
#include <vector>

namespace diar {

/**
 * Kaldi-compatible log mel filterbank ("Fbank") features, the input expected
 * by WeSpeaker / CAM++ speaker embedding models.
 *
 * Per 25 ms frame: DC removal, pre-emphasis, Povey window, 512-point FFT,
 * power spectrum, triangular mel filters, natural log. Features are then
 * mean-normalized per bin over the utterance.
 */
class FbankExtractor {
public:
    struct Config {
        int sample_rate = 16000;
        int frame_length = 400;     // 25ms at 16kHz
        int frame_shift = 160;      // 10ms at 16kHz
        int n_mels = 80;
        float low_freq = 20.0f;
        float high_freq = 0.0f;     // <= 0: offset from Nyquist
        float preemph = 0.97f;
        float input_scale = 32768.0f; // models are trained on int16-range samples
        bool mean_normalize = true;
    };

    FbankExtractor() : FbankExtractor(Config{}) {}
    explicit FbankExtractor(const Config& config);

    /**
     * @param samples Float audio in [-1, 1]
     * @return Row-major [num_frames(n) x n_mels]; empty when n < frame_length
     */
    std::vector<float> compute(const float* samples, size_t n) const;

    int num_frames(size_t n) const;
    int n_mels() const { return m_config.n_mels; }

private:
    Config m_config;
    int m_fft_size = 512;
    std::vector<float> m_window;        // [frame_length]
    std::vector<float> m_mel_weights;   // [n_mels x (fft_size/2 + 1)]

    static float mel_scale(float hz);
};

} // namespace diar
