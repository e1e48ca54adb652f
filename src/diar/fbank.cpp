#include "diar/fbank.hpp"
#include <algorithm>
#include <cmath>
#include <complex>
#include <stdexcept>

namespace diar {

namespace {
constexpr double kPi = 3.14159265358979323846;
constexpr float kLogFloor = 1.1920928955078125e-07f; // FLT_EPSILON, as Kaldi

// In-place radix-2 Cooley-Tukey FFT; x.size() must be a power of two
void fft_inplace(std::vector<std::complex<float>>& x) {
    const size_t N = x.size();
    for (size_t i = 1, j = 0; i < N; ++i) {
        size_t bit = N >> 1;
        for (; j & bit; bit >>= 1) j ^= bit;
        j ^= bit;
        if (i < j) std::swap(x[i], x[j]);
    }
    for (size_t len = 2; len <= N; len <<= 1) {
        const double ang = -2.0 * kPi / static_cast<double>(len);
        const std::complex<float> wlen(static_cast<float>(std::cos(ang)), static_cast<float>(std::sin(ang)));
        for (size_t i = 0; i < N; i += len) {
            std::complex<float> w(1.0f, 0.0f);
            for (size_t k = 0; k < len / 2; ++k) {
                const std::complex<float> u = x[i + k];
                const std::complex<float> v = x[i + k + len / 2] * w;
                x[i + k] = u + v;
                x[i + k + len / 2] = u - v;
                w *= wlen;
            }
        }
    }
}
} // namespace

float FbankExtractor::mel_scale(float hz) {
    return 1127.0f * std::log(1.0f + hz / 700.0f);
}

FbankExtractor::FbankExtractor(const Config& config) : m_config(config) {
    if (m_config.frame_length <= 0 || m_config.frame_shift <= 0 || m_config.n_mels <= 0) {
        throw std::invalid_argument("fbank: frame_length, frame_shift and n_mels must be positive");
    }
    while (m_fft_size < m_config.frame_length) m_fft_size <<= 1;

    // Povey window: Hann raised to 0.85
    m_window.resize(m_config.frame_length);
    for (int i = 0; i < m_config.frame_length; ++i) {
        const double hann = 0.5 - 0.5 * std::cos(2.0 * kPi * i / (m_config.frame_length - 1));
        m_window[i] = static_cast<float>(std::pow(hann, 0.85));
    }

    const float nyquist = 0.5f * m_config.sample_rate;
    const float high = m_config.high_freq > 0.0f ? m_config.high_freq : nyquist + m_config.high_freq;
    const float mel_low = mel_scale(m_config.low_freq);
    const float mel_high = mel_scale(high);
    const float mel_delta = (mel_high - mel_low) / (m_config.n_mels + 1);

    const int n_bins = m_fft_size / 2 + 1;
    const float bin_hz = static_cast<float>(m_config.sample_rate) / m_fft_size;
    m_mel_weights.assign(static_cast<size_t>(m_config.n_mels) * n_bins, 0.0f);
    for (int m = 0; m < m_config.n_mels; ++m) {
        const float left = mel_low + m * mel_delta;
        const float center = left + mel_delta;
        const float right = center + mel_delta;
        for (int k = 0; k < n_bins; ++k) {
            const float mel = mel_scale(bin_hz * k);
            float w = 0.0f;
            if (mel > left && mel <= center) w = (mel - left) / (center - left);
            else if (mel > center && mel < right) w = (right - mel) / (right - center);
            m_mel_weights[static_cast<size_t>(m) * n_bins + k] = w;
        }
    }
}

int FbankExtractor::num_frames(size_t n) const {
    if (n < static_cast<size_t>(m_config.frame_length)) return 0;
    return 1 + static_cast<int>((n - m_config.frame_length) / m_config.frame_shift);
}

std::vector<float> FbankExtractor::compute(const float* samples, size_t n) const {
    const int frames = num_frames(n);
    if (!samples || frames <= 0) return {};

    const int len = m_config.frame_length;
    const int n_bins = m_fft_size / 2 + 1;
    const int n_mels = m_config.n_mels;
    std::vector<float> feats(static_cast<size_t>(frames) * n_mels);

    std::vector<float> frame(len);
    std::vector<std::complex<float>> spec(m_fft_size);

    for (int f = 0; f < frames; ++f) {
        const float* src = samples + static_cast<size_t>(f) * m_config.frame_shift;
        double mean = 0.0;
        for (int i = 0; i < len; ++i) {
            frame[i] = src[i] * m_config.input_scale;
            mean += frame[i];
        }
        mean /= len;
        for (int i = 0; i < len; ++i) frame[i] -= static_cast<float>(mean);

        for (int i = len - 1; i > 0; --i) frame[i] -= m_config.preemph * frame[i - 1];
        frame[0] -= m_config.preemph * frame[0];

        std::fill(spec.begin(), spec.end(), std::complex<float>(0.0f, 0.0f));
        for (int i = 0; i < len; ++i) spec[i] = frame[i] * m_window[i];
        fft_inplace(spec);

        float* row = feats.data() + static_cast<size_t>(f) * n_mels;
        for (int m = 0; m < n_mels; ++m) {
            const float* w = m_mel_weights.data() + static_cast<size_t>(m) * n_bins;
            float energy = 0.0f;
            for (int k = 0; k < n_bins; ++k) {
                if (w[k] != 0.0f) energy += w[k] * std::norm(spec[k]);
            }
            row[m] = std::log(std::max(energy, kLogFloor));
        }
    }

    if (m_config.mean_normalize) {
        for (int m = 0; m < n_mels; ++m) {
            double sum = 0.0;
            for (int f = 0; f < frames; ++f) sum += feats[static_cast<size_t>(f) * n_mels + m];
            const float mean = static_cast<float>(sum / frames);
            for (int f = 0; f < frames; ++f) feats[static_cast<size_t>(f) * n_mels + m] -= mean;
        }
    }
    return feats;
}

} // namespace diar
