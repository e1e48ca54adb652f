#include <cassert>
#include <cmath>
#include <stdexcept>
#include <vector>
#include "diar/fbank.hpp"

static std::vector<float> tone(double hz, size_t n, int rate = 16000) {
    std::vector<float> out(n);
    for (size_t i = 0; i < n; ++i) {
        out[i] = 0.5f * static_cast<float>(std::sin(2.0 * 3.14159265358979323846 * hz * i / rate));
    }
    return out;
}

static int peak_bin(const std::vector<float>& feats, int frame, int n_mels) {
    int best = 0;
    for (int m = 1; m < n_mels; ++m) {
        if (feats[frame * n_mels + m] > feats[frame * n_mels + best]) best = m;
    }
    return best;
}

int main() {
    diar::FbankExtractor fbank;
    assert(fbank.n_mels() == 80);
    assert(fbank.num_frames(0) == 0);
    assert(fbank.num_frames(399) == 0);
    assert(fbank.num_frames(400) == 1);
    assert(fbank.num_frames(560) == 2);
    assert(fbank.num_frames(16000) == 98);

    std::vector<float> short_clip(399, 0.1f);
    assert(fbank.compute(short_clip.data(), short_clip.size()).empty());
    assert(fbank.compute(nullptr, 1000).empty());

    // Mean normalization leaves every bin centred on zero
    const auto one_second = tone(440.0, 16000);
    const auto feats = fbank.compute(one_second.data(), one_second.size());
    assert(feats.size() == 98u * 80u);
    for (float v : feats) assert(std::isfinite(v));
    for (int m = 0; m < 80; ++m) {
        double sum = 0.0;
        for (int f = 0; f < 98; ++f) sum += feats[f * 80 + m];
        assert(std::fabs(sum / 98.0) < 1e-3);
    }

    // Raw log energies: a tone lights up the filter around its frequency
    diar::FbankExtractor::Config raw_cfg;
    raw_cfg.mean_normalize = false;
    diar::FbankExtractor raw(raw_cfg);
    const auto low = raw.compute(tone(1000.0, 4000).data(), 4000);
    const auto high = raw.compute(tone(3000.0, 4000).data(), 4000);
    const int low_peak = peak_bin(low, 5, 80);
    const int high_peak = peak_bin(high, 5, 80);
    assert(low_peak >= 25 && low_peak <= 29);
    assert(high_peak > low_peak + 10);

    // Digital silence sits on the log floor
    std::vector<float> silence(800, 0.0f);
    const auto quiet = raw.compute(silence.data(), silence.size());
    const float floor_value = std::log(1.1920928955078125e-07f);
    for (float v : quiet) assert(std::fabs(v - floor_value) < 1e-4f);

    // Other rates and frame sizes
    diar::FbankExtractor::Config eight_k;
    eight_k.sample_rate = 8000;
    eight_k.frame_length = 200;
    eight_k.frame_shift = 80;
    eight_k.n_mels = 40;
    diar::FbankExtractor narrow(eight_k);
    assert(narrow.num_frames(8000) == 98);
    assert(narrow.compute(tone(500.0, 8000, 8000).data(), 8000).size() == 98u * 40u);

    diar::FbankExtractor::Config bad;
    bad.frame_shift = 0;
    bool threw = false;
    try {
        diar::FbankExtractor broken(bad);
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);
    return 0;
}
