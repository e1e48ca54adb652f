#include "audio/wav_reader.hpp"
#include "core/errors.hpp"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <cstring>
#include <fstream>

namespace audio {

namespace {
struct WavHeader {
    char riff[4];
    uint32_t chunkSize;
    char wave[4];
    char fmt[4];
    uint32_t subchunk1Size;
    uint16_t audioFormat; // 1=PCM, 3=float
    uint16_t numChannels;
    uint32_t sampleRate;
    uint32_t byteRate;
    uint16_t blockAlign;
    uint16_t bitsPerSample;
};

[[noreturn]] void fail(const std::string& path, const std::string& why) {
    throw core::InvalidInputError("cannot read WAV '" + path + "': " + why);
}
} // namespace

WavData read_wav_mono(const std::string& path) {
    std::ifstream f(path, std::ios::binary);
    if (!f) fail(path, "file not found or unreadable");
    WavHeader hdr{};
    if (!f.read(reinterpret_cast<char*>(&hdr), sizeof(hdr))) fail(path, "truncated header");
    if (std::strncmp(hdr.riff, "RIFF", 4) != 0 || std::strncmp(hdr.wave, "WAVE", 4) != 0) {
        fail(path, "not a RIFF/WAVE file");
    }
    if (std::strncmp(hdr.fmt, "fmt ", 4) != 0) fail(path, "missing fmt chunk");
    if (hdr.numChannels == 0 || hdr.sampleRate == 0) fail(path, "zero channels or sample rate");

    const bool pcm16 = hdr.audioFormat == 1 && hdr.bitsPerSample == 16;
    const bool float32 = hdr.audioFormat == 3 && hdr.bitsPerSample == 32;
    if (!pcm16 && !float32) {
        fail(path, "unsupported encoding (format " + std::to_string(hdr.audioFormat) + ", " +
                   std::to_string(hdr.bitsPerSample) + " bits); expected PCM16 or float32");
    }

    // Skip the fmt extension, then any chunks ahead of "data"
    uint32_t fmtExtra = hdr.subchunk1Size > 16 ? hdr.subchunk1Size - 16 : 0;
    if (fmtExtra) f.seekg(fmtExtra, std::ios::cur);

    char chunkId[4];
    uint32_t chunkSize = 0;
    bool found = false;
    while (f.read(chunkId, 4)) {
        if (!f.read(reinterpret_cast<char*>(&chunkSize), 4)) break;
        if (std::strncmp(chunkId, "data", 4) == 0) {
            found = true;
            break;
        }
        // chunks are word aligned
        f.seekg(chunkSize + (chunkSize & 1u), std::ios::cur);
    }
    if (!found) fail(path, "no data chunk");

    const size_t channels = hdr.numChannels;
    const size_t bytesPerSample = hdr.bitsPerSample / 8;
    const size_t frameCount = chunkSize / (bytesPerSample * channels);

    WavData out;
    out.sample_rate = static_cast<int>(hdr.sampleRate);
    out.channels = hdr.numChannels;
    out.samples.resize(frameCount);

    if (pcm16) {
        std::vector<int16_t> buf(frameCount * channels);
        if (!f.read(reinterpret_cast<char*>(buf.data()), buf.size() * sizeof(int16_t))) {
            fail(path, "truncated data chunk");
        }
        for (size_t i = 0; i < frameCount; ++i) {
            int sum = 0;
            for (size_t c = 0; c < channels; ++c) sum += buf[i * channels + c];
            out.samples[i] = static_cast<float>(sum) / static_cast<float>(channels) / 32768.0f;
        }
    } else {
        std::vector<float> buf(frameCount * channels);
        if (!f.read(reinterpret_cast<char*>(buf.data()), buf.size() * sizeof(float))) {
            fail(path, "truncated data chunk");
        }
        for (size_t i = 0; i < frameCount; ++i) {
            float sum = 0.0f;
            for (size_t c = 0; c < channels; ++c) sum += buf[i * channels + c];
            out.samples[i] = std::clamp(sum / static_cast<float>(channels), -1.0f, 1.0f);
        }
    }

    out.duration_s = static_cast<double>(frameCount) / hdr.sampleRate;
    return out;
}

std::vector<float> resample_linear(const std::vector<float>& in, int in_hz, int out_hz) {
    if (in_hz <= 0 || out_hz <= 0) {
        throw core::InvalidInputError("resample: sample rates must be positive");
    }
    if (in_hz == out_hz || in.empty()) return in;
    const double ratio = static_cast<double>(out_hz) / static_cast<double>(in_hz);
    const size_t out_len = static_cast<size_t>(std::llround(in.size() * ratio));
    std::vector<float> out(out_len);
    for (size_t i = 0; i < out_len; ++i) {
        double src_pos = i / ratio;
        size_t i0 = std::min(static_cast<size_t>(src_pos), in.size() - 1);
        size_t i1 = std::min(i0 + 1, in.size() - 1);
        double frac = src_pos - static_cast<double>(i0);
        out[i] = static_cast<float>((1.0 - frac) * in[i0] + frac * in[i1]);
    }
    return out;
}

} // namespace audio
