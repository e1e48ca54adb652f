#include "core/transcript_builder.hpp"
#include "core/errors.hpp"

#include <random>
#include <set>

namespace core {

double audio_duration_s(size_t samples, int sample_rate) {
    if (sample_rate <= 0) {
        throw InvalidInputError("sample rate must be positive, got " + std::to_string(sample_rate));
    }
    return static_cast<double>(samples) / static_cast<double>(sample_rate);
}

std::string default_speaker_name(int speaker_id) {
    return "Speaker " + std::to_string(speaker_id);
}

DiarizedTranscript build_transcript(std::vector<SpeakerSegment> segments,
                                    double total_duration,
                                    const std::string& conversation_id) {
    DiarizedTranscript t;
    t.conversation_id = conversation_id;

    std::set<int> ids;
    for (const auto& s : segments) ids.insert(s.speaker_id);
    for (int id : ids) t.speaker_names.emplace(id, default_speaker_name(id));

    t.speaker_count = static_cast<int>(ids.size());
    t.segments = std::move(segments);
    t.total_duration = total_duration;
    t.created_at = std::chrono::system_clock::now();
    return t;
}

std::string generate_conversation_id() {
    static const char* kHex = "0123456789abcdef";
    thread_local std::mt19937_64 rng{std::random_device{}()};
    std::uniform_int_distribution<int> digit(0, 15);
    std::string id = "conv_";
    for (int i = 0; i < 12; ++i) id.push_back(kHex[digit(rng)]);
    return id;
}

} // namespace core
