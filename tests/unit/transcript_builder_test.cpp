#include <cassert>
#include <cctype>
#include <chrono>
#include <string>
#include <vector>
#include "core/errors.hpp"
#include "core/transcript_builder.hpp"

int main() {
    using core::SpeakerSegment;

    // Names cover exactly the ids in use, order of segments is kept
    std::vector<SpeakerSegment> segs{
        {2, 0.0, 1.0, "b first", 1.0f},
        {1, 1.0, 2.0, "a", 0.8f},
        {2, 2.0, 3.0, "b again", 0.9f},
    };
    const auto before = std::chrono::system_clock::now();
    auto t = core::build_transcript(segs, 42.5);
    assert(t.conversation_id == "temp");
    assert(t.segments.size() == 3);
    assert(t.segments[0].text == "b first" && t.segments[2].text == "b again");
    assert(t.speaker_count == 2);
    assert(t.speaker_names.size() == 2);
    assert(t.speaker_names.at(1) == "Speaker 1");
    assert(t.speaker_names.at(2) == "Speaker 2");
    assert(t.total_duration == 42.5);
    assert(t.created_at >= before - std::chrono::seconds(1));

    auto named = core::build_transcript(segs, 3.0, "meeting-7");
    assert(named.conversation_id == "meeting-7");

    // Empty input is a valid transcript with no speakers
    auto empty = core::build_transcript({}, 10.0);
    assert(empty.segments.empty());
    assert(empty.speaker_count == 0 && empty.speaker_names.empty());
    assert(empty.total_duration == 10.0);

    // Renaming
    t.rename_speaker(2, "Alice");
    assert(t.speaker_names.at(2) == "Alice");
    bool threw = false;
    try {
        t.rename_speaker(9, "Nobody");
    } catch (const core::InvalidInputError&) {
        threw = true;
    }
    assert(threw);

    // Duration helper
    assert(core::audio_duration_s(16000 * 3, 16000) == 3.0);
    assert(core::audio_duration_s(0, 16000) == 0.0);
    threw = false;
    try {
        core::audio_duration_s(100, 0);
    } catch (const core::InvalidInputError&) {
        threw = true;
    }
    assert(threw);

    // Conversation ids
    const std::string id = core::generate_conversation_id();
    assert(id.size() == 17);
    assert(id.compare(0, 5, "conv_") == 0);
    for (size_t i = 5; i < id.size(); ++i) {
        assert(std::isxdigit(static_cast<unsigned char>(id[i])));
        assert(!std::isupper(static_cast<unsigned char>(id[i])));
    }
    assert(core::generate_conversation_id() != id);

    assert(core::default_speaker_name(3) == "Speaker 3");
    return 0;
}
