#pragma once

#include <chrono>
#include <map>
#include <string>
#include <vector>

namespace core {

/**
 * @brief One utterance attributed to a speaker
 *
 * Produced only by the speaker matcher; never modified afterwards.
 */
struct SpeakerSegment {
    int speaker_id;             ///< 1, 2, 3, ... local to one processing call
    double start_time;          ///< Seconds from start of recording
    double end_time;            ///< Seconds, >= start_time
    std::string text;           ///< Transcribed text
    float confidence;           ///< Speaker attribution confidence in [0, 1]

    double duration() const { return end_time - start_time; }
};

/**
 * @brief Speaker-attributed transcript of one recording
 *
 * Invariant: the keys of speaker_names are exactly the speaker ids used by segments.
 */
struct DiarizedTranscript {
    std::string conversation_id = "temp";       ///< Assigned by the caller after processing
    std::vector<SpeakerSegment> segments;       ///< Ordered by start_time
    int speaker_count = 0;                      ///< Distinct speaker ids in segments
    std::map<int, std::string> speaker_names;   ///< speaker_id -> display name
    double total_duration = 0.0;                ///< Audio length in seconds
    std::chrono::system_clock::time_point created_at;

    /**
     * @brief Replace the display name of a speaker (e.g. after manual identification)
     * @throws InvalidInputError if no segment uses speaker_id
     */
    void rename_speaker(int speaker_id, const std::string& name);
};

} // namespace core
