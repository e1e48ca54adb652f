#pragma once

#include "core/transcript.hpp"

#include <map>
#include <string>

namespace core {

/**
 * @brief Aggregate figures for one speaker, computed on demand
 */
struct SpeakerStats {
    int speaker_id = -1;
    std::string name;
    int segment_count = 0;
    double total_time = 0.0;      ///< Sum of segment durations, seconds
    double avg_confidence = 0.0;  ///< 0.0 when the speaker has no segments
    int words = 0;                ///< Whitespace-separated tokens across all segments
};

/// "[MM:SS-MM:SS]", seconds truncated
std::string format_timestamp(double start_s, double end_s);

/**
 * @brief Human-readable transcript, one line per segment:
 *
 *     Speaker 1: [00:00-00:05] Hello everyone
 *     Speaker 2: [00:05-00:12] [55.0%] Hi there!
 *
 * The percentage is only printed for confidence below 0.9.
 */
std::string format_transcript(const DiarizedTranscript& transcript);

/// Stats for every id in speaker_names, including names with no segments
std::map<int, SpeakerStats> speaker_stats(const DiarizedTranscript& transcript);

int count_words(const std::string& text);

} // namespace core
