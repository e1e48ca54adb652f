#pragma once

#include "core/transcript.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace core {

/// Length of a buffer in seconds. Throws InvalidInputError if sample_rate <= 0.
double audio_duration_s(size_t samples, int sample_rate);

/// "Speaker {id}"
std::string default_speaker_name(int speaker_id);

/**
 * @brief Assemble the final transcript from matched segments
 * @param segments Output of the speaker matcher, kept in order
 * @param total_duration Audio length in seconds (not derived from segments)
 * @param conversation_id Identifier; callers usually overwrite it afterwards
 */
DiarizedTranscript build_transcript(std::vector<SpeakerSegment> segments,
                                    double total_duration,
                                    const std::string& conversation_id = "temp");

/// Random id of the form "conv_" + 12 lowercase hex digits
std::string generate_conversation_id();

} // namespace core
