#pragma once

#include "asr/transcription_provider.hpp"
#include "core/transcript.hpp"
#include "diar/diarization_backend.hpp"

#include <vector>

namespace core {

// Confidence tiers for speaker attribution. Anything below
// kDisplayConfidenceThreshold should not be shown as a reliable speaker.
constexpr float kConfidenceDiarizationUnavailable = 0.5f; ///< single speaker, no diarizer configured
constexpr float kConfidenceDiarizationFailed = 0.3f;      ///< single speaker, diarizer failed on this input
constexpr float kConfidenceNoOverlap = 0.2f;              ///< no turn overlaps this utterance
constexpr float kDisplayConfidenceThreshold = 0.6f;

constexpr int kDefaultSpeakerId = 1;

/**
 * @brief Check transcription output before it is matched
 *
 * Rejects non-finite times, negative starts, zero or negative lengths and
 * confidences outside [0, 1].
 * @throws InvalidInputError naming the offending segment index
 */
void validate_segments(const std::vector<asr::TranscriptSegment>& segments);

/**
 * @brief Attribute each transcript segment to the speaker turn it overlaps most
 *
 * Returns exactly one SpeakerSegment per input segment, in input order.
 * Turn labels are mapped to ids 1, 2, 3, ... in order of first use; the map
 * lives only for the duration of this call. On equal overlap the turn with
 * the earliest start wins (then earliest end, then label), independent of
 * the order the turns were supplied in. Turns with non-finite bounds are ignored.
 *
 * @throws InvalidInputError if validate_segments rejects the input
 */
std::vector<SpeakerSegment> match_speakers(const std::vector<asr::TranscriptSegment>& segments,
                                           const std::vector<diar::SpeakerTurn>& turns);

/**
 * @brief Degraded attribution: every segment goes to speaker 1 with a fixed confidence
 */
std::vector<SpeakerSegment> assign_single_speaker(const std::vector<asr::TranscriptSegment>& segments,
                                                  float confidence);

/// Length of the intersection of [a0, a1] and [b0, b1], 0 when disjoint
double interval_overlap(double a0, double a1, double b0, double b1);

} // namespace core
