#include "core/speaker_matcher.hpp"
#include "core/errors.hpp"

#include <algorithm>
#include <cmath>
#include <string>
#include <unordered_map>

namespace core {

double interval_overlap(double a0, double a1, double b0, double b1) {
    return std::max(0.0, std::min(a1, b1) - std::max(a0, b0));
}

void validate_segments(const std::vector<asr::TranscriptSegment>& segments) {
    for (size_t i = 0; i < segments.size(); ++i) {
        const auto& s = segments[i];
        const std::string where = "transcript segment " + std::to_string(i);
        if (!std::isfinite(s.start_s) || !std::isfinite(s.end_s)) {
            throw InvalidInputError(where + " has a non-finite timestamp");
        }
        if (s.start_s < 0.0) {
            throw InvalidInputError(where + " starts before 0");
        }
        if (s.end_s <= s.start_s) {
            throw InvalidInputError(where + " has zero or negative length");
        }
        if (!(s.confidence >= 0.0f && s.confidence <= 1.0f)) {
            throw InvalidInputError(where + " has confidence outside [0, 1]");
        }
    }
}

std::vector<SpeakerSegment> match_speakers(const std::vector<asr::TranscriptSegment>& segments,
                                           const std::vector<diar::SpeakerTurn>& turns) {
    validate_segments(segments);

    // Visit turns in a fixed order so that equal overlaps resolve the same way
    // whatever order the backend produced them in.
    std::vector<const diar::SpeakerTurn*> ordered;
    ordered.reserve(turns.size());
    for (const auto& t : turns) {
        // A turn without finite bounds says nothing about who spoke
        if (!std::isfinite(t.start_s) || !std::isfinite(t.end_s)) continue;
        ordered.push_back(&t);
    }
    std::stable_sort(ordered.begin(), ordered.end(),
                     [](const diar::SpeakerTurn* a, const diar::SpeakerTurn* b) {
                         if (a->start_s != b->start_s) return a->start_s < b->start_s;
                         if (a->end_s != b->end_s) return a->end_s < b->end_s;
                         return a->speaker_label < b->speaker_label;
                     });

    std::unordered_map<std::string, int> label_to_id;
    int next_id = 1;

    std::vector<SpeakerSegment> out;
    out.reserve(segments.size());

    for (const auto& seg : segments) {
        const diar::SpeakerTurn* best = nullptr;
        double best_overlap = 0.0;
        for (const auto* turn : ordered) {
            double ov = interval_overlap(seg.start_s, seg.end_s, turn->start_s, turn->end_s);
            if (ov > best_overlap) {
                best_overlap = ov;
                best = turn;
            }
        }

        SpeakerSegment s{kDefaultSpeakerId, seg.start_s, seg.end_s, seg.text, kConfidenceNoOverlap};
        if (best) {
            auto it = label_to_id.find(best->speaker_label);
            if (it == label_to_id.end()) {
                it = label_to_id.emplace(best->speaker_label, next_id++).first;
            }
            s.speaker_id = it->second;
            const double coverage = best_overlap / (seg.end_s - seg.start_s);
            s.confidence = static_cast<float>(std::min(1.0, coverage));
        }
        out.push_back(std::move(s));
    }
    return out;
}

std::vector<SpeakerSegment> assign_single_speaker(const std::vector<asr::TranscriptSegment>& segments,
                                                  float confidence) {
    std::vector<SpeakerSegment> out;
    out.reserve(segments.size());
    for (const auto& seg : segments) {
        out.push_back(SpeakerSegment{kDefaultSpeakerId, seg.start_s, seg.end_s, seg.text, confidence});
    }
    return out;
}

} // namespace core
