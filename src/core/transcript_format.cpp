#include "core/transcript_format.hpp"
#include "core/transcript_builder.hpp"

#include <cstdio>
#include <sstream>

namespace core {

namespace {
constexpr float kAnnotateBelow = 0.9f;

std::string mm_ss(double t) {
    const long total = static_cast<long>(t); // truncation, as the timestamps promise
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%02ld:%02ld", total / 60, total % 60);
    return buf;
}
} // namespace

std::string format_timestamp(double start_s, double end_s) {
    return "[" + mm_ss(start_s) + "-" + mm_ss(end_s) + "]";
}

std::string format_transcript(const DiarizedTranscript& transcript) {
    std::string out;
    bool first = true;
    for (const auto& seg : transcript.segments) {
        auto it = transcript.speaker_names.find(seg.speaker_id);
        const std::string name = (it != transcript.speaker_names.end())
            ? it->second : default_speaker_name(seg.speaker_id);

        if (!first) out += '\n';
        first = false;

        out += name;
        out += ": ";
        out += format_timestamp(seg.start_time, seg.end_time);
        out += ' ';
        if (seg.confidence < kAnnotateBelow) {
            char pct[32];
            std::snprintf(pct, sizeof(pct), "[%.1f%%] ", static_cast<double>(seg.confidence) * 100.0);
            out += pct;
        }
        out += seg.text;
    }
    return out;
}

int count_words(const std::string& text) {
    std::istringstream in(text);
    std::string word;
    int n = 0;
    while (in >> word) ++n;
    return n;
}

std::map<int, SpeakerStats> speaker_stats(const DiarizedTranscript& transcript) {
    std::map<int, SpeakerStats> stats;
    for (const auto& [id, name] : transcript.speaker_names) {
        SpeakerStats s;
        s.speaker_id = id;
        s.name = name;
        stats.emplace(id, s);
    }

    std::map<int, double> confidence_sum;
    for (const auto& seg : transcript.segments) {
        auto it = stats.find(seg.speaker_id);
        if (it == stats.end()) continue; // only listed speakers are reported
        auto& s = it->second;
        s.segment_count++;
        s.total_time += seg.duration();
        s.words += count_words(seg.text);
        confidence_sum[seg.speaker_id] += seg.confidence;
    }

    for (auto& [id, s] : stats) {
        if (s.segment_count > 0) {
            s.avg_confidence = confidence_sum[id] / s.segment_count;
        }
    }
    return stats;
}

} // namespace core
