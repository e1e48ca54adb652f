#include "core/transcript_json.hpp"
#include "core/errors.hpp"

#include <ctime>
#include <iomanip>
#include <set>
#include <string>
#include <sstream>

namespace core {

namespace {
std::tm to_utc_tm(std::time_t t) {
    std::tm out{};
#if defined(_WIN32)
    gmtime_s(&out, &t);
#else
    gmtime_r(&t, &out);
#endif
    return out;
}

std::time_t utc_tm_to_time(std::tm& tm) {
#if defined(_WIN32)
    return _mkgmtime(&tm);
#else
    return timegm(&tm);
#endif
}

int parse_speaker_key(const std::string& key) {
    size_t pos = 0;
    int id = 0;
    try {
        id = std::stoi(key, &pos);
    } catch (const std::exception&) {
        throw InvalidInputError("speaker_names key is not an integer: " + key);
    }
    if (pos != key.size()) {
        throw InvalidInputError("speaker_names key is not an integer: " + key);
    }
    return id;
}
} // namespace

std::string format_iso8601(std::chrono::system_clock::time_point tp) {
    std::tm tm = to_utc_tm(std::chrono::system_clock::to_time_t(tp));
    std::ostringstream os;
    os << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    return os.str();
}

std::chrono::system_clock::time_point parse_iso8601(const std::string& s) {
    std::tm tm{};
    std::istringstream in(s);
    in >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
    if (in.fail()) {
        throw InvalidInputError("bad timestamp: " + s);
    }
    return std::chrono::system_clock::from_time_t(utc_tm_to_time(tm));
}

nlohmann::json to_json(const DiarizedTranscript& transcript) {
    nlohmann::json segments = nlohmann::json::array();
    for (const auto& s : transcript.segments) {
        segments.push_back({
            {"speaker_id", s.speaker_id},
            {"start_time", s.start_time},
            {"end_time", s.end_time},
            {"text", s.text},
            {"confidence", s.confidence},
        });
    }

    nlohmann::json names = nlohmann::json::object();
    for (const auto& [id, name] : transcript.speaker_names) {
        names[std::to_string(id)] = name;
    }

    return {
        {"conversation_id", transcript.conversation_id},
        {"segments", segments},
        {"speaker_count", transcript.speaker_count},
        {"speaker_names", names},
        {"total_duration", transcript.total_duration},
        {"created_at", format_iso8601(transcript.created_at)},
    };
}

nlohmann::json stats_to_json(const std::map<int, SpeakerStats>& stats) {
    nlohmann::json j = nlohmann::json::object();
    for (const auto& [id, s] : stats) {
        j[std::to_string(id)] = {
            {"name", s.name},
            {"segment_count", s.segment_count},
            {"total_time", s.total_time},
            {"avg_confidence", s.avg_confidence},
            {"words", s.words},
        };
    }
    return j;
}

nlohmann::json build_report(const DiarizedTranscript& transcript) {
    nlohmann::json j = to_json(transcript);
    j["formatted_transcript"] = format_transcript(transcript);
    j["speaker_stats"] = stats_to_json(speaker_stats(transcript));
    return j;
}

DiarizedTranscript transcript_from_json(const nlohmann::json& j) {
    DiarizedTranscript t;
    try {
        t.conversation_id = j.at("conversation_id").get<std::string>();
        t.total_duration = j.at("total_duration").get<double>();
        t.created_at = parse_iso8601(j.at("created_at").get<std::string>());

        for (const auto& s : j.at("segments")) {
            SpeakerSegment seg{
                s.at("speaker_id").get<int>(),
                s.at("start_time").get<double>(),
                s.at("end_time").get<double>(),
                s.at("text").get<std::string>(),
                s.at("confidence").get<float>(),
            };
            if (seg.end_time < seg.start_time) {
                throw InvalidInputError("segment ends before it starts");
            }
            if (seg.speaker_id < 1) {
                throw InvalidInputError("segment speaker_id must be >= 1, got " + std::to_string(seg.speaker_id));
            }
            if (!(seg.confidence >= 0.0f && seg.confidence <= 1.0f)) {
                throw InvalidInputError("segment confidence outside [0, 1]");
            }
            t.segments.push_back(std::move(seg));
        }
        for (const auto& [key, value] : j.at("speaker_names").items()) {
            t.speaker_names[parse_speaker_key(key)] = value.get<std::string>();
        }
    } catch (const nlohmann::json::exception& e) {
        throw InvalidInputError(std::string("malformed transcript document: ") + e.what());
    }

    std::set<int> ids;
    for (const auto& s : t.segments) ids.insert(s.speaker_id);
    std::set<int> named;
    for (const auto& kv : t.speaker_names) named.insert(kv.first);
    if (ids != named) {
        throw InvalidInputError("speaker_names does not match the speakers in segments");
    }
    t.speaker_count = static_cast<int>(ids.size());
    return t;
}

} // namespace core
