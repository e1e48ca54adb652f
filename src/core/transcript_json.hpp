#pragma once

#include "core/transcript.hpp"
#include "core/transcript_format.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <map>
#include <string>

namespace core {

/// UTC, "YYYY-MM-DDTHH:MM:SSZ"
std::string format_iso8601(std::chrono::system_clock::time_point tp);
std::chrono::system_clock::time_point parse_iso8601(const std::string& s);

nlohmann::json to_json(const DiarizedTranscript& transcript);

/// Keys are the decimal speaker ids ("1", "2", ...)
nlohmann::json stats_to_json(const std::map<int, SpeakerStats>& stats);

/// Transcript plus "formatted_transcript" and "speaker_stats"
nlohmann::json build_report(const DiarizedTranscript& transcript);

/// Reload a transcript written by to_json. Throws InvalidInputError on malformed input.
DiarizedTranscript transcript_from_json(const nlohmann::json& j);

} // namespace core
