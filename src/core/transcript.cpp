#include "core/transcript.hpp"
#include "core/errors.hpp"

namespace core {

void DiarizedTranscript::rename_speaker(int speaker_id, const std::string& name) {
    auto it = speaker_names.find(speaker_id);
    if (it == speaker_names.end()) {
        throw InvalidInputError("unknown speaker id " + std::to_string(speaker_id));
    }
    it->second = name;
}

} // namespace core
