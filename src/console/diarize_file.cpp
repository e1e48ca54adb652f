// Batch console: transcribe a WAV file and attribute each utterance to a speaker
#include "asr/whisper_backend.hpp"
#include "audio/wav_reader.hpp"
#include "core/config.hpp"
#include "core/errors.hpp"
#include "core/inference_models.hpp"
#include "core/logging.hpp"
#include "core/transcript_builder.hpp"
#include "core/transcript_format.hpp"
#include "core/transcript_json.hpp"
#include "core/transcription_controller.hpp"
#include "diar/embedding_diarizer.hpp"
#include "diar/onnx_embedder.hpp"

#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <memory>
#include <string>

namespace {

constexpr int kTargetSampleRate = 16000;

void print_usage(const char* argv0) {
    std::cerr << "usage: " << argv0 << " <audio.wav> [--config settings.json] [--model NAME]\n"
              << "       [--speaker-model PATH] [--no-diarization] [--threads N]\n"
              << "       [--conversation-id ID] [--json out.json] [--verbose]\n";
}

const char* attribution_name(core::SpeakerAttribution a) {
    switch (a) {
    case core::SpeakerAttribution::Diarized: return "diarized";
    case core::SpeakerAttribution::Unavailable: return "diarization unavailable";
    case core::SpeakerAttribution::Failed: return "diarization failed";
    }
    return "?";
}

// Built from the process-wide settings installed by main()
std::shared_ptr<core::InferenceModels> make_models(bool verbose) {
    const core::Config cfg = core::get_config();
    core::InferenceModels::TranscriberFactory make_transcriber = [cfg]() {
        asr::WhisperBackend::Config wc;
        wc.model = cfg.whisper_model;
        wc.language = cfg.language;
        wc.n_threads = cfg.n_threads;
        return std::make_shared<asr::WhisperBackend>(wc);
    };

    core::InferenceModels::DiarizerFactory make_diarizer;
    if (cfg.enable_diarization) {
        make_diarizer = [cfg, verbose]() {
            diar::OnnxSpeakerEmbedder::Config ec;
            ec.model_path = cfg.speaker_model;
            ec.sample_rate = kTargetSampleRate;
            if (cfg.n_threads > 0) ec.n_threads = cfg.n_threads;
            ec.verbose = verbose;
            auto embedder = std::make_shared<diar::OnnxSpeakerEmbedder>(ec);

            diar::EmbeddingDiarizer::Config dc;
            dc.window_ms = cfg.window_ms;
            dc.hop_ms = cfg.hop_ms;
            dc.min_window_ms = cfg.min_window_ms;
            dc.min_rms = cfg.min_rms;
            dc.clustering.max_speakers = cfg.max_speakers;
            dc.clustering.threshold = cfg.speaker_threshold;
            dc.clustering.verbose = verbose;
            dc.verbose = verbose;
            return std::make_shared<diar::EmbeddingDiarizer>(embedder, dc);
        };
    }
    return std::make_shared<core::InferenceModels>(make_transcriber, make_diarizer);
}

} // namespace

int main(int argc, char** argv) {
    std::string wav_path;
    std::string config_path;
    std::string model_arg;
    std::string speaker_model_arg;
    std::string conversation_id;
    std::string json_path;
    bool no_diar = false;
    bool verbose = false;
    int user_threads = -1;

    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];
        if (a == "-v" || a == "--verbose") { verbose = true; continue; }
        if (a == "-h" || a == "--help") { print_usage(argv[0]); return 0; }
        if (a == "--config" && i + 1 < argc) { config_path = argv[++i]; continue; }
        if (a == "--model" && i + 1 < argc) { model_arg = argv[++i]; continue; }
        if (a == "--speaker-model" && i + 1 < argc) { speaker_model_arg = argv[++i]; continue; }
        if (a == "--no-diarization") { no_diar = true; continue; }
        if (a == "--threads" && i + 1 < argc) { user_threads = std::atoi(argv[++i]); continue; }
        if (a == "--conversation-id" && i + 1 < argc) { conversation_id = argv[++i]; continue; }
        if (a == "--json" && i + 1 < argc) { json_path = argv[++i]; continue; }
        if (!a.empty() && a[0] == '-') {
            std::cerr << "unknown or incomplete option: " << a << "\n";
            print_usage(argv[0]);
            return 1;
        }
        if (!wav_path.empty()) {
            std::cerr << "only one input file is accepted\n";
            print_usage(argv[0]);
            return 1;
        }
        wav_path = a;
    }
    if (wav_path.empty()) {
        print_usage(argv[0]);
        return 1;
    }

    core::Config cfg;
    try {
        if (!config_path.empty()) cfg = core::load_config(config_path);
    } catch (const core::ConfigError& e) {
        std::cerr << "[config] " << e.what() << "\n";
        return 1;
    }
    if (!model_arg.empty()) cfg.whisper_model = model_arg;
    if (!speaker_model_arg.empty()) cfg.speaker_model = speaker_model_arg;
    if (no_diar) cfg.enable_diarization = false;
    if (user_threads >= 0) cfg.n_threads = user_threads;
    if (verbose) cfg.log_level = "debug";
    core::set_config(cfg);

    core::LogLevel level = core::LogLevel::Info;
    if (!core::parse_log_level(cfg.log_level, level)) {
        std::cerr << "[config] unknown log_level: " << cfg.log_level << "\n";
        return 1;
    }
    core::set_log_level(level);

    audio::WavData wav;
    std::vector<float> pcm;
    try {
        wav = audio::read_wav_mono(wav_path);
        core::log_info("[input] " + wav_path + ": " + std::to_string(wav.sample_rate) + " Hz, " +
                       std::to_string(wav.channels) + " ch, " + std::to_string(wav.duration_s) + " s");
        pcm = audio::resample_linear(wav.samples, wav.sample_rate, kTargetSampleRate);
    } catch (const core::InvalidInputError& e) {
        std::cerr << "[input] " << e.what() << "\n";
        return 1;
    }

    auto models = make_models(verbose);
    try {
        models->warm_up();
    } catch (const core::ModelLoadError& e) {
        std::cerr << "[whisper] " << e.what() << "\n";
        return 2;
    }
    if (!models->diarization_available()) {
        core::log_warn("[diar] speaker diarization unavailable, attributing everything to one speaker");
    }

    core::TranscriptionController controller(models);
    core::DiarizedTranscript transcript;
    try {
        transcript = controller.process(pcm, kTargetSampleRate);
    } catch (const core::InvalidInputError& e) {
        std::cerr << "[input] " << e.what() << "\n";
        return 1;
    } catch (const core::TranscriptionError& e) {
        std::cerr << "[whisper] " << e.what() << "\n";
        return 2;
    }
    transcript.conversation_id = conversation_id.empty() ? core::generate_conversation_id() : conversation_id;

    std::cout << core::format_transcript(transcript) << "\n\n";
    std::cout << "Speakers (" << transcript.speaker_count << "):\n";
    for (const auto& kv : core::speaker_stats(transcript)) {
        const core::SpeakerStats& s = kv.second;
        char line[256];
        std::snprintf(line, sizeof(line), "  %-12s %3d segments  %7.1fs  %5d words  confidence %.2f",
                      s.name.c_str(), s.segment_count, s.total_time, s.words, s.avg_confidence);
        std::cout << line << "\n";
    }

    const auto m = controller.get_last_metrics();
    char perf[256];
    std::snprintf(perf, sizeof(perf),
                  "[perf] audio=%.1fs asr=%.2fs diar=%.2fs match=%.3fs total=%.2fs rtf=%.2f (%s)",
                  transcript.total_duration, m.transcription_time_s, m.diarization_time_s,
                  m.matching_time_s, m.total_time_s, m.realtime_factor, attribution_name(m.attribution));
    core::log_info(perf);

    if (!json_path.empty()) {
        std::ofstream out(json_path);
        if (!out) {
            std::cerr << "[output] cannot write " << json_path << "\n";
            return 1;
        }
        out << core::build_report(transcript).dump(2) << "\n";
        core::log_info("[output] wrote " + json_path);
    }
    return 0;
}
