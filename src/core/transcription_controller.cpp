// TranscriptionController - batch transcription with speaker attribution
//
// Per call:
//
//   caller thread            worker threads
//   -------------            --------------
//   validate input
//   launch ----------------> transcribe(audio)      (whisper)
//   launch ----------------> diarize(audio)         (speaker embeddings + clustering)
//   compute duration
//   wait transcription  <--- segments / error -> TranscriptionError
//   wait diarization    <--- turns / error      -> single speaker @ 0.3
//   match segments to turns, assemble transcript
//
// Matching needs both results, so it is the only step that waits on both.

#include "core/transcription_controller.hpp"
#include "core/errors.hpp"
#include "core/logging.hpp"
#include "core/speaker_matcher.hpp"
#include "core/transcript_builder.hpp"

#include <chrono>
#include <mutex>
#include <sstream>

namespace core {

namespace {
using Clock = std::chrono::steady_clock;

double seconds_since(Clock::time_point t0) {
    return std::chrono::duration<double>(Clock::now() - t0).count();
}

void check_cancel(const CancelFlag* cancel) {
    if (cancel && cancel->load()) {
        throw ProcessingCancelled();
    }
}

struct TimedTurns {
    std::vector<diar::SpeakerTurn> turns;
    double seconds = 0.0;
};

struct TimedSegments {
    std::vector<asr::TranscriptSegment> segments;
    double seconds = 0.0;
};
} // namespace

/**
 * @brief Internal implementation of TranscriptionController (PIMPL pattern)
 */
class TranscriptionController::Impl {
public:
    std::shared_ptr<InferenceModels> models;

    mutable std::mutex metrics_mutex;
    PerformanceMetrics last_metrics;

    explicit Impl(std::shared_ptr<InferenceModels> m) : models(std::move(m)) {}

    DiarizedTranscript process(const std::vector<float>& audio, int sample_rate, const CancelFlag* cancel) {
        if (audio.empty()) {
            throw InvalidInputError("audio buffer is empty");
        }
        if (sample_rate <= 0) {
            throw InvalidInputError("sample rate must be positive, got " + std::to_string(sample_rate));
        }
        if (sample_rate != 16000) {
            log_warn("[controller] expected 16000 Hz audio, got " + std::to_string(sample_rate) + " Hz");
        }
        check_cancel(cancel);

        const auto t_start = Clock::now();

        std::shared_ptr<asr::TranscriptionProvider> transcriber;
        try {
            transcriber = models->transcriber();
        } catch (const ModelLoadError& e) {
            log_error(std::string("[controller] ") + e.what());
            throw TranscriptionError(std::string("transcription model unavailable: ") + e.what());
        }
        std::shared_ptr<diar::DiarizationBackend> diarizer = models->diarizer();

        const float* pcm = audio.data();
        const size_t n = audio.size();

        // Both futures come from std::async, so leaving this scope by exception
        // still joins the workers before `audio` can go away.
        auto asr_task = std::async(std::launch::async, [transcriber, pcm, n, sample_rate]() {
            TimedSegments r;
            const auto t0 = Clock::now();
            r.segments = transcriber->transcribe(pcm, n, sample_rate);
            r.seconds = seconds_since(t0);
            return r;
        });

        std::future<TimedTurns> diar_task;
        if (diarizer) {
            diar_task = std::async(std::launch::async, [diarizer, pcm, n, sample_rate]() {
                TimedTurns r;
                const auto t0 = Clock::now();
                r.turns = diarizer->diarize(pcm, n, sample_rate);
                r.seconds = seconds_since(t0);
                return r;
            });
        }

        const double duration = audio_duration_s(n, sample_rate);

        TimedSegments transcript;
        try {
            transcript = asr_task.get();
        } catch (const TranscriptionError& e) {
            log_error(std::string("[controller] transcription failed: ") + e.what());
            throw;
        } catch (const std::exception& e) {
            log_error(std::string("[controller] transcription failed: ") + e.what());
            throw TranscriptionError(e.what());
        } catch (...) {
            log_error("[controller] transcription failed: unknown error");
            throw TranscriptionError("transcription failed: unknown error");
        }
        log_info("[controller] transcription complete: " + std::to_string(transcript.segments.size()) + " segments");
        check_cancel(cancel);

        validate_segments(transcript.segments);

        PerformanceMetrics metrics;
        metrics.transcription_time_s = transcript.seconds;

        std::vector<diar::SpeakerTurn> turns;
        if (!diar_task.valid()) {
            metrics.attribution = SpeakerAttribution::Unavailable;
            log_warn("[controller] diarization unavailable, assigning a single speaker");
        } else {
            try {
                TimedTurns r = diar_task.get();
                turns = std::move(r.turns);
                metrics.diarization_time_s = r.seconds;
                metrics.attribution = SpeakerAttribution::Diarized;
                log_info("[controller] diarization complete: " + std::to_string(turns.size()) + " speaker turns");
            } catch (const std::exception& e) {
                metrics.attribution = SpeakerAttribution::Failed;
                log_error(std::string("[controller] diarization failed, assigning a single speaker: ") + e.what());
            } catch (...) {
                // Any diarizer failure degrades the call, whatever was thrown
                metrics.attribution = SpeakerAttribution::Failed;
                log_error("[controller] diarization failed, assigning a single speaker: unknown error");
            }
        }
        check_cancel(cancel);

        const auto t_match = Clock::now();
        std::vector<SpeakerSegment> attributed;
        switch (metrics.attribution) {
        case SpeakerAttribution::Diarized:
            attributed = match_speakers(transcript.segments, turns);
            break;
        case SpeakerAttribution::Unavailable:
            attributed = assign_single_speaker(transcript.segments, kConfidenceDiarizationUnavailable);
            break;
        case SpeakerAttribution::Failed:
            attributed = assign_single_speaker(transcript.segments, kConfidenceDiarizationFailed);
            break;
        }
        DiarizedTranscript result = build_transcript(std::move(attributed), duration);
        metrics.matching_time_s = seconds_since(t_match);

        metrics.total_time_s = seconds_since(t_start);
        metrics.realtime_factor = duration > 0.0 ? metrics.total_time_s / duration : 0.0;
        metrics.segments = result.segments.size();

        if (log_enabled(LogLevel::Debug)) {
            std::ostringstream os;
            os << "[controller] audio=" << duration << "s asr=" << metrics.transcription_time_s
               << "s diar=" << metrics.diarization_time_s << "s match=" << metrics.matching_time_s
               << "s rtf=" << metrics.realtime_factor;
            log_debug(os.str());
        }
        {
            std::lock_guard<std::mutex> lock(metrics_mutex);
            last_metrics = metrics;
        }
        return result;
    }
};

TranscriptionController::TranscriptionController(std::shared_ptr<InferenceModels> models)
    : impl_(std::make_unique<Impl>(std::move(models)))
{
    if (!impl_->models) {
        throw InvalidInputError("TranscriptionController requires model handles");
    }
}

TranscriptionController::~TranscriptionController() = default;

DiarizedTranscript TranscriptionController::process(const std::vector<float>& audio, int sample_rate,
                                                    const CancelFlag* cancel) {
    return impl_->process(audio, sample_rate, cancel);
}

std::future<DiarizedTranscript> TranscriptionController::process_async(std::vector<float> audio, int sample_rate,
                                                                       std::shared_ptr<const CancelFlag> cancel) {
    return std::async(std::launch::async,
                      [this, audio = std::move(audio), sample_rate, cancel]() {
                          return impl_->process(audio, sample_rate, cancel.get());
                      });
}

TranscriptionController::PerformanceMetrics TranscriptionController::get_last_metrics() const {
    std::lock_guard<std::mutex> lock(impl_->metrics_mutex);
    return impl_->last_metrics;
}

} // namespace core
