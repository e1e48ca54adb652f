#pragma once

#include "core/inference_models.hpp"
#include "core/transcript.hpp"

#include <atomic>
#include <future>
#include <memory>
#include <vector>

namespace core {

/// Set to true by the caller to abandon a processing call at its next wait point
using CancelFlag = std::atomic<bool>;

/**
 * @brief How speaker attribution was obtained for a processing call
 */
enum class SpeakerAttribution {
    Diarized,       ///< Matched against diarization turns
    Unavailable,    ///< No diarizer configured: one speaker, confidence 0.5
    Failed          ///< Diarizer threw on this input: one speaker, confidence 0.3
};

/**
 * @brief Batch transcription with speaker attribution
 *
 * One call processes one whole recording:
 * - transcription and diarization run concurrently on worker threads
 * - once both finish, transcript segments are matched to speaker turns
 * - the result is assembled into a DiarizedTranscript
 *
 * A transcription failure is fatal and raised as TranscriptionError.
 * Diarization problems never escape: they degrade the speaker attribution.
 *
 * Calls are independent and may run concurrently; the only shared state is
 * the read-only model handles held by InferenceModels.
 */
class TranscriptionController {
public:
    /**
     * @brief Timings of the most recent call
     */
    struct PerformanceMetrics {
        double transcription_time_s = 0.0;  ///< Wall time of the transcription task
        double diarization_time_s = 0.0;    ///< Wall time of the diarization task (0 if skipped)
        double matching_time_s = 0.0;       ///< Matching + assembly
        double total_time_s = 0.0;
        double realtime_factor = 0.0;       ///< total / audio duration; <1.0 = faster than realtime
        size_t segments = 0;
        SpeakerAttribution attribution = SpeakerAttribution::Unavailable;
    };

    explicit TranscriptionController(std::shared_ptr<InferenceModels> models);
    ~TranscriptionController();

    TranscriptionController(const TranscriptionController&) = delete;
    TranscriptionController& operator=(const TranscriptionController&) = delete;

    /**
     * @brief Transcribe and attribute a whole recording
     * @param audio Mono float samples in [-1, 1]
     * @param sample_rate Sample rate in Hz (16000 expected)
     * @param cancel Optional flag polled after each model finishes
     * @throws InvalidInputError for an empty buffer, a non-positive sample rate,
     *         or transcription output that breaks the segment contract
     * @throws TranscriptionError if speech-to-text fails
     * @throws ProcessingCancelled if *cancel became true
     */
    DiarizedTranscript process(const std::vector<float>& audio, int sample_rate,
                               const CancelFlag* cancel = nullptr);

    /**
     * @brief process() on a worker thread. The controller must outlive the future.
     */
    std::future<DiarizedTranscript> process_async(std::vector<float> audio, int sample_rate,
                                                  std::shared_ptr<const CancelFlag> cancel = nullptr);

    PerformanceMetrics get_last_metrics() const;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace core
