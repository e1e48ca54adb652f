#include <atomic>
#include <cassert>
#include <chrono>
#include <cmath>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>
#include "core/errors.hpp"
#include "core/logging.hpp"
#include "core/transcription_controller.hpp"

namespace {

constexpr int kRate = 16000;

bool near(double a, double b, double eps = 1e-6) { return std::fabs(a - b) < eps; }

class FakeTranscriber : public asr::TranscriptionProvider {
public:
    std::vector<asr::TranscriptSegment> segments;
    bool fail = false;
    core::CancelFlag* cancel_during = nullptr;
    mutable std::atomic<int> calls{0};

    std::vector<asr::TranscriptSegment> transcribe(const float*, size_t, int) const override {
        calls++;
        if (cancel_during) cancel_during->store(true);
        if (fail) throw std::runtime_error("decoder exploded");
        return segments;
    }
};

class FakeDiarizer : public diar::DiarizationBackend {
public:
    std::vector<diar::SpeakerTurn> turns;
    bool fail = false;
    mutable std::atomic<int> calls{0};

    std::vector<diar::SpeakerTurn> diarize(const float*, size_t, int) const override {
        calls++;
        if (fail) throw std::runtime_error("clustering diverged");
        return turns;
    }
};

// Backends that fail with something other than std::exception
class OddTranscriber : public asr::TranscriptionProvider {
public:
    std::vector<asr::TranscriptSegment> transcribe(const float*, size_t, int) const override { throw 42; }
};

class OddDiarizer : public diar::DiarizationBackend {
public:
    std::vector<diar::SpeakerTurn> diarize(const float*, size_t, int) const override { throw 42; }
};

// Both providers wait for each other; only succeeds if they run at the same time
struct Rendezvous {
    std::atomic<int> arrived{0};
    bool meet() {
        arrived++;
        const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
        while (arrived.load() < 2) {
            if (std::chrono::steady_clock::now() > deadline) return false;
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }
        return true;
    }
};

class MeetingTranscriber : public asr::TranscriptionProvider {
public:
    explicit MeetingTranscriber(std::shared_ptr<Rendezvous> r) : m_r(std::move(r)) {}
    mutable std::atomic<bool> met{false};
    std::vector<asr::TranscriptSegment> transcribe(const float*, size_t, int) const override {
        met = m_r->meet();
        return {{0.0, 1.0, "together"}};
    }
private:
    std::shared_ptr<Rendezvous> m_r;
};

class MeetingDiarizer : public diar::DiarizationBackend {
public:
    explicit MeetingDiarizer(std::shared_ptr<Rendezvous> r) : m_r(std::move(r)) {}
    mutable std::atomic<bool> met{false};
    std::vector<diar::SpeakerTurn> diarize(const float*, size_t, int) const override {
        met = m_r->meet();
        return {{0.0, 1.0, "S"}};
    }
private:
    std::shared_ptr<Rendezvous> m_r;
};

std::vector<asr::TranscriptSegment> two_segments() {
    return {{0.0, 4.0, "hi"}, {6.0, 9.0, "there"}};
}

std::vector<float> seconds_of_audio(double s) {
    return std::vector<float>(static_cast<size_t>(s * kRate), 0.1f);
}

template <typename E, typename F>
bool throws(F&& f) {
    try {
        f();
    } catch (const E&) {
        return true;
    }
    return false;
}

void diarized_path() {
    auto t = std::make_shared<FakeTranscriber>();
    t->segments = two_segments();
    auto d = std::make_shared<FakeDiarizer>();
    d->turns = {{5.0, 10.0, "Y"}, {0.0, 5.0, "X"}};
    core::TranscriptionController ctl(std::make_shared<core::InferenceModels>(t, d));

    auto out = ctl.process(seconds_of_audio(10.0), kRate);
    assert(out.segments.size() == 2);
    assert(out.segments[0].speaker_id == 1 && out.segments[1].speaker_id == 2);
    assert(near(out.segments[0].confidence, 1.0) && near(out.segments[1].confidence, 1.0));
    assert(out.speaker_count == 2);
    assert(out.speaker_names.at(1) == "Speaker 1" && out.speaker_names.at(2) == "Speaker 2");
    assert(near(out.total_duration, 10.0));
    assert(out.conversation_id == "temp");

    auto m = ctl.get_last_metrics();
    assert(m.attribution == core::SpeakerAttribution::Diarized);
    assert(m.segments == 2);
    assert(m.total_time_s >= 0.0);
}

void unavailable_diarization() {
    auto t = std::make_shared<FakeTranscriber>();
    t->segments = two_segments();
    core::TranscriptionController ctl(std::make_shared<core::InferenceModels>(t, nullptr));

    auto out = ctl.process(seconds_of_audio(10.0), kRate);
    assert(out.segments.size() == 2);
    assert(out.speaker_count == 1);
    assert(out.speaker_names.size() == 1 && out.speaker_names.count(1) == 1);
    for (const auto& s : out.segments) {
        assert(s.speaker_id == 1);
        assert(near(s.confidence, 0.5));
    }
    assert(ctl.get_last_metrics().attribution == core::SpeakerAttribution::Unavailable);
}

void failing_diarizer_degrades() {
    auto t = std::make_shared<FakeTranscriber>();
    t->segments = two_segments();
    auto d = std::make_shared<FakeDiarizer>();
    d->fail = true;
    core::TranscriptionController ctl(std::make_shared<core::InferenceModels>(t, d));

    auto out = ctl.process(seconds_of_audio(10.0), kRate);
    assert(out.segments.size() == 2);
    assert(out.speaker_count == 1);
    for (const auto& s : out.segments) {
        assert(s.speaker_id == 1);
        assert(near(s.confidence, 0.3));
    }
    assert(ctl.get_last_metrics().attribution == core::SpeakerAttribution::Failed);

    // The failure is per call, the next call tries diarization again
    d->fail = false;
    d->turns = {{0.0, 10.0, "only"}};
    auto again = ctl.process(seconds_of_audio(10.0), kRate);
    assert(near(again.segments[0].confidence, 1.0));
    assert(d->calls == 2);
}

void non_standard_throws() {
    auto t = std::make_shared<FakeTranscriber>();
    t->segments = two_segments();
    core::TranscriptionController degraded(
        std::make_shared<core::InferenceModels>(t, std::make_shared<OddDiarizer>()));
    auto out = degraded.process(seconds_of_audio(1.0), kRate);
    assert(out.segments.size() == 2);
    assert(out.speaker_count == 1);
    for (const auto& s : out.segments) {
        assert(s.speaker_id == 1);
        assert(near(s.confidence, 0.3));
    }
    assert(degraded.get_last_metrics().attribution == core::SpeakerAttribution::Failed);

    core::TranscriptionController fatal(
        std::make_shared<core::InferenceModels>(std::make_shared<OddTranscriber>(), nullptr));
    assert(throws<core::TranscriptionError>([&] { fatal.process(seconds_of_audio(1.0), kRate); }));
}

void transcription_failure_is_fatal() {
    auto t = std::make_shared<FakeTranscriber>();
    t->fail = true;
    auto d = std::make_shared<FakeDiarizer>();
    d->turns = {{0.0, 1.0, "A"}};
    core::TranscriptionController ctl(std::make_shared<core::InferenceModels>(t, d));
    assert(throws<core::TranscriptionError>([&] { ctl.process(seconds_of_audio(1.0), kRate); }));

    // Model that cannot be loaded
    core::TranscriptionController broken(std::make_shared<core::InferenceModels>(
        core::InferenceModels::TranscriberFactory([]() -> std::shared_ptr<asr::TranscriptionProvider> {
            throw core::ModelLoadError("models/ggml-small.bin missing");
        }),
        core::InferenceModels::DiarizerFactory()));
    assert(throws<core::TranscriptionError>([&] { broken.process(seconds_of_audio(1.0), kRate); }));
}

void invalid_input() {
    auto t = std::make_shared<FakeTranscriber>();
    t->segments = two_segments();
    core::TranscriptionController ctl(std::make_shared<core::InferenceModels>(t, nullptr));
    assert(throws<core::InvalidInputError>([&] { ctl.process({}, kRate); }));
    assert(throws<core::InvalidInputError>([&] { ctl.process(seconds_of_audio(1.0), 0); }));
    assert(throws<core::InvalidInputError>([&] { ctl.process(seconds_of_audio(1.0), -16000); }));
    assert(t->calls == 0);

    // Provider output that breaks the segment contract
    t->segments = {{3.0, 3.0, "zero length"}};
    assert(throws<core::InvalidInputError>([&] { ctl.process(seconds_of_audio(5.0), kRate); }));

    assert(throws<core::InvalidInputError>([] { core::TranscriptionController c(nullptr); }));
}

void empty_transcript() {
    auto t = std::make_shared<FakeTranscriber>();
    auto d = std::make_shared<FakeDiarizer>();
    d->turns = {{0.0, 2.0, "A"}};
    core::TranscriptionController ctl(std::make_shared<core::InferenceModels>(t, d));
    auto out = ctl.process(seconds_of_audio(2.0), kRate);
    assert(out.segments.empty());
    assert(out.speaker_count == 0 && out.speaker_names.empty());
    assert(near(out.total_duration, 2.0));
}

void cancellation() {
    auto t = std::make_shared<FakeTranscriber>();
    t->segments = two_segments();
    core::TranscriptionController ctl(std::make_shared<core::InferenceModels>(t, nullptr));

    core::CancelFlag cancelled{true};
    assert(throws<core::ProcessingCancelled>([&] { ctl.process(seconds_of_audio(10.0), kRate, &cancelled); }));

    // Raised at the next wait point when set while the model runs
    core::CancelFlag later{false};
    t->cancel_during = &later;
    assert(throws<core::ProcessingCancelled>([&] { ctl.process(seconds_of_audio(10.0), kRate, &later); }));
    t->cancel_during = nullptr;

    core::CancelFlag idle{false};
    assert(ctl.process(seconds_of_audio(10.0), kRate, &idle).segments.size() == 2);
}

void models_run_concurrently() {
    auto r = std::make_shared<Rendezvous>();
    auto t = std::make_shared<MeetingTranscriber>(r);
    auto d = std::make_shared<MeetingDiarizer>(r);
    core::TranscriptionController ctl(std::make_shared<core::InferenceModels>(t, d));
    auto out = ctl.process(seconds_of_audio(1.0), kRate);
    assert(t->met && d->met);
    assert(out.segments.size() == 1 && near(out.segments[0].confidence, 1.0));
}

void async_and_parallel_calls() {
    auto t = std::make_shared<FakeTranscriber>();
    t->segments = two_segments();
    auto d = std::make_shared<FakeDiarizer>();
    d->turns = {{0.0, 5.0, "X"}, {5.0, 10.0, "Y"}};
    core::TranscriptionController ctl(std::make_shared<core::InferenceModels>(t, d));

    auto fut = ctl.process_async(seconds_of_audio(10.0), kRate);
    auto out = fut.get();
    assert(out.speaker_count == 2);

    auto flag = std::make_shared<core::CancelFlag>(true);
    auto cancelled = ctl.process_async(seconds_of_audio(10.0), kRate, flag);
    assert(throws<core::ProcessingCancelled>([&] { cancelled.get(); }));

    std::vector<std::future<core::DiarizedTranscript>> futures;
    for (int i = 1; i <= 4; ++i) {
        futures.push_back(ctl.process_async(seconds_of_audio(10.0 + i), kRate));
    }
    for (int i = 1; i <= 4; ++i) {
        auto r = futures[i - 1].get();
        assert(near(r.total_duration, 10.0 + i));
        assert(r.segments.size() == 2);
        assert(r.segments[0].speaker_id == 1 && r.segments[1].speaker_id == 2);
    }
}

} // namespace

int main() {
    core::set_log_level(core::LogLevel::Off);
    diarized_path();
    unavailable_diarization();
    failing_diarizer_degrades();
    non_standard_throws();
    transcription_failure_is_fatal();
    invalid_input();
    empty_transcript();
    cancellation();
    models_run_concurrently();
    async_and_parallel_calls();
    return 0;
}
