#include "asr/whisper_backend.hpp"
#include "core/errors.hpp"
#include "core/logging.hpp"

#include "whisper.h"

#include <algorithm>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <memory>
#include <string>
#include <thread>

namespace {
bool is_verbose() {
	return std::getenv("WHISPER_DEBUG") != nullptr || core::log_enabled(core::LogLevel::Debug);
}

// Filter whisper/ggml logs: keep errors/warnings always; info/debug only if verbose
void log_cb(ggml_log_level level, const char * text, void *) {
	switch (level) {
	case GGML_LOG_LEVEL_ERROR:
	case GGML_LOG_LEVEL_WARN:
		std::fputs(text, stderr);
		break;
	case GGML_LOG_LEVEL_INFO:
	case GGML_LOG_LEVEL_DEBUG:
	default:
		if (is_verbose()) std::fputs(text, stderr);
		break;
	}
}

struct StateDeleter {
	void operator()(whisper_state* s) const { if (s) whisper_free_state(s); }
};
using StatePtr = std::unique_ptr<whisper_state, StateDeleter>;

std::string trim(const std::string& x) {
	size_t a = x.find_first_not_of(" \t\r\n");
	size_t b = x.find_last_not_of(" \t\r\n");
	if (a == std::string::npos) return {};
	return x.substr(a, b - a + 1);
}

// [BLANK_AUDIO], [ Silence ], (music) and the like
bool is_non_speech(const std::string& s) {
	if (s.size() >= 2 && ((s.front() == '[' && s.back() == ']') || (s.front() == '(' && s.back() == ')'))) {
		return true;
	}
	return false;
}
} // anonymous namespace

namespace asr {

std::string WhisperBackend::resolve_model_path(const std::string& model_name) {
	auto exists = [](const std::string& p){ return std::filesystem::exists(std::filesystem::u8path(p)); };
	const bool has_ext = (model_name.find(".gguf") != std::string::npos) || (model_name.find(".bin") != std::string::npos);
	if (has_ext) return model_name;

	const std::string candidates[] = {
		"models/" + model_name + ".gguf",
		"models/ggml-" + model_name + "-q5_1.gguf",
		"models/ggml-" + model_name + ".gguf",
		"models/" + model_name + ".bin",
		"models/ggml-" + model_name + ".bin",
		"models/ggml-" + model_name + "-q5_1.bin",
	};
	for (const auto& c : candidates) {
		if (exists(c)) return c;
	}
	return candidates[0]; // fallback, init will report it missing
}

WhisperBackend::WhisperBackend(const Config& config) : m_config(config) {
	const std::string path = resolve_model_path(m_config.model);
	if (!std::filesystem::exists(std::filesystem::u8path(path))) {
		throw core::ModelLoadError("whisper model not found: " + path);
	}

	// Set logging verbosity before creating context to suppress init spam when not verbose
	whisper_log_set(log_cb, nullptr);

	whisper_context_params cparams = whisper_context_default_params();
	cparams.use_gpu = m_config.use_gpu;
	core::log_info("[whisper] init from: " + path);
	m_ctx = whisper_init_from_file_with_params(path.c_str(), cparams);
	if (!m_ctx) {
		throw core::ModelLoadError("whisper init FAILED for path: " + path);
	}
	core::log_info("[whisper] init OK: " + path);
	if (is_verbose()) {
		core::log_debug(std::string("[whisper] system: ") + whisper_print_system_info());
	}
}

WhisperBackend::~WhisperBackend() {
	if (m_ctx) whisper_free(m_ctx);
}

std::vector<TranscriptSegment> WhisperBackend::transcribe(const float* pcm, size_t samples, int sample_rate) const {
	if (!pcm || samples == 0) return {};
	if (sample_rate != WHISPER_SAMPLE_RATE) {
		throw core::TranscriptionError("whisper needs " + std::to_string(WHISPER_SAMPLE_RATE) +
		                               " Hz audio, got " + std::to_string(sample_rate));
	}

	StatePtr state(whisper_init_state(m_ctx));
	if (!state) {
		throw core::TranscriptionError("whisper_init_state failed");
	}

	whisper_full_params wparams = whisper_full_default_params(WHISPER_SAMPLING_GREEDY);
	const bool verbose = is_verbose();
	wparams.print_realtime   = false;
	wparams.print_progress   = verbose;
	wparams.print_timestamps = verbose;
	wparams.print_special    = false;
	wparams.translate        = false;
	wparams.language         = m_config.language.c_str();
	wparams.detect_language  = false;
	wparams.n_threads        = (m_config.n_threads <= 0)
	                               ? static_cast<int>(std::max(1u, std::thread::hardware_concurrency()))
	                               : m_config.n_threads;
	wparams.offset_ms        = 0;
	wparams.duration_ms      = 0; // process all
	wparams.token_timestamps = false;
	wparams.greedy.best_of   = 1;

	if (verbose) {
		core::log_debug("[whisper] running on samples=" + std::to_string(samples) +
		                ", threads=" + std::to_string(wparams.n_threads));
	}
	const int ret = whisper_full_with_state(m_ctx, state.get(), wparams, pcm, static_cast<int>(samples));
	if (ret != 0) {
		throw core::TranscriptionError("whisper_full FAILED, ret=" + std::to_string(ret));
	}

	const whisper_token eot = whisper_token_eot(m_ctx);
	const int n = whisper_full_n_segments_from_state(state.get());
	std::vector<TranscriptSegment> out;
	out.reserve(n);
	for (int i = 0; i < n; ++i) {
		const char* txt = whisper_full_get_segment_text_from_state(state.get(), i);
		std::string s = trim(txt ? txt : "");
		if (s.empty() || is_non_speech(s)) continue;

		// timestamps are in units of 10 ms
		const double t0 = whisper_full_get_segment_t0_from_state(state.get(), i) * 0.01;
		const double t1 = whisper_full_get_segment_t1_from_state(state.get(), i) * 0.01;
		if (t1 <= t0) {
			core::log_debug("[whisper] dropping zero-length segment: " + s);
			continue;
		}

		// mean probability of the text tokens (timestamps and other specials excluded)
		double p_sum = 0.0;
		int p_count = 0;
		const int n_tokens = whisper_full_n_tokens_from_state(state.get(), i);
		for (int j = 0; j < n_tokens; ++j) {
			const whisper_token_data td = whisper_full_get_token_data_from_state(state.get(), i, j);
			if (td.id >= eot) continue;
			p_sum += td.p;
			p_count++;
		}
		const float confidence = p_count > 0 ? static_cast<float>(std::clamp(p_sum / p_count, 0.0, 1.0)) : 1.0f;

		out.push_back(TranscriptSegment{std::max(0.0, t0), t1, s, confidence});
	}
	if (verbose) whisper_print_timings(m_ctx);
	return out;
}

} // namespace asr
