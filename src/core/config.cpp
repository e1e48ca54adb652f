#include "core/config.hpp"
#include "core/errors.hpp"
#include "core/logging.hpp"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <fstream>
#include <mutex>

namespace core {

namespace {
std::mutex g_config_mutex;
Config g_config;

template <typename T>
void read_key(const nlohmann::json& j, const char* key, T& out) {
    if (!j.contains(key)) return;
    try {
        out = j.at(key).get<T>();
    } catch (const nlohmann::json::exception& e) {
        throw ConfigError(std::string("invalid value for '") + key + "': " + e.what());
    }
}
} // namespace

Config load_config(const std::string& path) {
    if (!std::filesystem::exists(path)) {
        throw ConfigError("settings file not found: " + path);
    }
    std::ifstream f(path);
    if (!f) {
        throw ConfigError("cannot open settings file: " + path);
    }

    nlohmann::json j;
    try {
        f >> j;
    } catch (const nlohmann::json::parse_error& e) {
        throw ConfigError("malformed settings file " + path + ": " + e.what());
    }
    if (!j.is_object()) {
        throw ConfigError("settings file must hold a JSON object: " + path);
    }

    Config cfg;
    read_key(j, "whisper_model", cfg.whisper_model);
    read_key(j, "language", cfg.language);
    read_key(j, "n_threads", cfg.n_threads);
    read_key(j, "log_level", cfg.log_level);

    if (j.contains("diarization")) {
        const auto& d = j.at("diarization");
        if (!d.is_object()) {
            throw ConfigError("'diarization' must be an object");
        }
        read_key(d, "enabled", cfg.enable_diarization);
        read_key(d, "speaker_model", cfg.speaker_model);
        read_key(d, "max_speakers", cfg.max_speakers);
        read_key(d, "speaker_threshold", cfg.speaker_threshold);
        read_key(d, "window_ms", cfg.window_ms);
        read_key(d, "hop_ms", cfg.hop_ms);
        read_key(d, "min_window_ms", cfg.min_window_ms);
        read_key(d, "min_rms", cfg.min_rms);
    }

    if (cfg.n_threads < 0) throw ConfigError("n_threads must be >= 0");
    if (cfg.max_speakers < 1) throw ConfigError("diarization.max_speakers must be >= 1");
    if (cfg.window_ms <= 0 || cfg.hop_ms <= 0 || cfg.hop_ms > cfg.window_ms) {
        throw ConfigError("diarization.hop_ms must be in (0, window_ms]");
    }
    if (cfg.min_window_ms <= 0 || cfg.min_window_ms > cfg.window_ms) {
        throw ConfigError("diarization.min_window_ms must be in (0, window_ms]");
    }
    LogLevel level;
    if (!parse_log_level(cfg.log_level, level)) {
        throw ConfigError("unknown log_level: " + cfg.log_level);
    }

    log_debug("[config] loaded " + path);
    return cfg;
}

Config get_config() {
    std::lock_guard<std::mutex> lock(g_config_mutex);
    return g_config;
}

void set_config(const Config& config) {
    std::lock_guard<std::mutex> lock(g_config_mutex);
    g_config = config;
}
}
