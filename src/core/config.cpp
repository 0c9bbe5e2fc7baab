#include "core/config.hpp"
#include "core/errors.hpp"

#include <algorithm>
#include <cctype>
#include <functional>
#include <map>

namespace core {

namespace {

std::string trim(const std::string& s) {
    size_t a = s.find_first_not_of(" \t\r\n");
    size_t b = s.find_last_not_of(" \t\r\n");
    if (a == std::string::npos) return std::string();
    return s.substr(a, b - a + 1);
}

int parse_int(const std::string& key, const std::string& value) {
    try {
        size_t used = 0;
        int v = std::stoi(value, &used);
        if (used != value.size()) throw std::invalid_argument(value);
        return v;
    } catch (const std::exception&) {
        throw ConfigurationError("option '" + key + "' expects an integer, got '" + value + "'");
    }
}

float parse_float(const std::string& key, const std::string& value) {
    try {
        size_t used = 0;
        float v = std::stof(value, &used);
        if (used != value.size()) throw std::invalid_argument(value);
        return v;
    } catch (const std::exception&) {
        throw ConfigurationError("option '" + key + "' expects a number, got '" + value + "'");
    }
}

void require(bool ok, const std::string& msg) {
    if (!ok) throw ConfigurationError(msg);
}

} // namespace

TraceLevel parse_trace_level(const std::string& value) {
    std::string v = value;
    std::transform(v.begin(), v.end(), v.begin(), [](unsigned char c) { return std::tolower(c); });
    if (v == "none") return TraceLevel::None;
    if (v == "info") return TraceLevel::Info;
    if (v == "perf") return TraceLevel::Perf;
    if (v == "debug") return TraceLevel::Debug;
    throw ConfigurationError("option 'tracing' expects none, info, perf or debug, got '" + value + "'");
}

const char* to_string(TraceLevel level) {
    switch (level) {
        case TraceLevel::None: return "none";
        case TraceLevel::Info: return "info";
        case TraceLevel::Perf: return "perf";
        case TraceLevel::Debug: return "debug";
    }
    return "none";
}

void SpeechConfig::set_property(const std::string& key, const std::string& value) {
    using Setter = std::function<void(SpeechConfig&, const std::string&)>;
    static const std::map<std::string, Setter> setters = {
        {"sample_rate", [](SpeechConfig& c, const std::string& v) { c.sample_rate = parse_int("sample_rate", v); }},
        {"frame_width", [](SpeechConfig& c, const std::string& v) { c.frame_width = parse_int("frame_width", v); }},
        {"buffer_width", [](SpeechConfig& c, const std::string& v) { c.buffer_width = parse_int("buffer_width", v); }},
        {"vad_threshold_dbfs", [](SpeechConfig& c, const std::string& v) { c.vad_threshold_dbfs = parse_float("vad_threshold_dbfs", v); }},
        {"vad_rise_ms", [](SpeechConfig& c, const std::string& v) { c.vad_rise_ms = parse_int("vad_rise_ms", v); }},
        {"vad_fall_ms", [](SpeechConfig& c, const std::string& v) { c.vad_fall_ms = parse_int("vad_fall_ms", v); }},
        {"wake_phrases", [](SpeechConfig& c, const std::string& v) { c.wake_phrases = v; }},
        {"wakeword_request_timeout_ms", [](SpeechConfig& c, const std::string& v) { c.wakeword_request_timeout_ms = parse_int("wakeword_request_timeout_ms", v); }},
        {"speech_request_timeout_ms", [](SpeechConfig& c, const std::string& v) { c.speech_request_timeout_ms = parse_int("speech_request_timeout_ms", v); }},
        {"wake_active_min_ms", [](SpeechConfig& c, const std::string& v) { c.wake_active_min_ms = parse_int("wake_active_min_ms", v); }},
        {"wake_active_max_ms", [](SpeechConfig& c, const std::string& v) { c.wake_active_max_ms = parse_int("wake_active_max_ms", v); }},
        {"lock_timeout_ms", [](SpeechConfig& c, const std::string& v) { c.lock_timeout_ms = parse_int("lock_timeout_ms", v); }},
        {"tracing", [](SpeechConfig& c, const std::string& v) { c.tracing = parse_trace_level(v); }},
        {"whisper_model_path", [](SpeechConfig& c, const std::string& v) { c.whisper_model_path = v; }},
        {"whisper_language", [](SpeechConfig& c, const std::string& v) { c.whisper_language = v; }},
        {"whisper_partial_interval_ms", [](SpeechConfig& c, const std::string& v) { c.whisper_partial_interval_ms = parse_int("whisper_partial_interval_ms", v); }},
        {"whisper_threads", [](SpeechConfig& c, const std::string& v) { c.whisper_threads = parse_int("whisper_threads", v); }},
        {"keyword_model_path", [](SpeechConfig& c, const std::string& v) { c.keyword_model_path = v; }},
        {"keyword_labels", [](SpeechConfig& c, const std::string& v) { c.keyword_labels = v; }},
        {"keyword_threshold", [](SpeechConfig& c, const std::string& v) { c.keyword_threshold = parse_float("keyword_threshold", v); }},
        {"keyword_window_ms", [](SpeechConfig& c, const std::string& v) { c.keyword_window_ms = parse_int("keyword_window_ms", v); }},
        {"input_device", [](SpeechConfig& c, const std::string& v) { c.input_device = v; }},
    };

    auto it = setters.find(key);
    if (it == setters.end()) {
        throw ConfigurationError("unknown option '" + key + "'");
    }
    it->second(*this, trim(value));
}

void SpeechConfig::validate() const {
    require(sample_rate == 8000 || sample_rate == 16000 || sample_rate == 32000 || sample_rate == 48000,
            "sample_rate must be 8000, 16000, 32000 or 48000");
    require(frame_width == 10 || frame_width == 20 || frame_width == 30,
            "frame_width must be 10, 20 or 30 ms");
    require(buffer_width >= frame_width, "buffer_width must hold at least one frame");
    require(vad_threshold_dbfs < 0.0f, "vad_threshold_dbfs must be negative");
    require(vad_rise_ms >= 0 && vad_fall_ms >= 0, "vad_rise_ms and vad_fall_ms must not be negative");
    require(!wake_phrase_list().empty(), "wake_phrases must name at least one phrase");
    require(wakeword_request_timeout_ms > 0, "wakeword_request_timeout_ms must be positive");
    require(speech_request_timeout_ms > 0, "speech_request_timeout_ms must be positive");
    require(wake_active_min_ms >= 0 && wake_active_max_ms > 0, "activation window must be positive");
    require(wake_active_min_ms <= wake_active_max_ms, "wake_active_min_ms must not exceed wake_active_max_ms");
    require(lock_timeout_ms > 0, "lock_timeout_ms must be positive");
    require(whisper_partial_interval_ms > 0, "whisper_partial_interval_ms must be positive");
    require(keyword_threshold > 0.0f && keyword_threshold < 1.0f, "keyword_threshold must be in (0, 1)");
    require(keyword_window_ms >= frame_width, "keyword_window_ms must hold at least one frame");
}

std::vector<std::string> SpeechConfig::split_list(const std::string& csv) {
    std::vector<std::string> out;
    size_t start = 0;
    while (start <= csv.size()) {
        size_t comma = csv.find(',', start);
        if (comma == std::string::npos) comma = csv.size();
        std::string item = trim(csv.substr(start, comma - start));
        if (!item.empty()) out.push_back(item);
        start = comma + 1;
    }
    return out;
}

}
