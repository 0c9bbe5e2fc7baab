#pragma once
#include <string>
#include <vector>

namespace core {

enum class TraceLevel { None = 0, Info = 1, Perf = 2, Debug = 3 };

/**
 * @brief Flat set of named options consumed when the pipeline is built
 *
 * Every field can also be set by key through set_property(), which is what
 * SpeechPipelineBuilder::set_property() forwards to.
 */
struct SpeechConfig {
    // Audio framing
    int sample_rate = 16000;               ///< Hz
    int frame_width = 20;                  ///< ms per frame: 10, 20 or 30
    int buffer_width = 300;                ///< ms buffered by push/mic sources

    // Voice activity detection
    float vad_threshold_dbfs = -40.0f;
    int vad_rise_ms = 40;
    int vad_fall_ms = 500;

    // Wakeword
    std::string wake_phrases = "computer"; ///< Comma-separated candidate set
    int wakeword_request_timeout_ms = 50000;

    // Speech recognition
    int speech_request_timeout_ms = 25000;
    int wake_active_min_ms = 2000;
    int wake_active_max_ms = 5000;

    // Concurrency
    int lock_timeout_ms = 2000;

    // Diagnostics
    TraceLevel tracing = TraceLevel::None;

    // whisper.cpp backend
    std::string whisper_model_path;
    std::string whisper_language = "en";
    int whisper_partial_interval_ms = 1000;
    int whisper_threads = 0;               ///< 0 = auto

    // ONNX keyword backend
    std::string keyword_model_path;
    std::string keyword_labels;            ///< Comma-separated class labels
    float keyword_threshold = 0.5f;
    int keyword_window_ms = 1000;

    // PortAudio source
    std::string input_device;              ///< Device index, empty = default

    /// Samples in one frame at the configured rate and width
    size_t frame_samples() const {
        return static_cast<size_t>(sample_rate) * static_cast<size_t>(frame_width) / 1000;
    }

    /// Set an option by name. Throws ConfigurationError on unknown keys or
    /// values that do not parse.
    void set_property(const std::string& key, const std::string& value);

    /// Throws ConfigurationError when an option is out of range.
    void validate() const;

    std::vector<std::string> wake_phrase_list() const { return split_list(wake_phrases); }
    std::vector<std::string> keyword_label_list() const { return split_list(keyword_labels); }

    static std::vector<std::string> split_list(const std::string& csv);
};

TraceLevel parse_trace_level(const std::string& value);
const char* to_string(TraceLevel level);

}
