#pragma once

#include "asr/recognition_backend.hpp"

#include <memory>
#include <string>
#include <vector>

// Forward declarations to avoid including onnxruntime headers here
namespace Ort {
    struct Env;
    struct Session;
    struct SessionOptions;
    struct AllocatorWithDefaultOptions;
    struct MemoryInfo;
}

namespace wakeword {

/**
 * ONNX keyword classifier used as a wakeword backend.
 * The model takes a [1, window_samples] float PCM window in [-1, 1] and
 * returns one score per label. A label scoring at or above the threshold is
 * reported as a (non-final) result whose transcript is the label.
 */
class OnnxKeywordBackend : public asr::IRecognitionBackend {
public:
    struct Config {
        std::string model_path = "models/keyword.onnx";
        std::vector<std::string> labels;    // one per model output
        float threshold = 0.5f;
        int sample_rate = 16000;
        int window_ms = 1000;               // classifier input length
        int hop_ms = 100;                   // classify this often
        int threads = 1;
        bool verbose = false;
    };

    static constexpr int kInferenceFailed = 1;

    /// Throws core::ConfigurationError if the model cannot be loaded or its
    /// output does not match the label list.
    explicit OnnxKeywordBackend(const Config& config);
    ~OnnxKeywordBackend() override;

    OnnxKeywordBackend(const OnnxKeywordBackend&) = delete;
    OnnxKeywordBackend& operator=(const OnnxKeywordBackend&) = delete;

    const char* name() const override { return "onnx_keyword"; }
    std::unique_ptr<asr::IRecognitionRequest> open_request(asr::RecognitionCallbacks callbacks) override;
    bool is_retryable(const asr::BackendFailure& failure) const override;

    /**
     * Score one window.
     * @return one score per label; empty on inference failure
     */
    std::vector<float> classify(const std::vector<float>& window);

    const Config& config() const { return m_config; }
    size_t window_samples() const { return m_window_samples; }

private:
    Config m_config;
    size_t m_window_samples;

    // ONNX Runtime objects (using unique_ptr to hide implementation details)
    std::unique_ptr<Ort::Env> m_env;
    std::unique_ptr<Ort::Session> m_session;
    std::unique_ptr<Ort::SessionOptions> m_session_options;
    std::unique_ptr<Ort::AllocatorWithDefaultOptions> m_allocator;
    std::unique_ptr<Ort::MemoryInfo> m_memory_info;

    std::vector<std::string> m_input_name_strings;
    std::vector<std::string> m_output_name_strings;
    std::vector<const char*> m_input_names;
    std::vector<const char*> m_output_names;
    int m_output_dim = 0;
};

} // namespace wakeword
