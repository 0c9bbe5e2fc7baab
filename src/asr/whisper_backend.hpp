#pragma once
#include "asr/recognition_backend.hpp"
#include <chrono>
#include <memory>
#include <string>

namespace asr {

// Speech-to-text backend over whisper.cpp. Each request buffers its audio
// (at most whisper's 30 s window) and decodes it on a worker thread: a
// partial result every partial_interval, the final result on finish().
class WhisperRecognitionBackend : public IRecognitionBackend {
public:
    struct Options {
        std::string model_path;          // file path, or a model name resolved under models/
        std::string language = "en";
        int threads = 0;                 // 0 = auto
        int sample_rate = 16000;
        std::chrono::milliseconds partial_interval{1000};
    };

    // whisper_full() failure; decoding is retried on a fresh request
    static constexpr int kDecodeFailed = -1;

    explicit WhisperRecognitionBackend(Options options);
    ~WhisperRecognitionBackend() override;

    bool load_model();
    bool is_loaded() const;

    const char* name() const override { return "whisper"; }
    std::unique_ptr<IRecognitionRequest> open_request(RecognitionCallbacks callbacks) override;
    bool is_retryable(const BackendFailure& failure) const override;

    struct Impl;
private:
    std::unique_ptr<Impl> impl_;
};
}
