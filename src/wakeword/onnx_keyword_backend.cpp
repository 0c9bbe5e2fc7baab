#include "wakeword/onnx_keyword_backend.hpp"
#include "core/errors.hpp"
#include "core/logging.hpp"
#include <onnxruntime_cxx_api.h>
#include <algorithm>
#include <atomic>
#include <cmath>
#include <condition_variable>
#include <cstdio>
#include <deque>
#include <mutex>
#include <thread>

namespace wakeword {

namespace {

// Softmax in place unless the scores already look like probabilities
void to_probabilities(std::vector<float>& scores) {
    bool probabilities = true;
    for (float s : scores) {
        if (s < 0.0f || s > 1.0f) { probabilities = false; break; }
    }
    if (probabilities || scores.empty()) return;

    const float max_score = *std::max_element(scores.begin(), scores.end());
    double sum = 0.0;
    for (float& s : scores) {
        s = std::exp(s - max_score);
        sum += s;
    }
    for (float& s : scores) s = static_cast<float>(s / sum);
}

// Sliding window over the request's audio; inference runs on a worker so
// append() stays cheap.
class KeywordRequest : public asr::IRecognitionRequest {
public:
    KeywordRequest(OnnxKeywordBackend& backend, asr::RecognitionCallbacks callbacks)
        : m_backend(backend)
        , m_callbacks(std::move(callbacks))
        , m_hop_samples(static_cast<size_t>(backend.config().sample_rate) *
                        static_cast<size_t>(std::max(1, backend.config().hop_ms)) / 1000) {
        m_worker = std::thread(&KeywordRequest::worker_loop, this);
    }

    ~KeywordRequest() override {
        cancel();
        if (m_worker.joinable()) m_worker.join();
    }

    void append(const audio::Frame& frame) override {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_done) return;
        for (int16_t s : frame) m_window.push_back(s / 32768.0f);
        while (m_window.size() > m_backend.window_samples()) m_window.pop_front();
        m_since_classify += frame.size();
        if (m_window.size() == m_backend.window_samples() && m_since_classify >= m_hop_samples) {
            m_since_classify = 0;
            m_pending = true;
            m_cv.notify_one();
        }
    }

    // Keyword spotting has no final transcript; finishing reports an empty one
    void finish() override {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            if (m_done) return;
            m_finishing = true;
        }
        m_cv.notify_one();
    }

    void cancel() override {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_done = true;
        }
        m_cv.notify_one();
    }

private:
    void worker_loop() {
        const auto& labels = m_backend.config().labels;
        std::unique_lock<std::mutex> lock(m_mutex);
        for (;;) {
            m_cv.wait(lock, [this] { return m_done || m_pending || m_finishing; });
            if (m_done) return;
            if (m_finishing) {
                m_done = true;
                lock.unlock();
                if (m_callbacks.on_result) m_callbacks.on_result(asr::RecognitionResult{std::string(), 0.0f, true});
                return;
            }

            m_pending = false;
            std::vector<float> window(m_window.begin(), m_window.end());
            lock.unlock();

            std::vector<float> scores = m_backend.classify(window);
            if (scores.empty()) {
                lock.lock();
                if (m_done) return;
                m_done = true;
                lock.unlock();
                if (m_callbacks.on_failure) {
                    m_callbacks.on_failure(asr::BackendFailure{OnnxKeywordBackend::kInferenceFailed, "onnx_keyword",
                                                               "keyword inference failed"});
                }
                return;
            }

            auto best = std::max_element(scores.begin(), scores.end());
            const size_t index = static_cast<size_t>(best - scores.begin());
            lock.lock();
            if (m_done) return;
            if (*best >= m_backend.config().threshold && index < labels.size()) {
                // Start over so that one utterance is reported once
                m_window.clear();
                m_since_classify = 0;
                lock.unlock();
                if (m_callbacks.on_result) {
                    m_callbacks.on_result(asr::RecognitionResult{labels[index], std::min(*best, 0.999f), false});
                }
                lock.lock();
            }
        }
    }

    OnnxKeywordBackend& m_backend;
    asr::RecognitionCallbacks m_callbacks;
    const size_t m_hop_samples;

    std::mutex m_mutex;
    std::condition_variable m_cv;
    std::deque<float> m_window;
    size_t m_since_classify = 0;
    bool m_pending = false;
    bool m_finishing = false;
    bool m_done = false;
    std::thread m_worker;
};

} // namespace

OnnxKeywordBackend::OnnxKeywordBackend(const Config& config)
    : m_config(config)
    , m_window_samples(static_cast<size_t>(config.sample_rate) * static_cast<size_t>(config.window_ms) / 1000)
{
    if (m_config.verbose) {
        fprintf(stderr, "[OnnxKeyword] Initializing with model: %s\n", m_config.model_path.c_str());
    }
    if (m_config.labels.empty()) {
        throw core::ConfigurationError("keyword backend needs at least one label");
    }

    try {
        m_env = std::make_unique<Ort::Env>(ORT_LOGGING_LEVEL_WARNING, "KeywordSpotter");

        m_session_options = std::make_unique<Ort::SessionOptions>();
        m_session_options->SetIntraOpNumThreads(std::max(1, m_config.threads));
        m_session_options->SetGraphOptimizationLevel(GraphOptimizationLevel::ORT_ENABLE_ALL);

        m_session = std::make_unique<Ort::Session>(*m_env, m_config.model_path.c_str(), *m_session_options);
        m_allocator = std::make_unique<Ort::AllocatorWithDefaultOptions>();

        if (m_session->GetInputCount() == 0 || m_session->GetOutputCount() == 0) {
            throw core::ConfigurationError("keyword model " + m_config.model_path + " has no input or output");
        }

        Ort::AllocatedStringPtr input_name_ptr = m_session->GetInputNameAllocated(0, *m_allocator);
        m_input_name_strings.emplace_back(input_name_ptr.get());
        m_input_names.push_back(m_input_name_strings.back().c_str());

        Ort::AllocatedStringPtr output_name_ptr = m_session->GetOutputNameAllocated(0, *m_allocator);
        m_output_name_strings.emplace_back(output_name_ptr.get());
        m_output_names.push_back(m_output_name_strings.back().c_str());

        // (batch, num_labels)
        Ort::TypeInfo type_info = m_session->GetOutputTypeInfo(0);
        auto shape = type_info.GetTensorTypeAndShapeInfo().GetShape();
        if (!shape.empty() && shape.back() > 0) {
            m_output_dim = static_cast<int>(shape.back());
        }
        if (m_output_dim > 0 && static_cast<size_t>(m_output_dim) != m_config.labels.size()) {
            throw core::ConfigurationError("keyword model has " + std::to_string(m_output_dim) + " outputs but " +
                                           std::to_string(m_config.labels.size()) + " labels were given");
        }

        m_memory_info = std::make_unique<Ort::MemoryInfo>(
            Ort::MemoryInfo::CreateCpu(OrtArenaAllocator, OrtMemTypeDefault)
        );

        if (m_config.verbose) {
            fprintf(stderr, "[OnnxKeyword] Input: %s, output: %s, labels: %zu\n",
                    m_input_name_strings[0].c_str(), m_output_name_strings[0].c_str(), m_config.labels.size());
        }
    } catch (const Ort::Exception& e) {
        fprintf(stderr, "[OnnxKeyword] ONNX Runtime error: %s\n", e.what());
        throw core::ConfigurationError(std::string("Failed to initialize keyword model: ") + e.what());
    }
}

OnnxKeywordBackend::~OnnxKeywordBackend() = default;

std::unique_ptr<asr::IRecognitionRequest> OnnxKeywordBackend::open_request(asr::RecognitionCallbacks callbacks) {
    return std::make_unique<KeywordRequest>(*this, std::move(callbacks));
}

bool OnnxKeywordBackend::is_retryable(const asr::BackendFailure& failure) const {
    return failure.domain == "onnx_keyword" && failure.code == kInferenceFailed;
}

std::vector<float> OnnxKeywordBackend::classify(const std::vector<float>& window) {
    if (window.size() != m_window_samples) {
        return {};
    }

    try {
        std::vector<float> input(window);
        std::vector<int64_t> input_shape = {1, static_cast<int64_t>(input.size())};
        Ort::Value input_tensor = Ort::Value::CreateTensor<float>(
            *m_memory_info,
            input.data(),
            input.size(),
            input_shape.data(),
            input_shape.size()
        );

        auto output_tensors = m_session->Run(
            Ort::RunOptions{nullptr},
            m_input_names.data(),
            &input_tensor,
            1,
            m_output_names.data(),
            1
        );

        float* output_data = output_tensors[0].GetTensorMutableData<float>();
        size_t count = output_tensors[0].GetTensorTypeAndShapeInfo().GetElementCount();
        std::vector<float> scores(output_data, output_data + count);
        to_probabilities(scores);
        return scores;

    } catch (const Ort::Exception& e) {
        core::log_error("OnnxKeyword", std::string("inference error: ") + e.what());
        return {};
    }
}

} // namespace wakeword
