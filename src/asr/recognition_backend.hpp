#pragma once

#include "audio/frame.hpp"

#include <functional>
#include <memory>
#include <string>

namespace asr {

struct RecognitionResult {
    std::string transcript;
    float confidence = 0.0f;   ///< [0, 1)
    bool is_final = false;     ///< Last result of the request
};

struct BackendFailure {
    int code = 0;              ///< Provider specific
    std::string domain;        ///< Provider name, e.g. "whisper"
    std::string message;
};

/**
 * @brief Callbacks a backend invokes for an open request
 *
 * May be called from any thread, including from inside append() or
 * finish(). After cancel() returns, a request should stop calling them;
 * the session ignores any that still arrive.
 */
struct RecognitionCallbacks {
    std::function<void(const RecognitionResult&)> on_result;
    std::function<void(const BackendFailure&)> on_failure;
};

/**
 * @brief One open streaming request
 */
class IRecognitionRequest {
public:
    virtual ~IRecognitionRequest() = default;

    /// Feed one frame. Must not block for longer than a frame period.
    virtual void append(const audio::Frame& frame) = 0;

    /// No more audio; produce the final result.
    virtual void finish() = 0;

    /// Abandon the request. Safe to call more than once and after a final
    /// result.
    virtual void cancel() = 0;
};

/**
 * @brief Streaming recognition provider (speech-to-text or keyword spotter)
 */
class IRecognitionBackend {
public:
    virtual ~IRecognitionBackend() = default;

    virtual const char* name() const = 0;

    /// @return nullptr if the request could not be opened
    virtual std::unique_ptr<IRecognitionRequest> open_request(RecognitionCallbacks callbacks) = 0;

    /// Transient failures are recovered by restarting the request; anything
    /// else is surfaced to listeners.
    virtual bool is_retryable(const BackendFailure& failure) const = 0;
};

} // namespace asr
