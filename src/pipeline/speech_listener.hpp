#pragma once

#include "core/errors.hpp"

#include <cstdint>
#include <string>

namespace pipeline {

/**
 * @brief Recognition result captured when the event was dispatched
 *
 * Delivery is asynchronous; listeners see the values as they were at
 * dispatch time, not whatever the context holds when the callback runs.
 */
struct RecognitionSnapshot {
    std::string transcript;
    float confidence = 0.0f;
};

enum class SpeechEvent {
    Initialized,
    Started,
    Stopped,
    Activated,
    Deactivated,
    Recognized,
    PartialRecognized,
    TimedOut,
    Traced,
    Errored
};

const char* to_string(SpeechEvent event);

/**
 * @brief Receiver of pipeline events
 *
 * Every callback has a no-op default; override the ones you care about.
 * All calls arrive on the pipeline's delivery executor, never on the audio
 * or backend threads.
 */
class SpeechListener {
public:
    virtual ~SpeechListener() = default;

    virtual void on_init() {}
    virtual void on_start() {}
    virtual void on_stop() {}
    virtual void on_activate() {}
    virtual void on_deactivate() {}
    virtual void on_recognize(const RecognitionSnapshot& result) { (void)result; }
    virtual void on_partial_recognize(const RecognitionSnapshot& result) { (void)result; }
    virtual void on_timeout() {}
    virtual void on_trace(const std::string& message) { (void)message; }
    virtual void on_error(const core::SpeechError& error) { (void)error; }
};

/// Stable key for a registered listener; 0 is never issued.
using ListenerHandle = uint64_t;

} // namespace pipeline
