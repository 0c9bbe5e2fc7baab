#pragma once

#include "core/config.hpp"
#include "core/errors.hpp"
#include "core/executor.hpp"
#include "pipeline/speech_listener.hpp"

#include <atomic>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace pipeline {

/**
 * @brief Pipeline-wide state shared by every stage
 *
 * Owned by SpeechPipeline, referenced by the stages. Holds the activation
 * and speech flags, the latest recognition result, the pending error/trace
 * values and the listener registry, and fans events out to listeners on the
 * delivery executor.
 */
class SpeechContext {
public:
    SpeechContext(const core::SpeechConfig& config, std::shared_ptr<core::Executor> executor);

    SpeechContext(const SpeechContext&) = delete;
    SpeechContext& operator=(const SpeechContext&) = delete;

    const core::SpeechConfig& config() const { return config_; }
    core::Executor& executor() { return *executor_; }

    // --- Flags ---
    bool is_active() const { return is_active_.load(); }
    void set_active(bool active) { is_active_.store(active); }

    /// Flip is_active false -> true. Returns false when it was already set
    /// (another caller activated first).
    bool try_activate();

    bool is_speech_detected() const { return is_speech_detected_.load(); }
    void set_speech_detected(bool detected) { is_speech_detected_.store(detected); }

    // --- Recognition result ---
    std::string transcript() const;
    float confidence() const;
    void set_recognition(const std::string& transcript, float confidence);
    RecognitionSnapshot snapshot() const;

    // --- Activation helpers used by stages and the pipeline ---

    /// try_activate() and, when won, dispatch Activated.
    bool activate();

    /// Clear both flags and the transcript, then dispatch Deactivated.
    void deactivate();

    // --- Pending values consumed by dispatch ---
    void set_error(core::SpeechError error);
    void set_trace(std::string message);

    /// Set the pending error and dispatch Errored as one step.
    void report_error(const core::SpeechError& error);

    /// Log a diagnostic and, when `level` passes the configured tracing
    /// level, deliver it to listeners as a Traced event.
    void trace(core::TraceLevel level, const std::string& message);

    // --- Listener registry ---
    ListenerHandle add_listener(std::shared_ptr<SpeechListener> listener);
    bool remove_listener(ListenerHandle handle);
    bool remove_listener(const std::shared_ptr<SpeechListener>& listener);
    void remove_listeners();
    size_t listener_count() const;

    /// Post the event to every listener, in registration order.
    void dispatch(SpeechEvent event);

private:
    using ListenerEntry = std::pair<ListenerHandle, std::shared_ptr<SpeechListener>>;

    void dispatch_locked(SpeechEvent event);

    core::SpeechConfig config_;
    std::shared_ptr<core::Executor> executor_;

    std::atomic<bool> is_active_{false};
    std::atomic<bool> is_speech_detected_{false};

    mutable std::mutex state_mutex_;
    std::string transcript_;
    float confidence_ = 0.0f;
    std::optional<core::SpeechError> pending_error_;
    std::optional<std::string> pending_trace_;

    mutable std::mutex listeners_mutex_;
    std::vector<ListenerEntry> listeners_;
    ListenerHandle next_handle_ = 1;

    // Keeps the per-listener posts of one event contiguous on the executor.
    // Recursive so that an executor running tasks inline may let a listener
    // dispatch again from the same thread.
    std::recursive_mutex dispatch_mutex_;
};

} // namespace pipeline
