#include "pipeline/speech_context.hpp"
#include "core/logging.hpp"

#include <algorithm>

namespace pipeline {

const char* to_string(SpeechEvent event) {
    switch (event) {
        case SpeechEvent::Initialized: return "initialized";
        case SpeechEvent::Started: return "started";
        case SpeechEvent::Stopped: return "stopped";
        case SpeechEvent::Activated: return "activated";
        case SpeechEvent::Deactivated: return "deactivated";
        case SpeechEvent::Recognized: return "recognized";
        case SpeechEvent::PartialRecognized: return "partial_recognized";
        case SpeechEvent::TimedOut: return "timed_out";
        case SpeechEvent::Traced: return "traced";
        case SpeechEvent::Errored: return "errored";
    }
    return "unknown";
}

SpeechContext::SpeechContext(const core::SpeechConfig& config, std::shared_ptr<core::Executor> executor)
    : config_(config)
    , executor_(std::move(executor)) {
    if (!executor_) {
        executor_ = std::make_shared<core::SerialExecutor>();
    }
}

bool SpeechContext::try_activate() {
    bool expected = false;
    return is_active_.compare_exchange_strong(expected, true);
}

std::string SpeechContext::transcript() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return transcript_;
}

float SpeechContext::confidence() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return confidence_;
}

void SpeechContext::set_recognition(const std::string& transcript, float confidence) {
    std::lock_guard<std::mutex> lock(state_mutex_);
    transcript_ = transcript;
    confidence_ = confidence;
}

RecognitionSnapshot SpeechContext::snapshot() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return RecognitionSnapshot{transcript_, confidence_};
}

bool SpeechContext::activate() {
    if (!try_activate()) {
        return false;
    }
    dispatch(SpeechEvent::Activated);
    return true;
}

void SpeechContext::deactivate() {
    is_active_.store(false);
    is_speech_detected_.store(false);
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        transcript_.clear();
        confidence_ = 0.0f;
    }
    dispatch(SpeechEvent::Deactivated);
}

void SpeechContext::set_error(core::SpeechError error) {
    std::lock_guard<std::mutex> lock(state_mutex_);
    pending_error_ = std::move(error);
}

void SpeechContext::set_trace(std::string message) {
    std::lock_guard<std::mutex> lock(state_mutex_);
    pending_trace_ = std::move(message);
}

void SpeechContext::report_error(const core::SpeechError& error) {
    core::log_error("Pipeline", error.to_string());
    std::lock_guard<std::recursive_mutex> lock(dispatch_mutex_);
    set_error(error);
    dispatch_locked(SpeechEvent::Errored);
}

void SpeechContext::trace(core::TraceLevel level, const std::string& message) {
    core::log_debug("Trace", message);
    if (level == core::TraceLevel::None || level > config_.tracing) {
        return;
    }
    std::lock_guard<std::recursive_mutex> lock(dispatch_mutex_);
    set_trace(message);
    dispatch_locked(SpeechEvent::Traced);
}

ListenerHandle SpeechContext::add_listener(std::shared_ptr<SpeechListener> listener) {
    if (!listener) return 0;
    std::lock_guard<std::mutex> lock(listeners_mutex_);
    for (const auto& entry : listeners_) {
        if (entry.second == listener) {
            return entry.first;  // Already registered
        }
    }
    ListenerHandle handle = next_handle_++;
    listeners_.emplace_back(handle, std::move(listener));
    return handle;
}

bool SpeechContext::remove_listener(ListenerHandle handle) {
    std::lock_guard<std::mutex> lock(listeners_mutex_);
    auto it = std::find_if(listeners_.begin(), listeners_.end(),
                           [handle](const ListenerEntry& e) { return e.first == handle; });
    if (it == listeners_.end()) return false;
    listeners_.erase(it);
    return true;
}

bool SpeechContext::remove_listener(const std::shared_ptr<SpeechListener>& listener) {
    std::lock_guard<std::mutex> lock(listeners_mutex_);
    auto it = std::find_if(listeners_.begin(), listeners_.end(),
                           [&listener](const ListenerEntry& e) { return e.second == listener; });
    if (it == listeners_.end()) return false;
    listeners_.erase(it);
    return true;
}

void SpeechContext::remove_listeners() {
    std::lock_guard<std::mutex> lock(listeners_mutex_);
    listeners_.clear();
}

size_t SpeechContext::listener_count() const {
    std::lock_guard<std::mutex> lock(listeners_mutex_);
    return listeners_.size();
}

void SpeechContext::dispatch(SpeechEvent event) {
    std::lock_guard<std::recursive_mutex> lock(dispatch_mutex_);
    dispatch_locked(event);
}

void SpeechContext::dispatch_locked(SpeechEvent event) {
    std::vector<ListenerEntry> targets;
    {
        std::lock_guard<std::mutex> lock(listeners_mutex_);
        targets = listeners_;
    }

    // Payloads are read (and pending values consumed) once per event, even
    // when nobody is listening.
    std::function<void(SpeechListener&)> deliver;
    switch (event) {
        case SpeechEvent::Initialized:
            deliver = [](SpeechListener& l) { l.on_init(); };
            break;
        case SpeechEvent::Started:
            deliver = [](SpeechListener& l) { l.on_start(); };
            break;
        case SpeechEvent::Stopped:
            deliver = [](SpeechListener& l) { l.on_stop(); };
            break;
        case SpeechEvent::Activated:
            deliver = [](SpeechListener& l) { l.on_activate(); };
            break;
        case SpeechEvent::Deactivated:
            deliver = [](SpeechListener& l) { l.on_deactivate(); };
            break;
        case SpeechEvent::Recognized: {
            RecognitionSnapshot snap = snapshot();
            deliver = [snap](SpeechListener& l) { l.on_recognize(snap); };
            break;
        }
        case SpeechEvent::PartialRecognized: {
            RecognitionSnapshot snap = snapshot();
            deliver = [snap](SpeechListener& l) { l.on_partial_recognize(snap); };
            break;
        }
        case SpeechEvent::TimedOut:
            deliver = [](SpeechListener& l) { l.on_timeout(); };
            break;
        case SpeechEvent::Traced: {
            std::optional<std::string> message;
            {
                std::lock_guard<std::mutex> lock(state_mutex_);
                message.swap(pending_trace_);
            }
            if (!message) return;  // Nothing set, nothing to deliver
            std::string text = *message;
            deliver = [text](SpeechListener& l) { l.on_trace(text); };
            break;
        }
        case SpeechEvent::Errored: {
            std::optional<core::SpeechError> error;
            {
                std::lock_guard<std::mutex> lock(state_mutex_);
                error.swap(pending_error_);
            }
            if (!error) {
                core::log_error("Pipeline", "errored dispatched with no pending error");
                error = core::SpeechError(core::SpeechError::Kind::State, "error not set",
                                          "errored was dispatched before an error was set");
            }
            core::SpeechError value = *error;
            deliver = [value](SpeechListener& l) { l.on_error(value); };
            break;
        }
    }

    for (const auto& entry : targets) {
        std::shared_ptr<SpeechListener> listener = entry.second;
        executor_->post([listener, deliver]() { deliver(*listener); });
    }
}

} // namespace pipeline
