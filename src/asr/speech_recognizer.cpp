#include "asr/speech_recognizer.hpp"

namespace asr {

namespace {
RecognitionSession::Options session_options(const core::SpeechConfig& config) {
    RecognitionSession::Options options;
    options.name = "asr";
    options.request_timeout = std::chrono::milliseconds(config.speech_request_timeout_ms);
    options.lock_timeout = std::chrono::milliseconds(config.lock_timeout_ms);
    return options;
}
} // namespace

SpeechRecognizer::SpeechRecognizer(pipeline::SpeechContext& context,
                                   audio::AudioHardware& hardware,
                                   std::shared_ptr<IRecognitionBackend> backend)
    : context_(context)
    , backend_(std::move(backend))
    , frame_width_ms_(context.config().frame_width)
    , active_min_ms_(context.config().wake_active_min_ms)
    , active_max_ms_(context.config().wake_active_max_ms)
    , session_(session_options(context.config()), *backend_, hardware, context,
               [this](const RecognitionResult& result) { on_result(result); }) {
}

bool SpeechRecognizer::start_streaming() {
    started_ = true;
    return true;
}

void SpeechRecognizer::stop_streaming() {
    if (!started_) return;
    started_ = false;
    engaged_ = false;
    session_.stop_streaming();
}

void SpeechRecognizer::process(const audio::Frame& frame) {
    if (!started_) return;

    const bool speech = context_.is_speech_detected();
    if (!context_.is_active()) {
        if (engaged_) {
            // Activation ended elsewhere; abandon the request
            engaged_ = false;
            session_.stop_streaming();
        }
        was_speech_ = speech;
        return;
    }

    if (!engaged_) {
        engaged_ = true;
        active_ms_ = 0;
        finish_requested_ = false;
        was_speech_ = speech;
        requested_ = false;
    }
    if (!requested_) {
        // A start skipped on a lock timeout changed nothing; try on the next frame
        requested_ = session_.start_streaming() || session_.should_be_streaming();
    }

    session_.append(frame);
    active_ms_ += frame_width_ms_;

    if (active_ms_ > active_max_ms_) {
        context_.trace(core::TraceLevel::Info, "asr: activation timed out after " + std::to_string(active_ms_) + " ms");
        engaged_ = false;
        session_.stop_streaming();
        context_.dispatch(pipeline::SpeechEvent::TimedOut);
        context_.deactivate();
        return;
    }

    if (!finish_requested_ && active_ms_ >= active_min_ms_ && was_speech_ && !speech) {
        finish_requested_ = session_.finish();
    }
    was_speech_ = speech;
}

void SpeechRecognizer::on_result(const RecognitionResult& result) {
    if (!result.is_final) {
        context_.set_recognition(result.transcript, result.confidence);
        context_.dispatch(pipeline::SpeechEvent::PartialRecognized);
        return;
    }

    if (result.transcript.empty()) {
        context_.trace(core::TraceLevel::Info, "asr: no speech recognized");
        context_.dispatch(pipeline::SpeechEvent::TimedOut);
    } else {
        context_.set_recognition(result.transcript, result.confidence);
        context_.dispatch(pipeline::SpeechEvent::Recognized);
    }
    context_.deactivate();
}

} // namespace asr
