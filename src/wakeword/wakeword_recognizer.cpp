#include "wakeword/wakeword_recognizer.hpp"

#include <algorithm>
#include <cctype>

namespace wakeword {

namespace {
std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

asr::RecognitionSession::Options session_options(const core::SpeechConfig& config) {
    asr::RecognitionSession::Options options;
    options.name = "wakeword";
    options.request_timeout = std::chrono::milliseconds(config.wakeword_request_timeout_ms);
    options.lock_timeout = std::chrono::milliseconds(config.lock_timeout_ms);
    return options;
}
} // namespace

WakewordRecognizer::WakewordRecognizer(pipeline::SpeechContext& context,
                                       audio::AudioHardware& hardware,
                                       std::shared_ptr<asr::IRecognitionBackend> backend)
    : context_(context)
    , backend_(std::move(backend))
    , session_(session_options(context.config()), *backend_, hardware, context,
               [this](const asr::RecognitionResult& result) { on_result(result); }) {
    for (const auto& phrase : context.config().wake_phrase_list()) {
        phrases_.push_back(to_lower(phrase));
    }
}

bool WakewordRecognizer::start_streaming() {
    started_ = true;
    return true;
}

void WakewordRecognizer::stop_streaming() {
    if (!started_) return;
    started_ = false;
    session_.stop_streaming();
}

void WakewordRecognizer::process(const audio::Frame& frame) {
    if (!started_) return;

    if (context_.is_active()) {
        // Another stage owns the activation window; stop listening
        if (session_.should_be_streaming() || session_.state() != asr::SessionState::Idle) {
            session_.stop_streaming();
        }
        return;
    }

    if (context_.is_speech_detected() && !session_.should_be_streaming()) {
        session_.start_streaming();
    }
    session_.append(frame);
}

bool WakewordRecognizer::matches(const std::string& transcript, const std::vector<std::string>& phrases) {
    const std::string heard = to_lower(transcript);
    for (const auto& phrase : phrases) {
        if (!phrase.empty() && heard.find(to_lower(phrase)) != std::string::npos) {
            return true;
        }
    }
    return false;
}

void WakewordRecognizer::on_result(const asr::RecognitionResult& result) {
    if (!matches(result.transcript, phrases_)) {
        return;
    }
    if (context_.activate()) {
        context_.trace(core::TraceLevel::Info, "wakeword: heard '" + result.transcript + "'");
    }
}

} // namespace wakeword
