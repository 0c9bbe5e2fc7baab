#pragma once

#include "asr/recognition_session.hpp"
#include "pipeline/speech_context.hpp"
#include "pipeline/speech_stage.hpp"

#include <memory>

#include <string>
#include <vector>

namespace wakeword {

/**
 * @brief Listens for a wake phrase while the pipeline is inactive
 *
 * Opens a recognition request once speech is detected and keeps it open
 * (restarting it at the backend's duration limit) until the pipeline
 * activates. Any result whose lower-cased transcript contains one of the
 * configured wake phrases activates the pipeline.
 */
class WakewordRecognizer : public pipeline::SpeechStage {
public:
    WakewordRecognizer(pipeline::SpeechContext& context,
                       audio::AudioHardware& hardware,
                       std::shared_ptr<asr::IRecognitionBackend> backend);

    const char* name() const override { return "wakeword"; }
    bool start_streaming() override;
    void stop_streaming() override;
    void process(const audio::Frame& frame) override;

    const asr::RecognitionSession& session() const { return session_; }

    /// True when `transcript` contains any of `phrases` (case-insensitive).
    static bool matches(const std::string& transcript, const std::vector<std::string>& phrases);

private:
    void on_result(const asr::RecognitionResult& result);

    pipeline::SpeechContext& context_;
    std::shared_ptr<asr::IRecognitionBackend> backend_;
    std::vector<std::string> phrases_;
    bool started_ = false;
    asr::RecognitionSession session_;
};

} // namespace wakeword
