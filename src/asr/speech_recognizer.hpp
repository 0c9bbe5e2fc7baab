#pragma once

#include "asr/recognition_session.hpp"
#include "pipeline/speech_context.hpp"
#include "pipeline/speech_stage.hpp"

#include <memory>

namespace asr {

/**
 * @brief Speech-to-text stage active for the length of an activation
 *
 * Opens a request when the pipeline activates and forwards frames to it.
 * Partial results dispatch PartialRecognized; the final result dispatches
 * Recognized and ends the activation. After wake_active_min_ms a speech
 * falling edge asks the backend for its final result; an activation
 * longer than wake_active_max_ms dispatches TimedOut instead.
 */
class SpeechRecognizer : public pipeline::SpeechStage {
public:
    SpeechRecognizer(pipeline::SpeechContext& context,
                     audio::AudioHardware& hardware,
                     std::shared_ptr<IRecognitionBackend> backend);

    const char* name() const override { return "speech_recognizer"; }
    bool start_streaming() override;
    void stop_streaming() override;
    void process(const audio::Frame& frame) override;

    const RecognitionSession& session() const { return session_; }

private:
    void on_result(const RecognitionResult& result);

    pipeline::SpeechContext& context_;
    std::shared_ptr<IRecognitionBackend> backend_;
    int frame_width_ms_;
    int active_min_ms_;
    int active_max_ms_;

    // Frame-thread state
    bool started_ = false;
    bool engaged_ = false;
    bool requested_ = false;   // session asked to stream for this activation
    bool was_speech_ = false;
    bool finish_requested_ = false;
    int active_ms_ = 0;

    RecognitionSession session_;
};

} // namespace asr
