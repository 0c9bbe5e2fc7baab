#pragma once

#include "pipeline/speech_context.hpp"
#include "pipeline/speech_stage.hpp"

namespace vad {

/**
 * @brief Activates the pipeline on voice activity instead of a wakeword
 *
 * Must follow a VAD stage. A speech rising edge while inactive activates;
 * ending the activation is left to the recognizer that follows.
 */
class VadTrigger : public pipeline::SpeechStage {
public:
    explicit VadTrigger(pipeline::SpeechContext& context);

    const char* name() const override { return "vad_trigger"; }
    bool start_streaming() override;
    void stop_streaming() override;
    void process(const audio::Frame& frame) override;

private:
    pipeline::SpeechContext& context_;
    bool started_ = false;
    bool was_speech_ = false;
};

} // namespace vad
