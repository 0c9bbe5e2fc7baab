#include "vad/vad_trigger.hpp"

namespace vad {

VadTrigger::VadTrigger(pipeline::SpeechContext& context)
    : context_(context) {
}

bool VadTrigger::start_streaming() {
    if (started_) return true;
    started_ = true;
    was_speech_ = false;
    return true;
}

void VadTrigger::stop_streaming() {
    started_ = false;
    was_speech_ = false;
}

void VadTrigger::process(const audio::Frame&) {
    if (!started_) return;

    const bool speech = context_.is_speech_detected();
    if (speech && !was_speech_) {
        if (!context_.is_active() && context_.activate()) {
            context_.trace(core::TraceLevel::Debug, "vad_trigger: activated on speech");
        }
    }
    was_speech_ = speech;
}

} // namespace vad
