#include "vad/energy_vad.hpp"
#include "core/logging.hpp"

#include <algorithm>

namespace vad {

namespace {
int frames_for(int ms, int frame_width_ms) {
    // Round up so that a 30 ms rise at 20 ms frames needs two frames
    return std::max(1, (ms + frame_width_ms - 1) / frame_width_ms);
}
}

EnergyVad::EnergyVad(pipeline::SpeechContext& context)
    : context_(context)
    , threshold_dbfs_(context.config().vad_threshold_dbfs)
    , rise_frames_(frames_for(context.config().vad_rise_ms, context.config().frame_width))
    , fall_frames_(frames_for(context.config().vad_fall_ms, context.config().frame_width)) {
}

bool EnergyVad::start_streaming() {
    if (started_) return true;
    started_ = true;
    is_speech_ = false;
    voiced_run_ = 0;
    unvoiced_run_ = 0;
    return true;
}

void EnergyVad::stop_streaming() {
    if (!started_) return;
    started_ = false;
    if (is_speech_) {
        is_speech_ = false;
        context_.set_speech_detected(false);
    }
}

void EnergyVad::process(const audio::Frame& frame) {
    if (!started_) return;

    last_dbfs_ = audio::frame_dbfs(frame);
    const bool voiced = last_dbfs_ > threshold_dbfs_;

    if (voiced) {
        ++voiced_run_;
        unvoiced_run_ = 0;
    } else {
        ++unvoiced_run_;
        voiced_run_ = 0;
    }

    if (!is_speech_ && voiced_run_ >= rise_frames_) {
        is_speech_ = true;
        context_.set_speech_detected(true);
        context_.trace(core::TraceLevel::Debug, "vad: speech rising at " + std::to_string(last_dbfs_) + " dBFS");
    } else if (is_speech_ && unvoiced_run_ >= fall_frames_) {
        is_speech_ = false;
        context_.set_speech_detected(false);
        context_.trace(core::TraceLevel::Debug, "vad: speech falling");
    }
}

} // namespace vad
