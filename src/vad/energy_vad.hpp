#pragma once

#include "pipeline/speech_context.hpp"
#include "pipeline/speech_stage.hpp"

namespace vad {

/**
 * @brief Energy-threshold voice activity detector
 *
 * Marks a frame voiced when its RMS level exceeds vad_threshold_dbfs.
 * Speech rises after vad_rise_ms of consecutive voiced frames and falls
 * after vad_fall_ms of consecutive unvoiced frames; the result is written
 * to the context's speech flag.
 */
class EnergyVad : public pipeline::SpeechStage {
public:
    explicit EnergyVad(pipeline::SpeechContext& context);

    const char* name() const override { return "energy_vad"; }
    bool start_streaming() override;
    void stop_streaming() override;
    void process(const audio::Frame& frame) override;

    /// Current debounced decision
    bool is_speech() const { return is_speech_; }

    /// Level of the last processed frame
    double last_dbfs() const { return last_dbfs_; }

private:
    pipeline::SpeechContext& context_;
    double threshold_dbfs_;
    int rise_frames_;
    int fall_frames_;

    bool started_ = false;
    bool is_speech_ = false;
    int voiced_run_ = 0;
    int unvoiced_run_ = 0;
    double last_dbfs_ = -120.0;
};

} // namespace vad
