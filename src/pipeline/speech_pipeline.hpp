#pragma once

#include "audio/audio_hardware.hpp"
#include "audio/frame_source.hpp"
#include "core/config.hpp"
#include "core/executor.hpp"
#include "pipeline/speech_context.hpp"
#include "pipeline/speech_listener.hpp"
#include "pipeline/speech_stage.hpp"

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <vector>

namespace pipeline {

/// Creates a stage bound to the pipeline's context and hardware handle
using StageFactory = std::function<std::unique_ptr<SpeechStage>(SpeechContext&, audio::AudioHardware&)>;

/**
 * @brief Ordered chain of speech stages driven by a frame source
 *
 * Owns the context, the stages and the audio hardware handle it lends to
 * them. start()/stop() are idempotent: repeated calls produce one lifecycle
 * event. Frames from the source are handed to every stage in order.
 *
 * Usage:
 * @code
 *   auto pipeline = SpeechPipelineBuilder()
 *       .use_profile(Profile::WakewordSpeech)
 *       .set_wakeword_backend(keyword_backend)
 *       .set_speech_backend(whisper_backend)
 *       .add_listener(listener)
 *       .build();
 *   pipeline->start();
 * @endcode
 */
class SpeechPipeline {
public:
    SpeechPipeline(const core::SpeechConfig& config,
                   std::shared_ptr<core::Executor> executor,
                   std::shared_ptr<audio::IFrameSource> source,
                   const std::vector<StageFactory>& stages,
                   const std::vector<std::shared_ptr<SpeechListener>>& listeners = {});
    ~SpeechPipeline();

    SpeechPipeline(const SpeechPipeline&) = delete;
    SpeechPipeline& operator=(const SpeechPipeline&) = delete;

    /// Start every stage, then the frame source; dispatches Started once.
    void start();

    /// Stop every stage, then the frame source; dispatches Stopped once.
    void stop();

    /// Open an activation window without a wakeword (push-to-talk).
    /// No-op while already active.
    void activate();

    /// Close the activation window. Always dispatches Deactivated.
    void deactivate();

    bool is_started() const { return is_started_.load(); }

    SpeechContext& context() { return context_; }
    const core::SpeechConfig& configuration() const { return context_.config(); }
    audio::IFrameSource& frame_source() { return *source_; }
    audio::AudioHardware& hardware() { return hardware_; }

    size_t stage_count() const { return stages_.size(); }
    SpeechStage& stage(size_t index) { return *stages_.at(index); }

private:
    void on_frame(const audio::Frame& frame);
    void on_source_error(const std::string& message, bool is_fatal);

    SpeechContext context_;
    audio::AudioHardware hardware_;
    std::shared_ptr<audio::IFrameSource> source_;
    std::vector<std::unique_ptr<SpeechStage>> stages_;

    std::mutex lifecycle_mutex_;
    std::atomic<bool> is_started_{false};

    // Held while a frame is fanned out; stop() takes it so that no stage
    // sees a frame after its stop_streaming()
    std::mutex frame_mutex_;
    bool delivering_ = false;
    size_t frame_samples_;
};

} // namespace pipeline
