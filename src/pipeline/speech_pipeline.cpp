#include "pipeline/speech_pipeline.hpp"
#include "core/logging.hpp"

namespace pipeline {

SpeechPipeline::SpeechPipeline(const core::SpeechConfig& config,
                               std::shared_ptr<core::Executor> executor,
                               std::shared_ptr<audio::IFrameSource> source,
                               const std::vector<StageFactory>& stages,
                               const std::vector<std::shared_ptr<SpeechListener>>& listeners)
    : context_(config, std::move(executor))
    , source_(std::move(source))
    , frame_samples_(config.frame_samples()) {
    if (!source_) {
        throw core::ConfigurationError("speech pipeline needs a frame source");
    }
    for (const auto& factory : stages) {
        auto stage = factory(context_, hardware_);
        if (!stage) {
            throw core::ConfigurationError("stage factory returned no stage");
        }
        stages_.push_back(std::move(stage));
    }
    for (const auto& listener : listeners) {
        context_.add_listener(listener);
    }

    source_->set_error_callback([this](const std::string& message, bool is_fatal) {
        on_source_error(message, is_fatal);
    });

    core::log_info("Pipeline", "initialized with " + std::to_string(stages_.size()) + " stages");
    context_.dispatch(SpeechEvent::Initialized);
}

SpeechPipeline::~SpeechPipeline() {
    stop();
    source_->set_error_callback(nullptr);
    context_.remove_listeners();
}

void SpeechPipeline::start() {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    if (is_started_.load()) {
        core::log_debug("Pipeline", "start ignored, already started");
        return;
    }

    for (auto& stage : stages_) {
        if (!stage->start_streaming()) {
            core::log_warn("Pipeline", std::string("stage ") + stage->name() + " failed to start");
        }
    }

    {
        std::lock_guard<std::mutex> frame_lock(frame_mutex_);
        delivering_ = true;
    }
    if (!source_->start([this](const audio::Frame& frame) { on_frame(frame); })) {
        // Source errors are reported through on_source_error; the pipeline
        // stays started so that stop() still tears the stages down.
        core::log_error("Pipeline", "frame source failed to start");
    }

    is_started_.store(true);
    core::log_info("Pipeline", "started");
    context_.dispatch(SpeechEvent::Started);
}

void SpeechPipeline::stop() {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    if (!is_started_.load()) {
        return;
    }

    {
        // Waits for an in-flight frame to finish
        std::lock_guard<std::mutex> frame_lock(frame_mutex_);
        delivering_ = false;
        for (auto& stage : stages_) {
            stage->stop_streaming();
        }
    }
    source_->stop();

    is_started_.store(false);
    core::log_info("Pipeline", "stopped");
    context_.dispatch(SpeechEvent::Stopped);
}

void SpeechPipeline::activate() {
    // Speech first, so a stage never sees an activation without it
    context_.set_speech_detected(true);
    if (!context_.try_activate()) {
        return;
    }
    context_.dispatch(SpeechEvent::Activated);
}

void SpeechPipeline::deactivate() {
    context_.deactivate();
}

void SpeechPipeline::on_frame(const audio::Frame& frame) {
    std::lock_guard<std::mutex> lock(frame_mutex_);
    if (!delivering_) {
        return;
    }
    if (frame.size() != frame_samples_) {
        core::log_warn("Pipeline", "dropping frame of " + std::to_string(frame.size()) +
                       " samples, expected " + std::to_string(frame_samples_));
        return;
    }
    for (auto& stage : stages_) {
        stage->process(frame);
    }
}

void SpeechPipeline::on_source_error(const std::string& message, bool is_fatal) {
    if (!is_fatal) {
        context_.trace(core::TraceLevel::Info, "frame source: " + message);
        return;
    }
    context_.report_error(core::SpeechError(core::SpeechError::Kind::State, message, "frame source"));
}

} // namespace pipeline
