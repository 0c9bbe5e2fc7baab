#include "pipeline/pipeline_builder.hpp"
#include "asr/speech_recognizer.hpp"
#include "audio/push_frame_source.hpp"
#include "core/errors.hpp"
#include "core/logging.hpp"
#include "vad/energy_vad.hpp"
#include "vad/vad_trigger.hpp"
#include "wakeword/wakeword_recognizer.hpp"

namespace pipeline {

const char* to_string(Profile profile) {
    switch (profile) {
        case Profile::WakewordSpeech: return "wakeword";
        case Profile::VadTriggerSpeech: return "vad";
        case Profile::PushToTalkSpeech: return "ptt";
    }
    return "unknown";
}

Profile parse_profile(const std::string& name) {
    if (name == "wakeword") return Profile::WakewordSpeech;
    if (name == "vad") return Profile::VadTriggerSpeech;
    if (name == "ptt") return Profile::PushToTalkSpeech;
    throw core::ConfigurationError("unknown profile '" + name + "' (expected wakeword, vad or ptt)");
}

SpeechPipelineBuilder& SpeechPipelineBuilder::use_profile(Profile profile) {
    profile_ = profile;
    return *this;
}

SpeechPipelineBuilder& SpeechPipelineBuilder::set_property(const std::string& key, const std::string& value) {
    config_.set_property(key, value);
    return *this;
}

SpeechPipelineBuilder& SpeechPipelineBuilder::set_configuration(const core::SpeechConfig& config) {
    config_ = config;
    return *this;
}

SpeechPipelineBuilder& SpeechPipelineBuilder::set_delivery_executor(std::shared_ptr<core::Executor> executor) {
    executor_ = std::move(executor);
    return *this;
}

SpeechPipelineBuilder& SpeechPipelineBuilder::add_listener(std::shared_ptr<SpeechListener> listener) {
    listeners_.push_back(std::move(listener));
    return *this;
}

SpeechPipelineBuilder& SpeechPipelineBuilder::set_frame_source(std::shared_ptr<audio::IFrameSource> source) {
    source_ = std::move(source);
    return *this;
}

SpeechPipelineBuilder& SpeechPipelineBuilder::set_wakeword_backend(std::shared_ptr<asr::IRecognitionBackend> backend) {
    wakeword_backend_ = std::move(backend);
    return *this;
}

SpeechPipelineBuilder& SpeechPipelineBuilder::set_speech_backend(std::shared_ptr<asr::IRecognitionBackend> backend) {
    speech_backend_ = std::move(backend);
    return *this;
}

std::unique_ptr<SpeechPipeline> SpeechPipelineBuilder::build() const {
    if (!profile_) {
        throw core::ConfigurationError("no profile selected; call use_profile() before build()");
    }
    config_.validate();

    if (!speech_backend_) {
        throw core::ConfigurationError(std::string("profile '") + to_string(*profile_) + "' needs a speech backend");
    }
    if (*profile_ == Profile::WakewordSpeech && !wakeword_backend_) {
        throw core::ConfigurationError("profile 'wakeword' needs a wakeword backend");
    }

    audio::FrameFormat format;
    format.sample_rate = config_.sample_rate;
    format.frame_width_ms = config_.frame_width;

    std::shared_ptr<audio::IFrameSource> source = source_;
    if (!source) {
        source = std::make_shared<audio::PushFrameSource>(format, config_.buffer_width);
    } else {
        const audio::FrameFormat actual = source->format();
        if (actual.sample_rate != format.sample_rate || actual.frame_width_ms != format.frame_width_ms) {
            throw core::ConfigurationError("frame source delivers " + std::to_string(actual.sample_rate) + " Hz / " +
                                           std::to_string(actual.frame_width_ms) + " ms frames, configuration expects " +
                                           std::to_string(format.sample_rate) + " Hz / " +
                                           std::to_string(format.frame_width_ms) + " ms");
        }
    }

    std::shared_ptr<core::Executor> executor = executor_;
    if (!executor) {
        executor = std::make_shared<core::SerialExecutor>();
    }

    auto speech_backend = speech_backend_;
    auto wakeword_backend = wakeword_backend_;
    std::vector<StageFactory> stages;

    if (*profile_ != Profile::PushToTalkSpeech) {
        stages.push_back([](SpeechContext& context, audio::AudioHardware&) {
            return std::make_unique<vad::EnergyVad>(context);
        });
    }
    if (*profile_ == Profile::WakewordSpeech) {
        stages.push_back([wakeword_backend](SpeechContext& context, audio::AudioHardware& hardware) {
            return std::make_unique<wakeword::WakewordRecognizer>(context, hardware, wakeword_backend);
        });
    } else if (*profile_ == Profile::VadTriggerSpeech) {
        stages.push_back([](SpeechContext& context, audio::AudioHardware&) {
            return std::make_unique<vad::VadTrigger>(context);
        });
    }
    stages.push_back([speech_backend](SpeechContext& context, audio::AudioHardware& hardware) {
        return std::make_unique<asr::SpeechRecognizer>(context, hardware, speech_backend);
    });

    core::log_info("Builder", std::string("building '") + to_string(*profile_) + "' pipeline");
    return std::make_unique<SpeechPipeline>(config_, executor, source, stages, listeners_);
}

} // namespace pipeline
