#pragma once

#include "asr/recognition_backend.hpp"
#include "audio/frame_source.hpp"
#include "core/config.hpp"
#include "core/executor.hpp"
#include "pipeline/speech_listener.hpp"
#include "pipeline/speech_pipeline.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace pipeline {

/**
 * @brief Predefined stage chains
 */
enum class Profile {
    WakewordSpeech,     ///< EnergyVad -> WakewordRecognizer -> SpeechRecognizer
    VadTriggerSpeech,   ///< EnergyVad -> VadTrigger -> SpeechRecognizer
    PushToTalkSpeech    ///< SpeechRecognizer, activated by SpeechPipeline::activate()
};

const char* to_string(Profile profile);

/// Parses "wakeword", "vad" or "ptt"; throws core::ConfigurationError
Profile parse_profile(const std::string& name);

/**
 * @brief Assembles a SpeechPipeline from a profile, options and backends
 *
 * build() throws core::ConfigurationError when no profile was selected, an
 * option is out of range, or a backend the profile needs is missing.
 */
class SpeechPipelineBuilder {
public:
    SpeechPipelineBuilder& use_profile(Profile profile);
    SpeechPipelineBuilder& set_property(const std::string& key, const std::string& value);
    SpeechPipelineBuilder& set_configuration(const core::SpeechConfig& config);
    SpeechPipelineBuilder& set_delivery_executor(std::shared_ptr<core::Executor> executor);
    SpeechPipelineBuilder& add_listener(std::shared_ptr<SpeechListener> listener);
    SpeechPipelineBuilder& set_frame_source(std::shared_ptr<audio::IFrameSource> source);
    SpeechPipelineBuilder& set_wakeword_backend(std::shared_ptr<asr::IRecognitionBackend> backend);
    SpeechPipelineBuilder& set_speech_backend(std::shared_ptr<asr::IRecognitionBackend> backend);

    const core::SpeechConfig& configuration() const { return config_; }

    std::unique_ptr<SpeechPipeline> build() const;

private:
    std::optional<Profile> profile_;
    core::SpeechConfig config_;
    std::shared_ptr<core::Executor> executor_;
    std::vector<std::shared_ptr<SpeechListener>> listeners_;
    std::shared_ptr<audio::IFrameSource> source_;
    std::shared_ptr<asr::IRecognitionBackend> wakeword_backend_;
    std::shared_ptr<asr::IRecognitionBackend> speech_backend_;
};

} // namespace pipeline
