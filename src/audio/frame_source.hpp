#pragma once

#include "audio/frame.hpp"

#include <functional>
#include <string>

namespace audio {

/**
 * @brief Callback for each fixed-size frame
 *
 * Called from the source's delivery thread (or, for PushFrameSource, the
 * thread that pushed the audio).
 */
using FrameCallback = std::function<void(const Frame& frame)>;

/**
 * @brief Error callback for device issues
 *
 * @param error_message Human-readable error description
 * @param is_fatal If true, the source has stopped and needs restart
 */
using SourceErrorCallback = std::function<void(const std::string& error_message, bool is_fatal)>;

/**
 * @brief Abstract frame source driving the speech pipeline
 *
 * Implementations:
 * - PushFrameSource (host pushes PCM from its own capture path)
 * - FileFrameSource (WAV playback)
 * - PortAudioFrameSource (default microphone)
 *
 * The pipeline calls start()/stop() symmetrically with its own lifecycle.
 */
class IFrameSource {
public:
    virtual ~IFrameSource() = default;

    /**
     * @brief Begin delivering frames
     * @param on_frame Called once per frame of format().frame_samples() samples
     * @return true if started (or already running)
     */
    virtual bool start(FrameCallback on_frame) = 0;

    /**
     * @brief Stop delivering frames; no callback runs after this returns
     */
    virtual void stop() = 0;

    virtual bool is_capturing() const = 0;

    virtual FrameFormat format() const = 0;

    /**
     * @brief Install an error callback for runtime device failures
     */
    virtual void set_error_callback(SourceErrorCallback callback) = 0;
};

} // namespace audio
