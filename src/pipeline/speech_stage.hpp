#pragma once

#include "audio/frame.hpp"

namespace pipeline {

/**
 * @brief One unit of the ordered processing chain
 *
 * The pipeline only ever sees stages through this interface. Frames arrive
 * on the frame source's thread, one at a time and never concurrently with
 * start_streaming()/stop_streaming().
 */
class SpeechStage {
public:
    virtual ~SpeechStage() = default;

    virtual const char* name() const = 0;

    /**
     * @brief Allocate per-session resources and begin accepting frames
     * @return false if the stage could not start; calling again while
     *         started is a no-op that returns true
     */
    virtual bool start_streaming() = 0;

    /**
     * @brief Release everything acquired since start_streaming(); no-op when
     *        not started
     */
    virtual void stop_streaming() = 0;

    /**
     * @brief Handle one fixed-size frame. Must return within about one frame
     *        period; long work goes to the recognition session or a backend
     *        worker thread.
     */
    virtual void process(const audio::Frame& frame) = 0;
};

} // namespace pipeline
