#pragma once

#include "audio/frame_source.hpp"
#include "core/ring_buffer.hpp"

#include <atomic>
#include <mutex>

namespace audio {

/**
 * @brief Frame source fed by the host application
 *
 * The host pushes PCM16 chunks of any size from its own capture path; the
 * source cuts them into exact frames and delivers them synchronously on the
 * pushing thread. Audio pushed while stopped is discarded. A frame callback
 * must not call stop() on the same source.
 */
class PushFrameSource : public IFrameSource {
public:
    PushFrameSource(const FrameFormat& format, int buffer_width_ms);
    ~PushFrameSource() override;

    bool start(FrameCallback on_frame) override;
    void stop() override;
    bool is_capturing() const override { return is_capturing_.load(); }
    FrameFormat format() const override { return format_; }
    void set_error_callback(SourceErrorCallback callback) override;

    /**
     * @brief Push samples (mono, format().sample_rate)
     * @return Number of whole frames delivered by this call
     */
    size_t push(const int16_t* samples, size_t sample_count);

    /// Samples buffered but not yet delivered (less than one frame)
    size_t buffered_samples() const { return ring_.size(); }

private:
    FrameFormat format_;
    core::RingBufferI16 ring_;
    Frame scratch_;
    FrameCallback on_frame_;
    SourceErrorCallback on_error_;
    std::mutex delivery_mutex_;
    std::atomic<bool> is_capturing_{false};
};

} // namespace audio
