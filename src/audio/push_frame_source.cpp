#include "audio/push_frame_source.hpp"
#include "core/logging.hpp"

#include <algorithm>
#include <string>

namespace audio {

PushFrameSource::PushFrameSource(const FrameFormat& format, int buffer_width_ms)
    : format_(format)
    , ring_(std::max(format.frame_samples(),
                     static_cast<size_t>(format.sample_rate) * static_cast<size_t>(std::max(buffer_width_ms, 1)) / 1000))
    , scratch_(format.frame_samples()) {
}

PushFrameSource::~PushFrameSource() {
    stop();
}

bool PushFrameSource::start(FrameCallback on_frame) {
    std::lock_guard<std::mutex> lock(delivery_mutex_);
    if (is_capturing_.load()) {
        return true;  // Already capturing
    }
    on_frame_ = std::move(on_frame);
    ring_.clear();
    is_capturing_.store(true);
    core::log_debug("PushFrameSource", "started, frame_samples=" + std::to_string(scratch_.size()));
    return true;
}

void PushFrameSource::stop() {
    std::lock_guard<std::mutex> lock(delivery_mutex_);
    if (!is_capturing_.load()) {
        return;
    }
    is_capturing_.store(false);
    on_frame_ = nullptr;
    core::log_debug("PushFrameSource", "stopped, discarded " + std::to_string(ring_.size()) + " buffered samples");
}

void PushFrameSource::set_error_callback(SourceErrorCallback callback) {
    std::lock_guard<std::mutex> lock(delivery_mutex_);
    on_error_ = std::move(callback);
}

size_t PushFrameSource::push(const int16_t* samples, size_t sample_count) {
    if (!samples || sample_count == 0) return 0;

    std::lock_guard<std::mutex> lock(delivery_mutex_);
    if (!is_capturing_.load()) return 0;

    size_t delivered = 0;
    size_t offset = 0;
    // Only write what fits, then cut frames, so a chunk larger than the ring
    // still goes through whole.
    while (offset < sample_count) {
        const size_t room = ring_.capacity() - ring_.size();
        const size_t n = std::min(room, sample_count - offset);
        offset += ring_.push(samples + offset, n);
        while (ring_.pop_frame(scratch_.data(), scratch_.size())) {
            if (on_frame_) on_frame_(scratch_);
            ++delivered;
        }
    }
    return delivered;
}

} // namespace audio
