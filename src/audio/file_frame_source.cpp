#include "audio/file_frame_source.hpp"
#include "core/logging.hpp"

#include <algorithm>
#include <chrono>
#include <utility>

namespace audio {

FileFrameSource::FileFrameSource(const FrameFormat& format, Options options)
    : format_(format)
    , options_(std::move(options)) {
}

FileFrameSource::~FileFrameSource() {
    stop();
    if (capture_thread_ && capture_thread_->joinable()) {
        capture_thread_->join();
    }
}

void FileFrameSource::set_error_callback(SourceErrorCallback callback) {
    std::lock_guard<std::mutex> lock(callback_mutex_);
    on_error_ = std::move(callback);
}

bool FileFrameSource::start(FrameCallback on_frame) {
    if (is_capturing_.load()) {
        return true;  // Already capturing
    }

    // Join a previous run that reached end of file on its own
    if (capture_thread_ && capture_thread_->joinable()) {
        capture_thread_->join();
    }
    capture_thread_.reset();

    std::string reason;
    if (!read_wav(options_.path, format_.sample_rate, clip_, &reason)) {
        std::lock_guard<std::mutex> lock(callback_mutex_);
        core::log_error("FileFrameSource", "failed to load WAV file: " + reason);
        if (on_error_) {
            on_error_("Failed to load WAV file: " + reason, true);
        }
        return false;
    }
    cursor_ = 0;
    core::log_info("FileFrameSource", "replaying " + options_.path + " (" +
                   std::to_string(clip_.duration_seconds()) + " s, source " +
                   std::to_string(clip_.source_sample_rate) + " Hz x" +
                   std::to_string(clip_.source_channels) + ")");

    {
        std::lock_guard<std::mutex> lock(callback_mutex_);
        on_frame_ = std::move(on_frame);
    }
    frames_delivered_.store(0);
    should_stop_.store(false);
    is_capturing_.store(true);

    capture_thread_ = std::make_unique<std::thread>(
        &FileFrameSource::capture_thread_func, this
    );

    return true;
}

void FileFrameSource::stop() {
    should_stop_.store(true);

    if (capture_thread_ && capture_thread_->joinable() &&
        capture_thread_->get_id() != std::this_thread::get_id()) {
        capture_thread_->join();
        capture_thread_.reset();
    }

    is_capturing_.store(false);
    std::lock_guard<std::mutex> lock(callback_mutex_);
    on_frame_ = nullptr;
}

void FileFrameSource::wait_until_finished() {
    if (options_.loop) return;
    if (capture_thread_ && capture_thread_->joinable() &&
        capture_thread_->get_id() != std::this_thread::get_id()) {
        capture_thread_->join();
        capture_thread_.reset();
    }
}

// Copies the next frame from the clip, zero-padding a partial last frame
bool FileFrameSource::next_frame(Frame& frame) {
    if (cursor_ >= clip_.samples.size()) {
        return false;
    }
    const size_t n = std::min(frame.size(), clip_.samples.size() - cursor_);
    std::fill(std::copy_n(clip_.samples.begin() + cursor_, n, frame.begin()), frame.end(), int16_t{0});
    cursor_ += n;
    return true;
}

void FileFrameSource::capture_thread_func() {
    const size_t frame_samples = format_.frame_samples();
    const auto frame_duration = std::chrono::milliseconds(format_.frame_width_ms);
    size_t silence_frames = static_cast<size_t>(options_.trailing_silence_ms / std::max(1, format_.frame_width_ms));
    auto next_frame_time = std::chrono::steady_clock::now();

    Frame frame(frame_samples, 0);
    while (!should_stop_.load()) {
        if (!next_frame(frame)) {
            if (options_.loop && !clip_.samples.empty()) {
                cursor_ = 0;
                continue;
            }
            if (silence_frames == 0) {
                break;  // End of file
            }
            frame.assign(frame_samples, 0);
            --silence_frames;
        }

        {
            std::lock_guard<std::mutex> lock(callback_mutex_);
            if (on_frame_) {
                on_frame_(frame);
            }
        }
        frames_delivered_.fetch_add(1);

        if (options_.realtime) {
            next_frame_time += frame_duration;
            std::this_thread::sleep_until(next_frame_time);
        }
    }

    core::log_debug("FileFrameSource", "delivered " + std::to_string(frames_delivered_.load()) + " frames");
    is_capturing_.store(false);
}

} // namespace audio
