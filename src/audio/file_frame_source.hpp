#pragma once

#include "audio/frame_source.hpp"
#include "audio/wav_reader.hpp"

#include <atomic>
#include <memory>
#include <mutex>
#include <thread>

namespace audio {

/**
 * @brief Frame source that replays a WAV file as if it were a microphone
 *
 * Features:
 * - Decodes the whole file up front (downmix and resample via read_wav)
 * - Delivers frames in real time (sleep per frame) or as fast as possible
 * - Can loop for continuous testing
 * - Trailing silence can be appended so the pipeline sees speech end
 */
class FileFrameSource : public IFrameSource {
public:
    struct Options {
        std::string path;
        bool realtime = true;       ///< Pace delivery at the frame rate
        bool loop = false;          ///< Restart from the beginning at end of file
        int trailing_silence_ms = 0;
    };

    FileFrameSource(const FrameFormat& format, Options options);
    ~FileFrameSource() override;

    bool start(FrameCallback on_frame) override;
    void stop() override;
    bool is_capturing() const override { return is_capturing_.load(); }
    FrameFormat format() const override { return format_; }
    void set_error_callback(SourceErrorCallback callback) override;

    /// Blocks until the file has been fully delivered (non-looping only)
    void wait_until_finished();

    size_t frames_delivered() const { return frames_delivered_.load(); }

private:
    void capture_thread_func();
    bool next_frame(Frame& frame);

    FrameFormat format_;
    Options options_;
    WavClip clip_;
    size_t cursor_ = 0;
    FrameCallback on_frame_;
    SourceErrorCallback on_error_;
    std::mutex callback_mutex_;

    // Threading
    std::unique_ptr<std::thread> capture_thread_;
    std::atomic<bool> is_capturing_{false};
    std::atomic<bool> should_stop_{false};
    std::atomic<size_t> frames_delivered_{0};
};

} // namespace audio
