#pragma once

#include "audio/frame_source.hpp"
#include "core/ring_buffer.hpp"

#include <atomic>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

typedef void PaStream;

namespace audio {

/**
 * @brief Metadata about a PortAudio input device
 */
struct InputDeviceInfo {
    int index = -1;               // PortAudio device index
    std::string name;             // Human-readable name
    std::string host_api;         // "ALSA", "PulseAudio", "CoreAudio", ...
    double default_sample_rate = 0.0;
    int max_channels = 0;
    bool is_default = false;
};

/**
 * @brief Microphone frame source backed by PortAudio
 *
 * The PortAudio callback only copies samples into a lock-free ring; a
 * delivery thread cuts fixed-size frames and hands them to the pipeline, so
 * stage work never runs on the audio callback.
 */
class PortAudioFrameSource : public IFrameSource {
public:
    /// device_index < 0 selects the default input device
    PortAudioFrameSource(const FrameFormat& format, int buffer_width_ms, int device_index = -1);
    ~PortAudioFrameSource() override;

    PortAudioFrameSource(const PortAudioFrameSource&) = delete;
    PortAudioFrameSource& operator=(const PortAudioFrameSource&) = delete;

    bool start(FrameCallback on_frame) override;
    void stop() override;
    bool is_capturing() const override { return is_capturing_.load(); }
    FrameFormat format() const override { return format_; }
    void set_error_callback(SourceErrorCallback callback) override;

    size_t overrun_samples() const { return ring_.overrun_samples(); }

    static std::vector<InputDeviceInfo> list_input_devices();

private:
    static int stream_callback(const void* input, void* output, unsigned long frame_count,
                               const void* time_info, unsigned long status_flags, void* user_data);
    void delivery_thread_func();
    void report_error(const std::string& message, bool is_fatal);

    FrameFormat format_;
    int device_index_;
    core::RingBufferI16 ring_;
    FrameCallback on_frame_;
    SourceErrorCallback on_error_;
    std::mutex callback_mutex_;

    PaStream* stream_ = nullptr;
    bool pa_initialized_ = false;

    std::unique_ptr<std::thread> delivery_thread_;
    std::mutex wake_mutex_;
    std::condition_variable wake_cv_;
    std::atomic<bool> is_capturing_{false};
    std::atomic<bool> should_stop_{false};
};

} // namespace audio
