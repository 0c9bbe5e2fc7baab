#include "audio/portaudio_frame_source.hpp"
#include "core/logging.hpp"

#include <portaudio.h>

#include <algorithm>
#include <chrono>

namespace audio {

PortAudioFrameSource::PortAudioFrameSource(const FrameFormat& format, int buffer_width_ms, int device_index)
    : format_(format)
    , device_index_(device_index)
    , ring_(std::max(format.frame_samples() * 2,
                     static_cast<size_t>(format.sample_rate) * static_cast<size_t>(std::max(buffer_width_ms, 1)) / 1000)) {
}

PortAudioFrameSource::~PortAudioFrameSource() {
    stop();
}

void PortAudioFrameSource::set_error_callback(SourceErrorCallback callback) {
    std::lock_guard<std::mutex> lock(callback_mutex_);
    on_error_ = std::move(callback);
}

void PortAudioFrameSource::report_error(const std::string& message, bool is_fatal) {
    core::log_error("PortAudio", message);
    std::lock_guard<std::mutex> lock(callback_mutex_);
    if (on_error_) on_error_(message, is_fatal);
}

int PortAudioFrameSource::stream_callback(const void* input, void*, unsigned long frame_count,
                                          const void*, unsigned long, void* user_data) {
    auto* self = static_cast<PortAudioFrameSource*>(user_data);
    const int16_t* in = static_cast<const int16_t*>(input);
    if (in) {
        self->ring_.push(in, frame_count);
        self->wake_cv_.notify_one();
    }
    return paContinue;
}

bool PortAudioFrameSource::start(FrameCallback on_frame) {
    if (is_capturing_.load()) {
        return true;  // Already capturing
    }

    PaError err = Pa_Initialize();
    if (err != paNoError) {
        report_error(std::string("failed to initialize PortAudio: ") + Pa_GetErrorText(err), true);
        return false;
    }
    pa_initialized_ = true;

    int device = (device_index_ >= 0) ? device_index_ : Pa_GetDefaultInputDevice();
    if (device == paNoDevice || device < 0 || device >= Pa_GetDeviceCount()) {
        report_error("no valid input device found", true);
        Pa_Terminate();
        pa_initialized_ = false;
        return false;
    }

    const PaDeviceInfo* dev_info = Pa_GetDeviceInfo(device);

    PaStreamParameters input_params;
    input_params.device = device;
    input_params.channelCount = 1;
    input_params.sampleFormat = paInt16;
    input_params.suggestedLatency = dev_info->defaultLowInputLatency;
    input_params.hostApiSpecificStreamInfo = nullptr;

    ring_.clear();
    err = Pa_OpenStream(&stream_,
                        &input_params,
                        nullptr,
                        format_.sample_rate,
                        static_cast<unsigned long>(format_.frame_samples()),
                        paNoFlag,
                        [](const void* input, void* output, unsigned long frame_count,
                           const PaStreamCallbackTimeInfo* time_info, PaStreamCallbackFlags flags,
                           void* user_data) -> int {
                            return PortAudioFrameSource::stream_callback(input, output, frame_count,
                                                                         time_info, flags, user_data);
                        },
                        this);
    if (err != paNoError || !stream_) {
        report_error(std::string("could not open mic stream: ") + Pa_GetErrorText(err), true);
        stream_ = nullptr;
        Pa_Terminate();
        pa_initialized_ = false;
        return false;
    }

    {
        std::lock_guard<std::mutex> lock(callback_mutex_);
        on_frame_ = std::move(on_frame);
    }
    should_stop_.store(false);
    is_capturing_.store(true);
    delivery_thread_ = std::make_unique<std::thread>(&PortAudioFrameSource::delivery_thread_func, this);

    err = Pa_StartStream(stream_);
    if (err != paNoError) {
        report_error(std::string("could not start mic stream: ") + Pa_GetErrorText(err), true);
        stop();
        return false;
    }

    core::log_info("PortAudio", std::string("capturing from '") + dev_info->name + "' at " +
                   std::to_string(format_.sample_rate) + " Hz");
    return true;
}

void PortAudioFrameSource::stop() {
    if (!is_capturing_.load() && !pa_initialized_) {
        return;
    }

    if (stream_) {
        Pa_StopStream(stream_);
        Pa_CloseStream(stream_);
        stream_ = nullptr;
    }

    should_stop_.store(true);
    wake_cv_.notify_all();
    if (delivery_thread_ && delivery_thread_->joinable()) {
        delivery_thread_->join();
    }
    delivery_thread_.reset();
    is_capturing_.store(false);

    if (pa_initialized_) {
        Pa_Terminate();
        pa_initialized_ = false;
    }

    std::lock_guard<std::mutex> lock(callback_mutex_);
    on_frame_ = nullptr;
}

void PortAudioFrameSource::delivery_thread_func() {
    Frame frame(format_.frame_samples());
    size_t reported_overrun = 0;

    while (!should_stop_.load()) {
        {
            std::unique_lock<std::mutex> lock(wake_mutex_);
            wake_cv_.wait_for(lock, std::chrono::milliseconds(format_.frame_width_ms), [this] {
                return should_stop_.load() || ring_.size() >= format_.frame_samples();
            });
        }

        while (!should_stop_.load() && ring_.pop_frame(frame.data(), frame.size())) {
            std::lock_guard<std::mutex> lock(callback_mutex_);
            if (on_frame_) on_frame_(frame);
        }

        size_t overrun = ring_.overrun_samples();
        if (overrun != reported_overrun) {
            reported_overrun = overrun;
            core::log_warn("PortAudio", "processing fell behind, dropped samples total=" + std::to_string(overrun));
        }
    }
}

std::vector<InputDeviceInfo> PortAudioFrameSource::list_input_devices() {
    std::vector<InputDeviceInfo> devices;
    if (Pa_Initialize() != paNoError) {
        core::log_error("PortAudio", "failed to initialize PortAudio");
        return devices;
    }

    const int default_index = Pa_GetDefaultInputDevice();
    const int count = Pa_GetDeviceCount();
    for (int i = 0; i < count; ++i) {
        const PaDeviceInfo* info = Pa_GetDeviceInfo(i);
        if (!info || info->maxInputChannels <= 0) continue;

        InputDeviceInfo dev;
        dev.index = i;
        dev.name = info->name ? info->name : "";
        const PaHostApiInfo* api = Pa_GetHostApiInfo(info->hostApi);
        dev.host_api = (api && api->name) ? api->name : "";
        dev.default_sample_rate = info->defaultSampleRate;
        dev.max_channels = info->maxInputChannels;
        dev.is_default = (i == default_index);
        devices.push_back(dev);
    }

    Pa_Terminate();
    return devices;
}

} // namespace audio
