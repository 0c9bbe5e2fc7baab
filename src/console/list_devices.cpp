#include <iostream>
#include "audio/portaudio_frame_source.hpp"

int main() {
    auto devices = audio::PortAudioFrameSource::list_input_devices();
    if (devices.empty()) {
        std::cout << "No active input devices found." << std::endl;
        return 0;
    }
    std::cout << "Active input devices:" << std::endl;
    for (const auto& dev : devices) {
        std::cout << dev.index << ": " << dev.name << (dev.is_default ? " (default)" : "")
                  << "\n  API: " << dev.host_api << ", " << dev.max_channels << " ch, "
                  << dev.default_sample_rate << " Hz\n";
    }
    return 0;
}
