#pragma once
#include <cstddef>
#include <cstdint>
#include <vector>

namespace audio {

/// One fixed-duration slice of mono PCM16 samples
using Frame = std::vector<int16_t>;

struct FrameFormat {
    int sample_rate = 16000;   ///< Hz
    int frame_width_ms = 20;   ///< Duration of one frame

    size_t frame_samples() const {
        return static_cast<size_t>(sample_rate) * static_cast<size_t>(frame_width_ms) / 1000;
    }
};

// RMS level of a frame in dBFS; -120 for an empty or all-zero frame.
double frame_dbfs(const int16_t* samples, size_t count);

inline double frame_dbfs(const Frame& frame) { return frame_dbfs(frame.data(), frame.size()); }

} // namespace audio
