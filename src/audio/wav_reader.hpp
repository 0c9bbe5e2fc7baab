#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace audio {

/// Mono PCM16 clip decoded from a WAV file
struct WavClip {
    std::vector<int16_t> samples;   ///< Mono, at sample_rate
    int sample_rate = 0;
    int source_sample_rate = 0;
    int source_channels = 0;

    double duration_seconds() const {
        return sample_rate > 0 ? static_cast<double>(samples.size()) / sample_rate : 0.0;
    }
};

/**
 * @brief Decode a RIFF/WAVE file into a mono clip at target_rate
 *
 * Accepts PCM 16-bit and IEEE float 32-bit data with any channel count;
 * channels are averaged, then the result is linearly resampled.
 *
 * @param error Receives a reason when the file is rejected (may be null)
 * @return false if the file cannot be read or its format is unsupported
 */
bool read_wav(const std::string& path, int target_rate, WavClip& clip, std::string* error = nullptr);

/// Linear interpolation resampler
std::vector<int16_t> resample_linear(const std::vector<int16_t>& in, int in_hz, int out_hz);

} // namespace audio
