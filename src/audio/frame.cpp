#include "audio/frame.hpp"
#include <algorithm>
#include <cmath>

namespace audio {

double frame_dbfs(const int16_t* samples, size_t count) {
    if (!samples || count == 0) return -120.0;
    double sum2 = 0.0;
    for (size_t i = 0; i < count; i++) {
        double v = samples[i] / 32768.0;
        sum2 += v * v;
    }
    double rms = std::sqrt(sum2 / std::max<size_t>(1, count));
    return (rms > 0) ? 20.0 * std::log10(rms) : -120.0;
}

} // namespace audio
