#include "audio/wav_reader.hpp"

#include <algorithm>
#include <cmath>
#include <cstring>
#include <fstream>

namespace audio {

namespace {

constexpr uint16_t kFormatPcm = 1;
constexpr uint16_t kFormatFloat = 3;
constexpr uint16_t kFormatExtensible = 0xFFFE;

struct FmtChunk {
    uint16_t format = 0;
    uint16_t channels = 0;
    uint32_t sample_rate = 0;
    uint16_t bits = 0;
};

uint16_t le16(const unsigned char* p) { return static_cast<uint16_t>(p[0] | (p[1] << 8)); }
uint32_t le32(const unsigned char* p) {
    return static_cast<uint32_t>(p[0]) | (static_cast<uint32_t>(p[1]) << 8) |
           (static_cast<uint32_t>(p[2]) << 16) | (static_cast<uint32_t>(p[3]) << 24);
}

bool fail(std::string* error, const std::string& reason) {
    if (error) *error = reason;
    return false;
}

int16_t to_pcm16(float v) {
    v = std::clamp(v, -1.0f, 1.0f);
    return static_cast<int16_t>(std::lrint(v * 32767.0f));
}

} // namespace

std::vector<int16_t> resample_linear(const std::vector<int16_t>& in, int in_hz, int out_hz) {
    if (in.empty() || in_hz <= 0 || out_hz <= 0 || in_hz == out_hz) {
        return in;
    }
    const double step = static_cast<double>(in_hz) / static_cast<double>(out_hz);
    const size_t out_len = static_cast<size_t>(std::llround(static_cast<double>(in.size()) / step));
    const size_t last = in.size() - 1;

    std::vector<int16_t> out;
    out.reserve(out_len);
    for (size_t i = 0; i < out_len; ++i) {
        const double pos = static_cast<double>(i) * step;
        const size_t a = std::min(static_cast<size_t>(pos), last);
        const size_t b = std::min(a + 1, last);
        const double t = pos - static_cast<double>(a);
        const long v = std::lrint(in[a] + t * (in[b] - in[a]));
        out.push_back(static_cast<int16_t>(std::clamp<long>(v, -32768, 32767)));
    }
    return out;
}

bool read_wav(const std::string& path, int target_rate, WavClip& clip, std::string* error) {
    std::ifstream in(path, std::ios::binary);
    if (!in) return fail(error, "cannot open " + path);

    unsigned char riff[12];
    if (!in.read(reinterpret_cast<char*>(riff), sizeof(riff)) ||
        std::memcmp(riff, "RIFF", 4) != 0 || std::memcmp(riff + 8, "WAVE", 4) != 0) {
        return fail(error, path + " is not a RIFF/WAVE file");
    }

    // Walk the chunk list; "fmt " must precede "data"
    FmtChunk fmt;
    bool have_fmt = false;
    std::vector<unsigned char> data;
    unsigned char header[8];
    while (in.read(reinterpret_cast<char*>(header), sizeof(header))) {
        const uint32_t size = le32(header + 4);
        if (std::memcmp(header, "fmt ", 4) == 0) {
            std::vector<unsigned char> body(size);
            if (size < 16 || !in.read(reinterpret_cast<char*>(body.data()), size)) {
                return fail(error, "truncated fmt chunk");
            }
            fmt.format = le16(&body[0]);
            fmt.channels = le16(&body[2]);
            fmt.sample_rate = le32(&body[4]);
            fmt.bits = le16(&body[14]);
            if (fmt.format == kFormatExtensible && size >= 26) {
                fmt.format = le16(&body[24]);  // Sub-format GUID starts with the format tag
            }
            have_fmt = true;
        } else if (std::memcmp(header, "data", 4) == 0) {
            if (!have_fmt) return fail(error, "data chunk before fmt chunk");
            data.resize(size);
            in.read(reinterpret_cast<char*>(data.data()), size);
            data.resize(static_cast<size_t>(in.gcount()));  // Tolerate a short final chunk
            break;
        } else {
            in.seekg(size + (size & 1u), std::ios::cur);  // Chunks are word aligned
        }
    }

    if (!have_fmt) return fail(error, "missing fmt chunk");
    if (fmt.channels == 0 || fmt.sample_rate == 0) return fail(error, "invalid fmt chunk");

    const bool pcm16 = fmt.format == kFormatPcm && fmt.bits == 16;
    const bool float32 = fmt.format == kFormatFloat && fmt.bits == 32;
    if (!pcm16 && !float32) {
        return fail(error, "unsupported encoding (format " + std::to_string(fmt.format) + ", " +
                           std::to_string(fmt.bits) + " bits)");
    }

    const size_t bytes_per_frame = static_cast<size_t>(fmt.bits / 8) * fmt.channels;
    const size_t frames = data.size() / bytes_per_frame;
    std::vector<int16_t> mono(frames);
    for (size_t i = 0; i < frames; ++i) {
        const unsigned char* p = data.data() + i * bytes_per_frame;
        float sum = 0.0f;
        for (uint16_t c = 0; c < fmt.channels; ++c) {
            if (pcm16) {
                sum += static_cast<int16_t>(le16(p + c * 2)) / 32768.0f;
            } else {
                float v;
                std::memcpy(&v, p + c * 4, sizeof(v));
                sum += v;
            }
        }
        mono[i] = to_pcm16(sum / fmt.channels);
    }

    clip.source_sample_rate = static_cast<int>(fmt.sample_rate);
    clip.source_channels = fmt.channels;
    clip.sample_rate = target_rate;
    clip.samples = resample_linear(mono, clip.source_sample_rate, target_rate);
    return true;
}

} // namespace audio
