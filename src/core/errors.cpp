#include "core/errors.hpp"

namespace core {

const char* to_string(SpeechError::Kind kind) {
    switch (kind) {
        case SpeechError::Kind::Configuration: return "configuration";
        case SpeechError::Kind::State: return "state";
        case SpeechError::Kind::Backend: return "backend";
        case SpeechError::Kind::ResourceTimeout: return "resource-timeout";
    }
    return "unknown";
}

std::string SpeechError::to_string() const {
    std::string out = std::string(core::to_string(kind)) + ": " + message;
    if (code != 0) out += " (code " + std::to_string(code) + ")";
    if (!details.empty()) out += " [" + details + "]";
    return out;
}

} // namespace core
