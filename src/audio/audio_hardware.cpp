#include "audio/audio_hardware.hpp"
#include "core/logging.hpp"

namespace audio {

bool AudioHardware::claim(const std::string& owner) {
    std::lock_guard<std::mutex> lock(owner_mutex_);
    if (!owner_.empty() && owner_ != owner) {
        core::log_warn("Hardware", "claim by '" + owner + "' refused, held by '" + owner_ + "'");
        return false;
    }
    if (owner_.empty()) {
        owner_ = owner;
        claims_.fetch_add(1);
        core::log_debug("Hardware", "claimed by " + owner);
    }
    return true;
}

void AudioHardware::release(const std::string& owner) {
    std::lock_guard<std::mutex> lock(owner_mutex_);
    if (owner_ != owner) {
        return;
    }
    owner_.clear();
    releases_.fetch_add(1);
    core::log_debug("Hardware", "released by " + owner);
}

std::string AudioHardware::owner() const {
    std::lock_guard<std::mutex> lock(owner_mutex_);
    return owner_;
}

bool AudioHardware::is_claimed() const {
    std::lock_guard<std::mutex> lock(owner_mutex_);
    return !owner_.empty();
}

} // namespace audio
