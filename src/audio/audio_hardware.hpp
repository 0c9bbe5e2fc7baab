#pragma once

#include "core/bounded_mutex.hpp"

#include <atomic>
#include <chrono>
#include <mutex>
#include <string>

namespace audio {

/**
 * @brief Exclusive-access capability for the audio input hardware
 *
 * Owned by the pipeline and lent by reference to every stage. A stage that
 * opens a recognition request claims the hardware under the "hardware" lock;
 * the claim is released when the request is torn down. At most one owner
 * holds a claim at a time.
 */
class AudioHardware {
public:
    AudioHardware() : mutex_("hardware") {}

    AudioHardware(const AudioHardware&) = delete;
    AudioHardware& operator=(const AudioHardware&) = delete;

    /// The first of the two session lock domains; always taken before a
    /// session's own lock.
    core::BoundedMutex& mutex() { return mutex_; }

    /// Record `owner` as the exclusive user. Caller holds mutex().
    /// Returns false when another owner already holds the claim.
    bool claim(const std::string& owner);

    /// Drop the claim held by `owner`. Caller holds mutex().
    void release(const std::string& owner);

    std::string owner() const;
    bool is_claimed() const;

    /// Counters for diagnostics and tests
    size_t claim_count() const { return claims_.load(); }
    size_t release_count() const { return releases_.load(); }

private:
    core::BoundedMutex mutex_;
    mutable std::mutex owner_mutex_;
    std::string owner_;
    std::atomic<size_t> claims_{0};
    std::atomic<size_t> releases_{0};
};

} // namespace audio
