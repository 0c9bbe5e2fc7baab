#pragma once
#include <chrono>
#include <mutex>
#include <string>
#include <utility>

namespace core {

/**
 * @brief Named mutex that is only ever acquired with a timeout
 *
 * Session paths never block indefinitely: a wait that exceeds its bound is
 * reported to the caller as a failed attempt.
 */
class BoundedMutex {
public:
    explicit BoundedMutex(std::string name) : name_(std::move(name)) {}

    BoundedMutex(const BoundedMutex&) = delete;
    BoundedMutex& operator=(const BoundedMutex&) = delete;

    bool try_lock_for(std::chrono::milliseconds timeout) { return mutex_.try_lock_for(timeout); }
    void unlock() { mutex_.unlock(); }

    const std::string& name() const { return name_; }

private:
    std::string name_;
    std::timed_mutex mutex_;
};

// RAII holder; owns_lock() is false when the bounded wait expired.
class BoundedLock {
public:
    BoundedLock(BoundedMutex& mutex, std::chrono::milliseconds timeout)
        : mutex_(&mutex), owned_(mutex.try_lock_for(timeout)) {}

    ~BoundedLock() {
        if (owned_) mutex_->unlock();
    }

    BoundedLock(const BoundedLock&) = delete;
    BoundedLock& operator=(const BoundedLock&) = delete;

    bool owns_lock() const { return owned_; }
    explicit operator bool() const { return owned_; }

private:
    BoundedMutex* mutex_;
    bool owned_;
};

} // namespace core
