#pragma once
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <vector>

namespace core {

// Single-producer single-consumer lock-free ring of PCM16 samples.
// The producer is the hardware callback (or the host pushing audio); the
// consumer cuts the stream into fixed-size frames with pop_frame().
class RingBufferI16 {
public:
    explicit RingBufferI16(size_t capacity)
        : buffer_(capacity), capacity_(capacity), head_(0), tail_(0) {}

    size_t capacity() const { return capacity_; }

    // Writes as many samples as fit; the rest are counted as overrun.
    size_t push(const int16_t* data, size_t n) {
        const size_t head = head_.load(std::memory_order_relaxed);
        const size_t tail = tail_.load(std::memory_order_acquire);
        const size_t free_space = capacity_ - (head - tail);
        const size_t to_write = (n < free_space) ? n : free_space;
        for (size_t i = 0; i < to_write; ++i) {
            buffer_[(head + i) % capacity_] = data[i];
        }
        head_.store(head + to_write, std::memory_order_release);
        if (to_write < n) {
            overrun_.fetch_add(n - to_write, std::memory_order_relaxed);
        }
        return to_write;
    }

    // All-or-nothing read of exactly frame_size samples.
    bool pop_frame(int16_t* out, size_t frame_size) {
        const size_t tail = tail_.load(std::memory_order_relaxed);
        const size_t head = head_.load(std::memory_order_acquire);
        if (head - tail < frame_size) return false;
        for (size_t i = 0; i < frame_size; ++i) {
            out[i] = buffer_[(tail + i) % capacity_];
        }
        tail_.store(tail + frame_size, std::memory_order_release);
        return true;
    }

    size_t size() const {
        const size_t head = head_.load(std::memory_order_acquire);
        const size_t tail = tail_.load(std::memory_order_acquire);
        return head - tail;
    }

    // Consumer side only.
    void clear() {
        tail_.store(head_.load(std::memory_order_acquire), std::memory_order_release);
    }

    size_t overrun_samples() const { return overrun_.load(std::memory_order_relaxed); }

private:
    std::vector<int16_t> buffer_;
    const size_t capacity_;
    std::atomic<size_t> head_;
    std::atomic<size_t> tail_;
    std::atomic<size_t> overrun_{0};
};

} // namespace core
