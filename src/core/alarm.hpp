#pragma once
#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

namespace core {

/**
 * @brief Scheduled-wake primitive with its own worker thread
 *
 * Holds at most one pending one-shot wake (schedule() replaces it) plus a
 * FIFO of immediate tasks (post()). Callbacks run on the alarm thread with
 * no internal lock held, so they may call back into schedule()/cancel().
 */
class Alarm {
public:
    using Clock = std::chrono::steady_clock;
    using Task = std::function<void()>;

    explicit Alarm(std::string name);
    ~Alarm();

    Alarm(const Alarm&) = delete;
    Alarm& operator=(const Alarm&) = delete;

    /// Arm the one-shot wake, replacing any pending one.
    void schedule(std::chrono::milliseconds delay, Task task);

    /// Disarm the pending wake; a wake already running is not interrupted.
    void cancel();

    /// Run a task on the alarm thread as soon as possible.
    void post(Task task);

    std::optional<Clock::time_point> deadline() const;

    /// True when called from the alarm's own thread.
    bool on_alarm_thread() const { return std::this_thread::get_id() == worker_.get_id(); }

    const std::string& name() const { return name_; }

private:
    void worker_loop();

    std::string name_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::optional<Clock::time_point> deadline_;
    Task wake_task_;
    std::deque<Task> posted_;
    bool stopped_ = false;
    std::thread worker_;
};

} // namespace core
