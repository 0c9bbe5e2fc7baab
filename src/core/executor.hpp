#pragma once
#include <atomic>
#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <thread>

namespace core {

/**
 * @brief Destination for asynchronous listener callbacks
 *
 * Hosts that need callbacks on a specific thread (e.g. a UI thread)
 * implement post() to marshal the task there. post() may run the task
 * inline on the calling thread, but must not block waiting for another
 * thread to run it.
 */
class Executor {
public:
    using Task = std::function<void()>;
    virtual ~Executor() = default;
    virtual void post(Task task) = 0;
};

// Single worker thread; tasks run in the order they were posted.
class SerialExecutor : public Executor {
public:
    SerialExecutor();
    ~SerialExecutor() override;

    SerialExecutor(const SerialExecutor&) = delete;
    SerialExecutor& operator=(const SerialExecutor&) = delete;

    void post(Task task) override;

    /// Blocks until every task posted before the call has run.
    void drain();

    size_t pending() const;

private:
    void worker_loop();

    mutable std::mutex mutex_;
    std::condition_variable cv_task_;
    std::condition_variable cv_idle_;
    std::deque<Task> tasks_;
    bool running_task_ = false;
    bool stopped_ = false;
    std::thread worker_;
};

} // namespace core
