#include "core/executor.hpp"
#include "core/logging.hpp"

#include <exception>

namespace core {

SerialExecutor::SerialExecutor()
    : worker_(&SerialExecutor::worker_loop, this) {
}

SerialExecutor::~SerialExecutor() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopped_ = true;
    }
    cv_task_.notify_all();
    if (worker_.joinable()) {
        worker_.join();
    }
}

void SerialExecutor::post(Task task) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopped_) return;
        tasks_.push_back(std::move(task));
    }
    cv_task_.notify_one();
}

void SerialExecutor::drain() {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_idle_.wait(lock, [this] { return (tasks_.empty() && !running_task_) || stopped_; });
}

size_t SerialExecutor::pending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tasks_.size() + (running_task_ ? 1 : 0);
}

void SerialExecutor::worker_loop() {
    for (;;) {
        Task task;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_task_.wait(lock, [this] { return !tasks_.empty() || stopped_; });
            // Remaining tasks are still delivered on shutdown
            if (tasks_.empty()) break;
            task = std::move(tasks_.front());
            tasks_.pop_front();
            running_task_ = true;
        }

        try {
            task();
        } catch (const std::exception& e) {
            log_error("SerialExecutor", std::string("listener callback threw: ") + e.what());
        }

        {
            std::lock_guard<std::mutex> lock(mutex_);
            running_task_ = false;
            if (tasks_.empty()) cv_idle_.notify_all();
        }
    }
    std::lock_guard<std::mutex> lock(mutex_);
    cv_idle_.notify_all();
}

} // namespace core
