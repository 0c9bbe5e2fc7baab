#include "core/alarm.hpp"
#include "core/logging.hpp"

#include <exception>

namespace core {

Alarm::Alarm(std::string name)
    : name_(std::move(name)) {
    worker_ = std::thread(&Alarm::worker_loop, this);
}

Alarm::~Alarm() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopped_ = true;
        deadline_.reset();
        wake_task_ = nullptr;
        posted_.clear();
    }
    cv_.notify_all();
    if (worker_.joinable()) {
        worker_.join();
    }
}

void Alarm::schedule(std::chrono::milliseconds delay, Task task) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopped_) return;
        deadline_ = Clock::now() + delay;
        wake_task_ = std::move(task);
    }
    cv_.notify_all();
}

void Alarm::cancel() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        deadline_.reset();
        wake_task_ = nullptr;
    }
    cv_.notify_all();
}

void Alarm::post(Task task) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopped_) return;
        posted_.push_back(std::move(task));
    }
    cv_.notify_all();
}

std::optional<Alarm::Clock::time_point> Alarm::deadline() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return deadline_;
}

void Alarm::worker_loop() {
    std::unique_lock<std::mutex> lock(mutex_);
    while (!stopped_) {
        Task task;
        if (!posted_.empty()) {
            task = std::move(posted_.front());
            posted_.pop_front();
        } else if (deadline_ && Clock::now() >= *deadline_) {
            task = std::move(wake_task_);
            wake_task_ = nullptr;
            deadline_.reset();
        } else if (deadline_) {
            cv_.wait_until(lock, *deadline_);
            continue;
        } else {
            cv_.wait(lock);
            continue;
        }

        lock.unlock();
        if (task) {
            try {
                task();
            } catch (const std::exception& e) {
                log_error(name_, std::string("alarm task threw: ") + e.what());
            }
        }
        lock.lock();
    }
}

} // namespace core
