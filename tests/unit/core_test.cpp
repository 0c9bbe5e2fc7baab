#include <cassert>
#include <atomic>
#include <chrono>
#include <mutex>
#include <vector>
#include "core/alarm.hpp"
#include "core/bounded_mutex.hpp"
#include "core/executor.hpp"
#include "../support/test_support.hpp"

using namespace std::chrono_literals;
using test_support::wait_until;

static void test_serial_executor_order() {
    core::SerialExecutor exec;
    std::mutex m;
    std::vector<int> seen;
    for (int i = 0; i < 100; ++i) {
        exec.post([&, i] {
            std::lock_guard<std::mutex> lock(m);
            seen.push_back(i);
        });
    }
    exec.drain();
    assert(exec.pending() == 0);
    std::lock_guard<std::mutex> lock(m);
    assert(seen.size() == 100);
    for (int i = 0; i < 100; ++i) assert(seen[i] == i);
}

static void test_alarm_schedule_replaces_pending() {
    core::Alarm alarm("test");
    std::atomic<int> first{0}, second{0};
    alarm.schedule(50ms, [&] { first.fetch_add(1); });
    assert(alarm.deadline().has_value());
    alarm.schedule(60ms, [&] { second.fetch_add(1); });
    assert(wait_until([&] { return second.load() == 1; }));
    assert(first.load() == 0);
    assert(!alarm.deadline().has_value());
}

static void test_alarm_cancel() {
    core::Alarm alarm("test");
    std::atomic<int> fired{0};
    alarm.schedule(30ms, [&] { fired.fetch_add(1); });
    alarm.cancel();
    assert(!alarm.deadline().has_value());
    std::this_thread::sleep_for(80ms);
    assert(fired.load() == 0);
}

static void test_alarm_post_runs_on_alarm_thread() {
    core::Alarm alarm("test");
    std::atomic<bool> on_thread{false};
    std::atomic<bool> rearmed{false};
    alarm.post([&] {
        on_thread = alarm.on_alarm_thread();
        // Callbacks may re-enter the alarm
        alarm.schedule(10ms, [&] { rearmed = true; });
    });
    assert(wait_until([&] { return rearmed.load(); }));
    assert(on_thread.load());
    assert(!alarm.on_alarm_thread());
}

static void test_bounded_lock() {
    core::BoundedMutex mutex("test");
    assert(std::string(mutex.name()) == "test");
    {
        core::BoundedLock lock(mutex, 10ms);
        assert(lock);
    }
    test_support::LockHolder holder(mutex);
    assert(holder.locked());
    auto t0 = std::chrono::steady_clock::now();
    core::BoundedLock blocked(mutex, 30ms);
    assert(!blocked);
    assert(std::chrono::steady_clock::now() - t0 >= 25ms);
    holder.release();
    core::BoundedLock after(mutex, 100ms);
    assert(after);
}

int main() {
    test_serial_executor_order();
    test_alarm_schedule_replaces_pending();
    test_alarm_cancel();
    test_alarm_post_runs_on_alarm_thread();
    test_bounded_lock();
    return 0;
}
