#include <cassert>
#include <atomic>
#include <chrono>
#include <memory>
#include <thread>
#include "asr/recognition_session.hpp"
#include "../support/fake_backend.hpp"
#include "../support/recording_listener.hpp"
#include "../support/test_support.hpp"

using asr::RecognitionSession;
using asr::SessionState;
using pipeline::SpeechEvent;
using test_support::wait_until;

namespace {

struct Fixture {
    std::shared_ptr<test_support::ManualExecutor> exec = std::make_shared<test_support::ManualExecutor>();
    pipeline::SpeechContext ctx{core::SpeechConfig(), exec};
    audio::AudioHardware hw;
    test_support::FakeBackend backend;
    std::shared_ptr<test_support::RecordingListener> listener = std::make_shared<test_support::RecordingListener>();
    std::atomic<int> results{0};
    std::atomic<int> finals{0};

    Fixture() { ctx.add_listener(listener); }

    RecognitionSession::ResultHandler handler() {
        return [this](const asr::RecognitionResult& r) {
            results.fetch_add(1);
            if (r.is_final) finals.fetch_add(1);
        };
    }

    size_t errors() {
        exec->run_all();
        return listener->count(SpeechEvent::Errored);
    }
};

RecognitionSession::Options options(const char* name = "test") {
    RecognitionSession::Options o;
    o.name = name;
    o.request_timeout = std::chrono::milliseconds(25000);
    o.lock_timeout = std::chrono::milliseconds(200);
    o.retry_delay = std::chrono::milliseconds(10);
    return o;
}

} // namespace

static void test_start_stop_idempotent() {
    Fixture f;
    RecognitionSession s(options(), f.backend, f.hw, f.ctx, f.handler());
    assert(s.state() == SessionState::Idle);
    assert(!s.should_be_streaming());
    assert(!s.restart_deadline());

    assert(s.start_streaming());
    assert(s.state() == SessionState::Streaming);
    assert(s.should_be_streaming());
    assert(f.backend.opens == 1);
    assert(f.hw.owner() == "test");
    assert(s.restart_deadline().has_value());

    // Already streaming: no second request
    assert(s.start_streaming());
    assert(f.backend.opens == 1);
    assert(s.open_count() == 1);

    s.append(test_support::silence());
    assert(f.backend.frames == 1);

    assert(s.stop_streaming());
    assert(s.state() == SessionState::Idle);
    assert(!s.should_be_streaming());
    assert(f.backend.cancels == 1);
    assert(!f.hw.is_claimed());
    assert(!s.restart_deadline());

    // Stopping again is a no-op
    assert(s.stop_streaming());
    assert(f.backend.cancels == 1);
    s.append(test_support::silence());
    assert(f.backend.frames == 1);
    assert(f.errors() == 0);
}

static void test_retryable_failures_restart_silently() {
    Fixture f;
    f.backend.retryable_codes = {7};
    f.backend.on_append = [](const asr::RecognitionCallbacks& cb, const audio::Frame&) {
        cb.on_failure(asr::BackendFailure{7, "fake", "transient"});
    };
    RecognitionSession s(options(), f.backend, f.hw, f.ctx, f.handler());
    assert(s.start_streaming());

    bool restarted = wait_until([&] {
        s.append(test_support::silence());
        return f.hw.claim_count() >= 3;
    }, 3000);
    assert(restarted);
    // Each restart released the hardware before claiming it again
    assert(f.hw.release_count() >= 2);
    assert(f.backend.opens >= 3);
    assert(s.should_be_streaming());
    assert(f.errors() == 0);

    assert(s.stop_streaming());
    assert(!f.hw.is_claimed());
    assert(f.errors() == 0);
}

static void test_terminal_failure_surfaces_once() {
    Fixture f;
    f.backend.on_append = [](const asr::RecognitionCallbacks& cb, const audio::Frame&) {
        cb.on_failure(asr::BackendFailure{99, "fake", "model exploded"});
        cb.on_failure(asr::BackendFailure{99, "fake", "model exploded again"});
    };
    RecognitionSession s(options(), f.backend, f.hw, f.ctx, f.handler());
    assert(s.start_streaming());
    s.append(test_support::silence());

    assert(wait_until([&] { return f.errors() == 1; }));
    assert(wait_until([&] { return s.state() == SessionState::Idle; }));
    assert(!s.should_be_streaming());
    assert(!f.hw.is_claimed());

    // Request is gone; further frames produce nothing
    s.append(test_support::silence());
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    assert(f.errors() == 1);
    auto err = f.listener->errors()[0];
    assert(err.kind == core::SpeechError::Kind::Backend);
    assert(err.code == 99);
    assert(err.message == "model exploded");
}

static void test_request_timeout_restarts() {
    Fixture f;
    auto o = options();
    o.request_timeout = std::chrono::milliseconds(30);
    RecognitionSession s(o, f.backend, f.hw, f.ctx, f.handler());
    assert(s.start_streaming());
    assert(wait_until([&] { return f.backend.opens >= 3; }));
    assert(s.should_be_streaming());
    assert(f.backend.cancels >= 2);
    assert(f.errors() == 0);
    assert(s.stop_streaming());
    const int opens = f.backend.opens;
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    assert(f.backend.opens == opens);
}

static void test_session_lock_timeout_leaves_state() {
    Fixture f;
    auto o = options();
    o.lock_timeout = std::chrono::milliseconds(50);
    RecognitionSession s(o, f.backend, f.hw, f.ctx, f.handler());
    assert(s.start_streaming());
    assert(f.backend.opens == 1);

    test_support::LockHolder holder(s.session_lock());
    assert(holder.locked());
    assert(!s.restart());
    assert(s.state() == SessionState::Streaming);
    assert(f.backend.opens == 1);
    assert(f.backend.cancels == 0);
    assert(f.hw.claim_count() == 1);
    assert(s.restart_deadline().has_value());
    holder.release();

    assert(s.restart());
    assert(s.state() == SessionState::Streaming);
    assert(f.backend.opens == 2);
    assert(f.backend.cancels == 1);
    assert(s.stop_streaming());
}

static void test_hardware_lock_timeout_leaves_state() {
    Fixture f;
    auto o = options();
    o.lock_timeout = std::chrono::milliseconds(30);
    RecognitionSession s(o, f.backend, f.hw, f.ctx, f.handler());

    test_support::LockHolder holder(f.hw.mutex());
    assert(holder.locked());
    assert(!s.start_streaming());
    assert(s.state() == SessionState::Idle);
    assert(!s.should_be_streaming());
    assert(!s.restart_deadline());
    holder.release();

    // Nothing was scheduled behind the caller's back
    std::this_thread::sleep_for(std::chrono::milliseconds(60));
    assert(f.backend.opens == 0);
    assert(s.state() == SessionState::Idle);

    assert(s.start_streaming());
    assert(f.backend.opens == 1);
    assert(s.stop_streaming());
}

static void test_stop_lock_timeout_orphans_request() {
    Fixture f;
    auto o = options();
    o.lock_timeout = std::chrono::milliseconds(30);
    RecognitionSession s(o, f.backend, f.hw, f.ctx, f.handler());
    assert(s.start_streaming());
    asr::RecognitionCallbacks late = f.backend.last_callbacks();

    test_support::LockHolder holder(f.hw.mutex());
    assert(holder.locked());
    assert(!s.stop_streaming());
    assert(!s.should_be_streaming());

    // The request is orphaned even though it is still open
    late.on_result(asr::RecognitionResult{"late words", 0.9f, true});
    late.on_failure(asr::BackendFailure{99, "fake", "late failure"});
    std::this_thread::sleep_for(std::chrono::milliseconds(60));
    assert(f.results == 0);
    assert(f.backend.cancels == 0);
    holder.release();

    // Released by the alarm once the lock is free
    assert(wait_until([&] { return s.state() == SessionState::Idle && !f.hw.is_claimed(); }));
    assert(f.backend.cancels == 1);
    assert(f.results == 0);
    assert(f.errors() == 0);

    // A later start opens a fresh request
    assert(s.start_streaming());
    assert(f.backend.opens == 2);
    assert(s.stop_streaming());
}

static void test_start_replaces_orphaned_request() {
    Fixture f;
    auto o = options();
    o.lock_timeout = std::chrono::milliseconds(30);
    o.retry_delay = std::chrono::milliseconds(500);
    RecognitionSession s(o, f.backend, f.hw, f.ctx, f.handler());
    assert(s.start_streaming());
    {
        test_support::LockHolder holder(s.session_lock());
        assert(!s.stop_streaming());
    }
    assert(s.state() == SessionState::Streaming);

    // Start before the deferred release runs
    assert(s.start_streaming());
    assert(f.backend.cancels == 1);
    assert(f.backend.opens == 2);
    assert(s.state() == SessionState::Streaming);

    f.backend.last_callbacks().on_result(asr::RecognitionResult{"fresh", 0.7f, false});
    assert(wait_until([&] { return f.results == 1; }));
    assert(s.stop_streaming());
}

static void test_result_queued_before_stop_is_dropped() {
    Fixture f;
    auto o = options();
    o.lock_timeout = std::chrono::milliseconds(500);
    RecognitionSession s(o, f.backend, f.hw, f.ctx, f.handler());
    assert(s.start_streaming());

    test_support::LockHolder holder(f.hw.mutex());
    // Accepted by the live request; the alarm thread now waits for the locks
    f.backend.last_callbacks().on_result(asr::RecognitionResult{"queued", 0.9f, true});
    std::thread stopper([&] { assert(s.stop_streaming()); });
    std::this_thread::sleep_for(std::chrono::milliseconds(30));
    holder.release();
    stopper.join();

    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    assert(f.results == 0);
    assert(s.state() == SessionState::Idle);
    assert(!f.hw.is_claimed());
}

static void test_late_callbacks_are_ignored() {
    Fixture f;
    RecognitionSession s(options(), f.backend, f.hw, f.ctx, f.handler());
    assert(s.start_streaming());
    asr::RecognitionCallbacks late = f.backend.last_callbacks();
    assert(s.stop_streaming());

    late.on_result(asr::RecognitionResult{"too late", 0.5f, true});
    late.on_failure(asr::BackendFailure{99, "fake", "too late"});
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    assert(f.results == 0);
    assert(f.errors() == 0);
    assert(s.state() == SessionState::Idle);
}

static void test_partial_then_final_result() {
    Fixture f;
    f.backend.on_append = [](const asr::RecognitionCallbacks& cb, const audio::Frame&) {
        cb.on_result(asr::RecognitionResult{"partial", 0.3f, false});
    };
    f.backend.on_finish = [](const asr::RecognitionCallbacks& cb) {
        cb.on_result(asr::RecognitionResult{"done", 0.8f, true});
    };
    RecognitionSession s(options(), f.backend, f.hw, f.ctx, f.handler());
    assert(s.start_streaming());
    s.append(test_support::silence());
    assert(wait_until([&] { return f.results == 1; }));
    assert(s.state() == SessionState::Streaming);

    assert(s.finish());
    assert(!s.finish());
    assert(wait_until([&] { return f.finals == 1 && s.state() == SessionState::Idle; }));
    assert(!s.should_be_streaming());
    assert(!f.hw.is_claimed());
    assert(f.errors() == 0);
}

static void test_open_failure_reported() {
    Fixture f;
    f.backend.fail_open = true;
    RecognitionSession s(options(), f.backend, f.hw, f.ctx, f.handler());
    assert(!s.start_streaming());
    assert(s.state() == SessionState::Idle);
    assert(!s.should_be_streaming());
    assert(!f.hw.is_claimed());
    assert(wait_until([&] { return f.errors() == 1; }));
}

static void test_hardware_is_exclusive() {
    Fixture f;
    test_support::FakeBackend other;
    RecognitionSession a(options("a"), f.backend, f.hw, f.ctx, f.handler());
    RecognitionSession b(options("b"), other, f.hw, f.ctx, f.handler());

    assert(a.start_streaming());
    assert(!b.start_streaming());
    assert(b.state() == SessionState::Idle);
    assert(b.should_be_streaming());
    assert(f.hw.owner() == "a");

    assert(a.stop_streaming());
    assert(wait_until([&] { return b.state() == SessionState::Streaming; }));
    assert(f.hw.owner() == "b");
    assert(b.stop_streaming());
}

int main() {
    test_start_stop_idempotent();
    test_retryable_failures_restart_silently();
    test_terminal_failure_surfaces_once();
    test_request_timeout_restarts();
    test_session_lock_timeout_leaves_state();
    test_hardware_lock_timeout_leaves_state();
    test_stop_lock_timeout_orphans_request();
    test_start_replaces_orphaned_request();
    test_result_queued_before_stop_is_dropped();
    test_late_callbacks_are_ignored();
    test_partial_then_final_result();
    test_open_failure_reported();
    test_hardware_is_exclusive();
    return 0;
}
