#include <cassert>
#include <atomic>
#include <memory>
#include <string>
#include <thread>
#include <vector>
#include "pipeline/speech_context.hpp"
#include "../support/recording_listener.hpp"
#include "../support/test_support.hpp"

using pipeline::SpeechEvent;
using test_support::ManualExecutor;
using test_support::RecordingListener;

static void test_listener_registry() {
    auto exec = std::make_shared<ManualExecutor>();
    pipeline::SpeechContext ctx(core::SpeechConfig(), exec);
    auto a = std::make_shared<RecordingListener>();
    auto b = std::make_shared<RecordingListener>();

    auto ha = ctx.add_listener(a);
    auto hb = ctx.add_listener(b);
    assert(ha != 0 && hb != 0 && ha != hb);
    assert(ctx.listener_count() == 2);

    // Same object twice: registry unchanged, same handle
    assert(ctx.add_listener(a) == ha);
    assert(ctx.listener_count() == 2);

    assert(ctx.remove_listener(ha));
    assert(!ctx.remove_listener(ha));
    assert(ctx.listener_count() == 1);
    assert(ctx.remove_listener(b));
    assert(ctx.listener_count() == 0);

    ctx.add_listener(a);
    ctx.add_listener(b);
    ctx.remove_listeners();
    assert(ctx.listener_count() == 0);
    ctx.dispatch(SpeechEvent::Started);
    assert(exec->pending() == 0);
}

static void test_delivery_order_and_async() {
    auto exec = std::make_shared<ManualExecutor>();
    pipeline::SpeechContext ctx(core::SpeechConfig(), exec);
    std::vector<std::string> log;
    ctx.add_listener(std::make_shared<RecordingListener>("first", &log));
    ctx.add_listener(std::make_shared<RecordingListener>("second", &log));

    ctx.dispatch(SpeechEvent::Started);
    ctx.dispatch(SpeechEvent::Activated);
    // Nothing runs on the dispatching thread
    assert(log.empty());
    assert(exec->run_all() == 4);
    assert(log.size() == 4);
    assert(log[0] == "first:started");
    assert(log[1] == "second:started");
    assert(log[2] == "first:activated");
    assert(log[3] == "second:activated");
}

static void test_errored_without_pending_error() {
    auto exec = std::make_shared<ManualExecutor>();
    pipeline::SpeechContext ctx(core::SpeechConfig(), exec);
    auto l = std::make_shared<RecordingListener>();
    ctx.add_listener(l);

    ctx.dispatch(SpeechEvent::Errored);
    exec->run_all();
    auto errors = l->errors();
    assert(errors.size() == 1);
    assert(errors[0].message == "error not set");
    assert(errors[0].kind == core::SpeechError::Kind::State);

    // A set error is delivered once, then cleared
    ctx.set_error(core::SpeechError(core::SpeechError::Kind::Backend, "provider down", "fake", 42));
    ctx.dispatch(SpeechEvent::Errored);
    ctx.dispatch(SpeechEvent::Errored);
    exec->run_all();
    errors = l->errors();
    assert(errors.size() == 3);
    assert(errors[1].message == "provider down" && errors[1].code == 42);
    assert(errors[2].message == "error not set");

    ctx.report_error(core::SpeechError(core::SpeechError::Kind::ResourceTimeout, "lock"));
    exec->run_all();
    assert(l->errors().size() == 4);
    assert(l->errors()[3].kind == core::SpeechError::Kind::ResourceTimeout);
}

static void test_traced_is_consumed() {
    auto exec = std::make_shared<ManualExecutor>();
    core::SpeechConfig config;
    config.tracing = core::TraceLevel::Info;
    pipeline::SpeechContext ctx(config, exec);
    auto l = std::make_shared<RecordingListener>();
    ctx.add_listener(l);

    ctx.dispatch(SpeechEvent::Traced);
    exec->run_all();
    assert(l->count(SpeechEvent::Traced) == 0);

    ctx.set_trace("hello");
    ctx.dispatch(SpeechEvent::Traced);
    ctx.dispatch(SpeechEvent::Traced);
    exec->run_all();
    assert(l->traces().size() == 1 && l->traces()[0] == "hello");

    // Gated by the configured tracing level
    ctx.trace(core::TraceLevel::Info, "visible");
    ctx.trace(core::TraceLevel::Debug, "hidden");
    exec->run_all();
    assert(l->traces().size() == 2);
    assert(l->traces()[1] == "visible");
}

static void test_recognition_snapshot() {
    auto exec = std::make_shared<ManualExecutor>();
    pipeline::SpeechContext ctx(core::SpeechConfig(), exec);
    auto l = std::make_shared<RecordingListener>();
    ctx.add_listener(l);

    ctx.set_recognition("turn on the lights", 0.9f);
    ctx.dispatch(SpeechEvent::Recognized);
    ctx.set_recognition("something else", 0.1f);
    exec->run_all();
    auto rec = l->recognized();
    assert(rec.size() == 1);
    assert(rec[0].transcript == "turn on the lights");
    assert(rec[0].confidence > 0.89f);

    ctx.deactivate();
    assert(ctx.transcript().empty());
    assert(ctx.confidence() == 0.0f);
}

static void test_activation_compare_and_set() {
    auto exec = std::make_shared<ManualExecutor>();
    pipeline::SpeechContext ctx(core::SpeechConfig(), exec);
    auto l = std::make_shared<RecordingListener>();
    ctx.add_listener(l);

    std::atomic<int> winners{0};
    std::vector<std::thread> threads;
    for (int i = 0; i < 8; ++i) {
        threads.emplace_back([&] { if (ctx.activate()) winners.fetch_add(1); });
    }
    for (auto& t : threads) t.join();
    exec->run_all();
    assert(winners.load() == 1);
    assert(ctx.is_active());
    assert(l->count(SpeechEvent::Activated) == 1);

    ctx.set_speech_detected(true);
    ctx.deactivate();
    exec->run_all();
    assert(!ctx.is_active());
    assert(!ctx.is_speech_detected());
    assert(l->count(SpeechEvent::Deactivated) == 1);
}

static void test_serial_executor_delivery() {
    auto exec = std::make_shared<core::SerialExecutor>();
    pipeline::SpeechContext ctx(core::SpeechConfig(), exec);
    auto l = std::make_shared<RecordingListener>();
    ctx.add_listener(l);
    for (int i = 0; i < 50; ++i) ctx.dispatch(SpeechEvent::PartialRecognized);
    ctx.dispatch(SpeechEvent::Stopped);
    exec->drain();
    auto events = l->events();
    assert(events.size() == 51);
    assert(events.back() == SpeechEvent::Stopped);
}

namespace {
// Runs each task on the posting thread
class InlineExecutor : public core::Executor {
public:
    void post(Task task) override { task(); }
};

class DeactivateOnActivate : public RecordingListener {
public:
    explicit DeactivateOnActivate(pipeline::SpeechContext*& ctx) : ctx_(ctx) {}
    void on_activate() override {
        RecordingListener::on_activate();
        ctx_->deactivate();
    }
private:
    pipeline::SpeechContext*& ctx_;
};
} // namespace

static void test_inline_executor_reentrant_dispatch() {
    pipeline::SpeechContext* target = nullptr;
    pipeline::SpeechContext ctx(core::SpeechConfig(), std::make_shared<InlineExecutor>());
    target = &ctx;
    auto l = std::make_shared<DeactivateOnActivate>(target);
    ctx.add_listener(l);

    assert(ctx.activate());
    assert(!ctx.is_active());
    auto events = l->events();
    assert(events.size() == 2);
    assert(events[0] == SpeechEvent::Activated);
    assert(events[1] == SpeechEvent::Deactivated);

    // Reporting runs inline too
    ctx.report_error(core::SpeechError(core::SpeechError::Kind::State, "inline"));
    assert(l->count(SpeechEvent::Errored) == 1);
}

int main() {
    test_listener_registry();
    test_delivery_order_and_async();
    test_errored_without_pending_error();
    test_traced_is_consumed();
    test_recognition_snapshot();
    test_activation_compare_and_set();
    test_serial_executor_delivery();
    test_inline_executor_reentrant_dispatch();
    return 0;
}
