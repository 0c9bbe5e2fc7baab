// Drives built pipelines through a PushFrameSource with scripted backends
#include <cassert>
#include <memory>
#include <chrono>
#include <string>
#include <thread>
#include <vector>
#include "audio/push_frame_source.hpp"
#include "pipeline/pipeline_builder.hpp"
#include "../support/fake_backend.hpp"
#include "../support/recording_listener.hpp"
#include "../support/test_support.hpp"

using pipeline::Profile;
using pipeline::SpeechEvent;
using test_support::wait_until;

namespace {

void push(audio::PushFrameSource& source, const audio::Frame& frame) {
    source.push(frame.data(), frame.size());
}

void push_silence(audio::PushFrameSource& source, int frames) {
    for (int i = 0; i < frames; ++i) push(source, test_support::silence());
}

// Spells out the characters it hears and reports them at the first quiet frame
std::shared_ptr<test_support::FakeBackend> make_spelling_backend() {
    auto backend = std::make_shared<test_support::FakeBackend>();
    auto heard = std::make_shared<std::string>();
    backend->on_append = [heard](const asr::RecognitionCallbacks& cb, const audio::Frame& frame) {
        const char c = test_support::decode_char(frame);
        if (c != 0) {
            heard->push_back(c);
        } else if (!heard->empty()) {
            cb.on_result(asr::RecognitionResult{*heard, 0.8f, false});
            heard->clear();
        }
    };
    return backend;
}

} // namespace

static void test_wakeword_pipeline() {
    auto source = std::make_shared<audio::PushFrameSource>(audio::FrameFormat(), 300);
    auto listener = std::make_shared<test_support::RecordingListener>();
    auto wakeword = make_spelling_backend();
    auto speech = std::make_shared<test_support::FakeBackend>();

    auto pipeline = pipeline::SpeechPipelineBuilder()
        .use_profile(Profile::WakewordSpeech)
        .set_property("wake_phrases", "computer, hey robot")
        .set_frame_source(source)
        .set_wakeword_backend(wakeword)
        .set_speech_backend(speech)
        .add_listener(listener)
        .build();
    assert(pipeline->stage_count() == 3);
    assert(std::string(pipeline->stage(1).name()) == "wakeword");

    pipeline->start();
    assert(wait_until([&] { return listener->count(SpeechEvent::Started) == 1; }));

    // Two seconds of silence: nothing heard, nothing opened
    push_silence(*source, 100);
    assert(!pipeline->context().is_speech_detected());
    assert(!pipeline->context().is_active());
    assert(wakeword->opens == 0);

    // The VAD needs two voiced frames before the wakeword request opens
    for (const auto& frame : test_support::phrase_frames("  computer")) push(*source, frame);
    assert(pipeline->context().is_speech_detected());
    assert(wakeword->opens == 1);
    push_silence(*source, 2);

    assert(wait_until([&] { return pipeline->context().is_active(); }));
    assert(wait_until([&] { return listener->count(SpeechEvent::Activated) == 1; }));

    // The recognizer takes over the hardware once the wakeword request lets go
    push_silence(*source, 10);
    assert(wait_until([&] { return speech->opens == 1; }));
    assert(wait_until([&] { return pipeline->hardware().owner() == "asr"; }));

    pipeline->deactivate();
    assert(!pipeline->context().is_active());
    assert(wait_until([&] { return listener->count(SpeechEvent::Deactivated) == 1; }));

    pipeline->stop();
    assert(wait_until([&] { return listener->count(SpeechEvent::Stopped) == 1; }));
    assert(!pipeline->hardware().is_claimed());
    assert(listener->count(SpeechEvent::Activated) == 1);
    assert(listener->count(SpeechEvent::Errored) == 0);
}

static void test_vad_trigger_pipeline() {
    auto source = std::make_shared<audio::PushFrameSource>(audio::FrameFormat(), 300);
    auto listener = std::make_shared<test_support::RecordingListener>();
    auto speech = std::make_shared<test_support::FakeBackend>();
    speech->on_finish = [](const asr::RecognitionCallbacks& cb) {
        cb.on_result(asr::RecognitionResult{"lights on", 0.9f, true});
    };

    auto pipeline = pipeline::SpeechPipelineBuilder()
        .use_profile(Profile::VadTriggerSpeech)
        .set_property("wake_active_min_ms", "100")
        .set_property("vad_fall_ms", "100")
        .set_frame_source(source)
        .set_speech_backend(speech)
        .add_listener(listener)
        .build();
    pipeline->start();

    for (int i = 0; i < 10; ++i) push(*source, test_support::loud());
    assert(pipeline->context().is_active());
    push_silence(*source, 6);
    assert(speech->finishes == 1);

    assert(wait_until([&] { return listener->count(SpeechEvent::Recognized) == 1; }));
    assert(wait_until([&] { return listener->count(SpeechEvent::Deactivated) == 1; }));
    assert(listener->recognized()[0].transcript == "lights on");
    assert(!pipeline->context().is_active());

    pipeline->stop();
    assert(wait_until([&] { return listener->count(SpeechEvent::Stopped) == 1; }));

    auto events = listener->events();
    assert(events.front() == SpeechEvent::Initialized);
    assert(events.back() == SpeechEvent::Stopped);
}

static void test_push_to_talk_pipeline() {
    auto listener = std::make_shared<test_support::RecordingListener>();
    auto speech = std::make_shared<test_support::FakeBackend>();

    auto pipeline = pipeline::SpeechPipelineBuilder()
        .use_profile(Profile::PushToTalkSpeech)
        .set_property("wake_active_max_ms", "200")
        .set_speech_backend(speech)
        .add_listener(listener)
        .build();
    auto& source = dynamic_cast<audio::PushFrameSource&>(pipeline->frame_source());
    pipeline->start();

    push_silence(source, 5);
    assert(speech->opens == 0);

    pipeline->activate();
    push_silence(source, 11);
    assert(speech->opens == 1);
    assert(wait_until([&] { return listener->count(SpeechEvent::TimedOut) == 1; }));
    assert(wait_until([&] { return listener->count(SpeechEvent::Deactivated) == 1; }));
    assert(!pipeline->context().is_active());
    pipeline->stop();
}

static void test_stop_while_hardware_busy() {
    auto listener = std::make_shared<test_support::RecordingListener>();
    auto speech = std::make_shared<test_support::FakeBackend>();

    auto pipeline = pipeline::SpeechPipelineBuilder()
        .use_profile(Profile::PushToTalkSpeech)
        .set_property("lock_timeout_ms", "50")
        .set_speech_backend(speech)
        .add_listener(listener)
        .build();
    auto& source = dynamic_cast<audio::PushFrameSource&>(pipeline->frame_source());
    pipeline->start();
    pipeline->activate();
    push_silence(source, 3);
    assert(speech->opens == 1);
    asr::RecognitionCallbacks late = speech->last_callbacks();

    {
        test_support::LockHolder holder(pipeline->hardware().mutex());
        assert(holder.locked());
        pipeline->stop();
        late.on_result(asr::RecognitionResult{"late words", 0.9f, true});
    }
    assert(wait_until([&] { return listener->count(SpeechEvent::Stopped) == 1; }));

    // The request is released once the hardware lock frees up
    assert(wait_until([&] { return !pipeline->hardware().is_claimed(); }));
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    assert(speech->cancels == 1);
    assert(listener->count(SpeechEvent::Recognized) == 0);
    assert(listener->events().back() == SpeechEvent::Stopped);
}

int main() {
    test_wakeword_pipeline();
    test_vad_trigger_pipeline();
    test_push_to_talk_pipeline();
    test_stop_while_hardware_busy();
    return 0;
}
