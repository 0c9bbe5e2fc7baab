#pragma once
#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <set>
#include "asr/recognition_backend.hpp"

namespace test_support {

// Scriptable recognition backend. Hooks run on the calling thread, i.e.
// inside append()/finish(), the way a synchronous provider would.
class FakeBackend : public asr::IRecognitionBackend {
public:
    using AppendHook = std::function<void(const asr::RecognitionCallbacks&, const audio::Frame&)>;
    using FinishHook = std::function<void(const asr::RecognitionCallbacks&)>;

    AppendHook on_append;
    FinishHook on_finish;
    std::set<int> retryable_codes;
    std::atomic<bool> fail_open{false};

    std::atomic<int> opens{0};
    std::atomic<int> cancels{0};
    std::atomic<int> finishes{0};
    std::atomic<int> frames{0};

    const char* name() const override { return "fake"; }

    std::unique_ptr<asr::IRecognitionRequest> open_request(asr::RecognitionCallbacks callbacks) override {
        if (fail_open.load()) return nullptr;
        opens.fetch_add(1);
        {
            std::lock_guard<std::mutex> lock(mutex_);
            last_callbacks_ = callbacks;
        }
        return std::make_unique<Request>(*this, std::move(callbacks));
    }

    bool is_retryable(const asr::BackendFailure& failure) const override {
        return retryable_codes.count(failure.code) > 0;
    }

    // Callbacks of the most recently opened request, kept past its teardown
    asr::RecognitionCallbacks last_callbacks() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return last_callbacks_;
    }

private:
    class Request : public asr::IRecognitionRequest {
    public:
        Request(FakeBackend& owner, asr::RecognitionCallbacks callbacks)
            : owner_(owner), callbacks_(std::move(callbacks)) {}

        void append(const audio::Frame& frame) override {
            if (cancelled_) return;
            owner_.frames.fetch_add(1);
            if (owner_.on_append) owner_.on_append(callbacks_, frame);
        }
        void finish() override {
            owner_.finishes.fetch_add(1);
            if (owner_.on_finish) owner_.on_finish(callbacks_);
        }
        void cancel() override {
            if (cancelled_) return;
            cancelled_ = true;
            owner_.cancels.fetch_add(1);
        }

    private:
        FakeBackend& owner_;
        asr::RecognitionCallbacks callbacks_;
        bool cancelled_ = false;
    };

    mutable std::mutex mutex_;
    asr::RecognitionCallbacks last_callbacks_;
};

} // namespace test_support
