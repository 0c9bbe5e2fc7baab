#include "asr/recognition_session.hpp"
#include "core/logging.hpp"

namespace asr {

const char* to_string(SessionState state) {
    switch (state) {
        case SessionState::Idle: return "idle";
        case SessionState::Starting: return "starting";
        case SessionState::Streaming: return "streaming";
        case SessionState::Stopping: return "stopping";
    }
    return "unknown";
}

RecognitionSession::RecognitionSession(Options options,
                                       IRecognitionBackend& backend,
                                       audio::AudioHardware& hardware,
                                       pipeline::SpeechContext& context,
                                       ResultHandler on_result)
    : options_(std::move(options))
    , backend_(backend)
    , hardware_(hardware)
    , context_(context)
    , on_result_(std::move(on_result))
    , session_mutex_(options_.name + ".session")
    , alarm_(options_.name + ".alarm") {
}

RecognitionSession::~RecognitionSession() {
    if (stop_streaming()) {
        return;
    }

    // Lock waits expired; drop the request without them so that nothing
    // outlives the session.
    core::log_warn("Session", options_.name + ": forced teardown on destruction");
    alarm_.cancel();
    invalidate_ticket();
    std::unique_ptr<IRecognitionRequest> request;
    {
        std::lock_guard<std::mutex> lock(request_mutex_);
        request = std::move(request_);
    }
    if (request) request->cancel();
    hardware_.release(options_.name);
    state_.store(SessionState::Idle);
}

bool RecognitionSession::start_streaming() {
    core::BoundedLock hw(hardware_.mutex(), options_.lock_timeout);
    if (!hw) {
        lock_timeout("start", hardware_.mutex());
        return false;
    }
    core::BoundedLock session(session_mutex_, options_.lock_timeout);
    if (!session) {
        lock_timeout("start", session_mutex_);
        return false;
    }

    should_be_streaming_.store(true);
    if (state_.load() != SessionState::Idle) {
        if (has_live_ticket()) {
            return true;  // Already streaming
        }
        teardown_locked();  // Finish a stop that timed out
    }
    return open_locked();
}

bool RecognitionSession::stop_streaming() {
    should_be_streaming_.store(false);

    core::BoundedLock hw(hardware_.mutex(), options_.lock_timeout);
    if (!hw) {
        abandon_request("stop", hardware_.mutex());
        return false;
    }
    core::BoundedLock session(session_mutex_, options_.lock_timeout);
    if (!session) {
        abandon_request("stop", session_mutex_);
        return false;
    }

    teardown_locked();
    return true;
}

bool RecognitionSession::finish() {
    std::lock_guard<std::mutex> lock(request_mutex_);
    if (!request_ || finishing_) {
        return false;
    }
    finishing_ = true;
    request_->finish();
    context_.trace(core::TraceLevel::Debug, options_.name + ": request finishing");
    return true;
}

bool RecognitionSession::restart() {
    core::BoundedLock hw(hardware_.mutex(), options_.lock_timeout);
    if (!hw) {
        lock_timeout("restart", hardware_.mutex());
        rearm_after_timeout();
        return false;
    }
    core::BoundedLock session(session_mutex_, options_.lock_timeout);
    if (!session) {
        lock_timeout("restart", session_mutex_);
        rearm_after_timeout();
        return false;
    }

    if (state_.load() != SessionState::Idle) {
        context_.trace(core::TraceLevel::Debug, options_.name + ": restarting request");
    }
    teardown_locked();
    if (!should_be_streaming_.load()) {
        return true;
    }
    return open_locked();
}

void RecognitionSession::append(const audio::Frame& frame) {
    std::lock_guard<std::mutex> lock(request_mutex_);
    if (request_ && !finishing_) {
        request_->append(frame);
    }
}

bool RecognitionSession::open_locked() {
    state_.store(SessionState::Starting);

    if (!hardware_.claim(options_.name)) {
        state_.store(SessionState::Idle);
        context_.trace(core::TraceLevel::Info, options_.name + ": audio hardware busy, open deferred");
        schedule_retry();
        return false;
    }

    const uint64_t generation = generation_.fetch_add(1) + 1;
    auto ticket = std::make_shared<Ticket>();
    ticket->generation = generation;
    {
        std::lock_guard<std::mutex> lock(ticket_mutex_);
        ticket_ = ticket;
    }

    RecognitionCallbacks callbacks;
    callbacks.on_result = [this, ticket](const RecognitionResult& result) {
        std::lock_guard<std::mutex> lock(ticket->mutex);
        if (!ticket->alive || ticket->done) return;
        if (result.is_final) ticket->done = true;
        const uint64_t g = ticket->generation;
        alarm_.post([this, g, result] { handle_result(g, result); });
    };
    callbacks.on_failure = [this, ticket](const BackendFailure& failure) {
        std::lock_guard<std::mutex> lock(ticket->mutex);
        if (!ticket->alive || ticket->done) return;
        ticket->done = true;
        const uint64_t g = ticket->generation;
        alarm_.post([this, g, failure] { handle_failure(g, failure); });
    };

    std::unique_ptr<IRecognitionRequest> request = backend_.open_request(std::move(callbacks));
    if (!request) {
        invalidate_ticket();
        hardware_.release(options_.name);
        state_.store(SessionState::Idle);
        should_be_streaming_.store(false);
        context_.report_error(core::SpeechError(core::SpeechError::Kind::Backend,
                                                "could not open recognition request",
                                                std::string(backend_.name()) + " (" + options_.name + ")"));
        return false;
    }

    {
        std::lock_guard<std::mutex> lock(request_mutex_);
        request_ = std::move(request);
        finishing_ = false;
    }
    open_count_.fetch_add(1);
    arm_restart_deadline(options_.request_timeout);
    state_.store(SessionState::Streaming);
    context_.trace(core::TraceLevel::Debug,
                   options_.name + ": request #" + std::to_string(generation) + " open on " + backend_.name());
    return true;
}

void RecognitionSession::teardown_locked() {
    alarm_.cancel();
    if (state_.load() == SessionState::Idle) {
        return;
    }

    state_.store(SessionState::Stopping);
    invalidate_ticket();

    std::unique_ptr<IRecognitionRequest> request;
    {
        std::lock_guard<std::mutex> lock(request_mutex_);
        request = std::move(request_);
        finishing_ = false;
    }
    if (request) {
        request->cancel();
        request.reset();
    }

    hardware_.release(options_.name);
    state_.store(SessionState::Idle);
    core::log_debug("Session", options_.name + ": request released");
}

void RecognitionSession::invalidate_ticket() {
    std::shared_ptr<Ticket> ticket;
    {
        std::lock_guard<std::mutex> lock(ticket_mutex_);
        ticket.swap(ticket_);
    }
    if (!ticket) return;
    std::lock_guard<std::mutex> lock(ticket->mutex);
    ticket->alive = false;
}

bool RecognitionSession::has_live_ticket() const {
    std::lock_guard<std::mutex> lock(ticket_mutex_);
    return ticket_ != nullptr;
}

// A stop that cannot take the locks still orphans the request: its callbacks
// become no-ops now, and the request and hardware claim are released by the
// alarm once the locks are free.
void RecognitionSession::abandon_request(const char* operation, const core::BoundedMutex& mutex) {
    lock_timeout(operation, mutex);
    invalidate_ticket();
    alarm_.schedule(options_.retry_delay, [this] {
        if (!should_be_streaming_.load()) stop_streaming();
    });
}

void RecognitionSession::schedule_retry() {
    alarm_.schedule(options_.retry_delay, [this] {
        if (should_be_streaming_.load()) restart();
    });
}

void RecognitionSession::arm_restart_deadline(std::chrono::milliseconds delay) {
    alarm_.schedule(delay, [this] { restart(); });
}

void RecognitionSession::rearm_after_timeout() {
    if (!should_be_streaming_.load()) return;
    if (state_.load() == SessionState::Idle) {
        schedule_retry();
    } else {
        arm_restart_deadline(options_.request_timeout);
    }
}

void RecognitionSession::lock_timeout(const char* operation, const core::BoundedMutex& mutex) {
    const std::string msg = options_.name + ": " + operation + " skipped, timed out waiting for the " +
                            mutex.name() + " lock";
    core::log_warn("Session", msg);
    context_.trace(core::TraceLevel::Info, msg);
}

void RecognitionSession::handle_result(uint64_t generation, const RecognitionResult& result) {
    core::BoundedLock hw(hardware_.mutex(), options_.lock_timeout);
    if (!hw) {
        lock_timeout("result", hardware_.mutex());
        return;
    }
    core::BoundedLock session(session_mutex_, options_.lock_timeout);
    if (!session) {
        lock_timeout("result", session_mutex_);
        return;
    }

    if (generation != generation_.load() || state_.load() != SessionState::Streaming ||
        !should_be_streaming_.load()) {
        return;  // Request already torn down or being stopped
    }

    if (on_result_) {
        on_result_(result);
    }
    if (result.is_final) {
        should_be_streaming_.store(false);
        teardown_locked();
    }
}

void RecognitionSession::handle_failure(uint64_t generation, const BackendFailure& failure) {
    core::BoundedLock hw(hardware_.mutex(), options_.lock_timeout);
    if (!hw) {
        lock_timeout("failure", hardware_.mutex());
        return;
    }
    core::BoundedLock session(session_mutex_, options_.lock_timeout);
    if (!session) {
        lock_timeout("failure", session_mutex_);
        return;
    }

    if (generation != generation_.load() || state_.load() != SessionState::Streaming ||
        !should_be_streaming_.load()) {
        return;
    }

    const std::string desc = failure.domain + " error " + std::to_string(failure.code) + ": " + failure.message;
    if (backend_.is_retryable(failure)) {
        core::log_debug("Session", options_.name + ": retryable " + desc);
        context_.trace(core::TraceLevel::Debug, options_.name + ": restarting after " + desc);
        teardown_locked();
        schedule_retry();
        return;
    }

    should_be_streaming_.store(false);
    teardown_locked();
    context_.report_error(core::SpeechError(core::SpeechError::Kind::Backend, failure.message,
                                            failure.domain, failure.code));
}

} // namespace asr
