#pragma once

#include "asr/recognition_backend.hpp"
#include "audio/audio_hardware.hpp"
#include "core/alarm.hpp"
#include "core/bounded_mutex.hpp"
#include "pipeline/speech_context.hpp"

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace asr {

enum class SessionState { Idle, Starting, Streaming, Stopping };

const char* to_string(SessionState state);

/**
 * @brief Bounded-lifetime owner of one streaming backend request
 *
 * Composed by every streaming stage. Opens a request on start_streaming(),
 * tears it down on stop_streaming(), and transparently replaces it when the
 * backend's request duration limit is reached or a retryable failure is
 * reported. Terminal failures are surfaced once through the context and end
 * the request; so does a final result.
 *
 * Locking: every transition takes the hardware lock, then the session lock,
 * and releases them in reverse. Both waits are bounded; a wait that expires
 * is traced and the transition is skipped with no state change. The one
 * exception is stop: the request is orphaned at once (its callbacks become
 * no-ops) and released from the alarm thread when the locks come free.
 *
 * Backend callbacks are never handled on the backend's thread. They are
 * posted to the session's alarm thread, where the result handler runs with
 * both locks held, so it must not call back into the session.
 */
class RecognitionSession {
public:
    using Clock = std::chrono::steady_clock;
    using ResultHandler = std::function<void(const RecognitionResult&)>;

    struct Options {
        std::string name = "session";                    ///< Owner name for logs and the hardware claim
        std::chrono::milliseconds request_timeout{25000}; ///< Backend request duration limit
        std::chrono::milliseconds lock_timeout{2000};     ///< Bound on every lock wait
        std::chrono::milliseconds retry_delay{100};       ///< Delay before a skipped open is retried
    };

    RecognitionSession(Options options,
                       IRecognitionBackend& backend,
                       audio::AudioHardware& hardware,
                       pipeline::SpeechContext& context,
                       ResultHandler on_result);
    ~RecognitionSession();

    RecognitionSession(const RecognitionSession&) = delete;
    RecognitionSession& operator=(const RecognitionSession&) = delete;

    /// Request streaming and open a request if none is open. Returns false
    /// with nothing changed on a lock timeout; the caller tries again. When
    /// the hardware is busy the open is retried from the alarm thread.
    bool start_streaming();

    /// Stop streaming and release the request and the hardware claim.
    /// Returns false if a lock wait expired; the request is orphaned anyway
    /// and released later.
    bool stop_streaming();

    /// Ask the backend for its final result; the request stays open until
    /// it arrives.
    bool finish();

    /// Tear the current request down and, while streaming is wanted, open a
    /// fresh one. A lock timeout re-arms the restart deadline.
    bool restart();

    /// Forward one frame to the open request; dropped when none is open.
    void append(const audio::Frame& frame);

    SessionState state() const { return state_.load(); }
    bool should_be_streaming() const { return should_be_streaming_.load(); }
    std::optional<Clock::time_point> restart_deadline() const { return alarm_.deadline(); }

    /// Requests opened so far, including replacements
    size_t open_count() const { return open_count_.load(); }

    const std::string& name() const { return options_.name; }

    /// The second lock domain. Exposed for diagnostics and tests.
    core::BoundedMutex& session_lock() { return session_mutex_; }

private:
    // Identifies one open request; late callbacks find it dead or done
    struct Ticket {
        std::mutex mutex;
        uint64_t generation = 0;
        bool alive = true;
        bool done = false;   // final result or failure already taken
    };

    bool open_locked();
    void teardown_locked();
    void invalidate_ticket();
    bool has_live_ticket() const;
    void abandon_request(const char* operation, const core::BoundedMutex& mutex);
    void schedule_retry();
    void arm_restart_deadline(std::chrono::milliseconds delay);
    void rearm_after_timeout();
    void lock_timeout(const char* operation, const core::BoundedMutex& mutex);

    void handle_result(uint64_t generation, const RecognitionResult& result);
    void handle_failure(uint64_t generation, const BackendFailure& failure);

    Options options_;
    IRecognitionBackend& backend_;
    audio::AudioHardware& hardware_;
    pipeline::SpeechContext& context_;
    ResultHandler on_result_;

    core::BoundedMutex session_mutex_;
    std::atomic<SessionState> state_{SessionState::Idle};
    std::atomic<bool> should_be_streaming_{false};
    std::atomic<uint64_t> generation_{0};
    std::atomic<size_t> open_count_{0};
    bool finishing_ = false;

    mutable std::mutex ticket_mutex_;   // guards the ticket_ pointer, not the ticket
    std::shared_ptr<Ticket> ticket_;

    std::mutex request_mutex_;
    std::unique_ptr<IRecognitionRequest> request_;

    // Declared last: joined before the state its tasks touch is destroyed
    core::Alarm alarm_;
};

} // namespace asr
