#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>
#include "core/errors/run_errors.hpp"
#include "protocol/event_contract.hpp"
#include "protocol/message_contract.hpp"
#include "protocol/run_request.hpp"
#include "runtime/execution_engine.hpp"
#include "workspace/workspace.hpp"

namespace coderunner::session {

enum class SessionState {
    Idle,
    Building,
    Running,
    Completed,
    TimedOut,
    Killed,
    BuildFailed,
    Errored
};

// Receives every event of the session, one call at a time. It must not call
// back into the session.
using EventSink = std::function<void(const protocol::ExecutionEvent&)>;

constexpr const char* kBusyMessage = "A program is still running.";

// Per-client state machine. Owns at most one run at a time: its process,
// its artifact set and the thread that drives it.
class ExecutionSession : private runtime::RunObserver {
public:
    ExecutionSession(std::shared_ptr<const runtime::ExecutionEngine> engine,
                     EventSink sink);
    ~ExecutionSession() override;

    ExecutionSession(const ExecutionSession&) = delete;
    ExecutionSession& operator=(const ExecutionSession&) = delete;

    // Accepted only when Idle; returns the state the run starts in. Rejected
    // requests emit an error event and change nothing.
    core::errors::Result<SessionState> submit(const protocol::ExecutionRequest& request);

    // Appends `data` plus a newline to the running program's stdin. Returns
    // false (no-op) without a running process.
    bool send_input(const std::string& data);

    // Forces the active build or run to end with a manual_kill event.
    // Returns false when there is nothing to kill or a kill is pending.
    bool kill();

    // Dispatches a parsed client message to submit/send_input/kill.
    void handle(const protocol::ClientMessage& message);

    // Teardown: kills the active process, purges artifacts, emits nothing
    // further. Idempotent.
    void close();

    bool wait_for_idle(std::chrono::milliseconds timeout);

    SessionState state() const;
    const std::string& id() const { return id_; }

private:
    bool on_phase_started(runtime::RunPhase phase,
                          const std::shared_ptr<runtime::ProcessTask>& task) override;
    void on_output(protocol::OutputStream stream, const std::string& chunk) override;

    void drive(protocol::ExecutionRequest request);
    void emit(const protocol::ExecutionEvent& event);
    bool transition_to(SessionState next);
    void join_finished_driver();

    static bool is_allowed(SessionState from, SessionState to);
    static bool is_busy(SessionState state);
    static SessionState terminal_state(runtime::RunOutcomeKind kind);
    static protocol::ExecutionEvent terminal_event(const runtime::RunOutcome& outcome);

    const std::string id_;
    const std::shared_ptr<const runtime::ExecutionEngine> engine_;
    const EventSink sink_;

    mutable std::mutex mutex_;
    std::condition_variable idle_cv_;
    SessionState state_ = SessionState::Idle;
    std::shared_ptr<runtime::ProcessTask> active_task_;
    workspace::ArtifactSet artifacts_;
    bool kill_requested_ = false;
    // True from an accepted submit until its terminal event was delivered.
    bool run_active_ = false;

    // Guards driver_ and retired_drivers_; serializes submit and close.
    std::mutex driver_mutex_;
    std::thread driver_;
    std::vector<std::thread> retired_drivers_;

    // Serializes sink calls; taken before mutex_ when both are needed.
    std::mutex emit_mutex_;
    std::atomic_bool closed_{false};
};

std::string to_string(SessionState state);

}  // namespace coderunner::session
