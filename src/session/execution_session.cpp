#include "session/execution_session.hpp"

#include <utility>
#include "core/config/unique_id.hpp"
#include "core/logging/logger.hpp"

namespace coderunner::session {

using core::errors::ErrorCategory;
using core::errors::RunError;
using protocol::ErrorEvent;
using protocol::ExecutionEvent;
using protocol::ExecutionRequest;
using runtime::RunOutcomeKind;
using runtime::RunPhase;

std::string to_string(const SessionState state) {
    switch (state) {
        case SessionState::Idle:
            return "idle";
        case SessionState::Building:
            return "building";
        case SessionState::Running:
            return "running";
        case SessionState::Completed:
            return "completed";
        case SessionState::TimedOut:
            return "timed_out";
        case SessionState::Killed:
            return "killed";
        case SessionState::BuildFailed:
            return "build_failed";
        case SessionState::Errored:
            return "errored";
        default:
            return "unknown";
    }
}

ExecutionSession::ExecutionSession(
    std::shared_ptr<const runtime::ExecutionEngine> engine, EventSink sink)
    : id_(core::config::generate_session_id()),
      engine_(std::move(engine)),
      sink_(std::move(sink)) {
    LOG_INFO("Session: " + id_ + " opened");
}

ExecutionSession::~ExecutionSession() {
    close();
}

bool ExecutionSession::is_busy(const SessionState state) {
    return state == SessionState::Building || state == SessionState::Running;
}

bool ExecutionSession::is_allowed(const SessionState from, const SessionState to) {
    switch (from) {
        case SessionState::Idle:
            return to == SessionState::Building || to == SessionState::Running;
        case SessionState::Building:
            return to == SessionState::Running || to == SessionState::BuildFailed ||
                   to == SessionState::TimedOut || to == SessionState::Killed ||
                   to == SessionState::Errored;
        case SessionState::Running:
            return to == SessionState::Completed || to == SessionState::TimedOut ||
                   to == SessionState::Killed || to == SessionState::Errored;
        case SessionState::Completed:
        case SessionState::TimedOut:
        case SessionState::Killed:
        case SessionState::BuildFailed:
        case SessionState::Errored:
            return to == SessionState::Idle;
        default:
            return false;
    }
}

SessionState ExecutionSession::terminal_state(const RunOutcomeKind kind) {
    switch (kind) {
        case RunOutcomeKind::Completed:
            return SessionState::Completed;
        case RunOutcomeKind::BuildFailed:
            return SessionState::BuildFailed;
        case RunOutcomeKind::TimedOut:
            return SessionState::TimedOut;
        case RunOutcomeKind::Killed:
            return SessionState::Killed;
        case RunOutcomeKind::SpawnFailed:
        case RunOutcomeKind::Errored:
        default:
            return SessionState::Errored;
    }
}

ExecutionEvent ExecutionSession::terminal_event(const runtime::RunOutcome& outcome) {
    switch (outcome.kind) {
        case RunOutcomeKind::Completed:
            return protocol::ExitEvent{outcome.exit_code};
        case RunOutcomeKind::Killed:
            return protocol::ManualKillEvent{};
        case RunOutcomeKind::BuildFailed:
            return ErrorEvent{ErrorCategory::Build, outcome.message};
        case RunOutcomeKind::TimedOut:
            return ErrorEvent{ErrorCategory::Timeout, outcome.message};
        case RunOutcomeKind::SpawnFailed:
            return ErrorEvent{ErrorCategory::Spawn, outcome.message};
        case RunOutcomeKind::Errored:
        default:
            return ErrorEvent{ErrorCategory::Internal, outcome.message};
    }
}

bool ExecutionSession::transition_to(const SessionState next) {
    if (!is_allowed(state_, next)) {
        LOG_ERROR("Session: " + id_ + " refused transition " + to_string(state_) +
                  " -> " + to_string(next));
        return false;
    }
    LOG_INFO("Session: " + id_ + " transition " + to_string(state_) + " -> " +
             to_string(next));
    state_ = next;
    return true;
}

void ExecutionSession::emit(const ExecutionEvent& event) {
    std::lock_guard<std::mutex> lock(emit_mutex_);
    if (!closed_) {
        sink_(event);
    }
}

void ExecutionSession::join_finished_driver() {
    if (!driver_.joinable()) {
        return;
    }
    if (driver_.get_id() == std::this_thread::get_id()) {
        retired_drivers_.push_back(std::move(driver_));
        return;
    }
    driver_.join();
}

core::errors::Result<SessionState> ExecutionSession::submit(
    const ExecutionRequest& request) {
    if (closed_) {
        return RunError{ErrorCategory::Internal, "Session is closed.",
                        "session_closed"};
    }

    std::lock_guard<std::mutex> driver_lock(driver_mutex_);
    bool busy = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        busy = is_busy(state_);
    }
    if (busy) {
        LOG_INFO("Session: " + id_ + " rejected run while " + to_string(state()));
        emit(ErrorEvent{ErrorCategory::Busy, kBusyMessage});
        return RunError{ErrorCategory::Busy, kBusyMessage, "session_busy"};
    }

    auto resolved = engine_->resolve(request);
    if (core::errors::is_error(resolved)) {
        const auto& err = core::errors::get_error(resolved);
        LOG_INFO("Session: " + id_ + " rejected request [" + err.code + "]: " +
                 err.message);
        emit(ErrorEvent{err.category, err.message});
        return err;
    }
    const bool has_build = core::errors::get_value(resolved)->build.has_value();

    // The previous driver is past its terminal transition; only its final
    // notification can still be running.
    join_finished_driver();

    std::lock_guard<std::mutex> lock(mutex_);
    if (active_task_) {
        static_cast<void>(active_task_->kill());
        active_task_.reset();
    }
    const auto leftovers = engine_->purge(artifacts_);
    if (leftovers > 0) {
        LOG_WARN("Session: " + id_ + " purged " + std::to_string(leftovers) +
                 " leftover artifacts");
    }

    kill_requested_ = false;
    const SessionState first = has_build ? SessionState::Building : SessionState::Running;
    if (!transition_to(first)) {
        return RunError{ErrorCategory::Internal,
                        "Session cannot start a run from state " + to_string(state_),
                        "invalid_state_transition"};
    }
    run_active_ = true;
    LOG_INFO("Session: " + id_ + " accepted " + request.language + " run (" +
             std::to_string(request.source_text.size()) + " bytes)");
    driver_ = std::thread([this, request] { drive(request); });
    return first;
}

void ExecutionSession::drive(ExecutionRequest request) {
    const auto outcome = engine_->execute(request, protocol::RunMode::Interactive,
                                          artifacts_, *this);
    const auto removed = engine_->purge(artifacts_);
    LOG_INFO("Session: " + id_ + " run ended: " + runtime::to_string(outcome.kind) +
             " (removed " + std::to_string(removed) + " artifacts)");

    {
        std::lock_guard<std::mutex> emit_lock(emit_mutex_);
        {
            std::lock_guard<std::mutex> lock(mutex_);
            static_cast<void>(transition_to(terminal_state(outcome.kind)));
            active_task_.reset();
            kill_requested_ = false;
            static_cast<void>(transition_to(SessionState::Idle));
        }
        if (!closed_) {
            sink_(terminal_event(outcome));
        }
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        run_active_ = false;
    }
    idle_cv_.notify_all();
}

bool ExecutionSession::on_phase_started(
    const RunPhase phase, const std::shared_ptr<runtime::ProcessTask>& task) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (kill_requested_ || closed_) {
        return false;
    }
    if (phase == RunPhase::Run && state_ == SessionState::Building) {
        static_cast<void>(transition_to(SessionState::Running));
    }
    active_task_ = task;
    return true;
}

void ExecutionSession::on_output(const protocol::OutputStream stream,
                                 const std::string& chunk) {
    emit(protocol::OutputEvent{stream, chunk});
}

bool ExecutionSession::send_input(const std::string& data) {
    std::shared_ptr<runtime::ProcessTask> task;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ != SessionState::Running || !active_task_) {
            return false;
        }
        task = active_task_;
    }
    return task->write_input(data + "\n");
}

bool ExecutionSession::kill() {
    std::shared_ptr<runtime::ProcessTask> task;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!is_busy(state_) || kill_requested_) {
            return false;
        }
        kill_requested_ = true;
        task = active_task_;
    }
    LOG_INFO("Session: " + id_ + " kill requested");
    if (task) {
        static_cast<void>(task->kill());
    }
    return true;
}

void ExecutionSession::handle(const protocol::ClientMessage& message) {
    if (const auto* run = std::get_if<protocol::RunMessage>(&message)) {
        static_cast<void>(submit(run->request));
    } else if (const auto* input = std::get_if<protocol::InputMessage>(&message)) {
        static_cast<void>(send_input(input->data));
    } else if (std::holds_alternative<protocol::KillMessage>(message)) {
        static_cast<void>(kill());
    }
}

void ExecutionSession::close() {
    if (closed_.exchange(true)) {
        return;
    }

    std::shared_ptr<runtime::ProcessTask> task;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        kill_requested_ = true;
        task = active_task_;
    }
    if (task) {
        static_cast<void>(task->kill());
    }

    {
        std::lock_guard<std::mutex> driver_lock(driver_mutex_);
        join_finished_driver();
        for (auto& retired : retired_drivers_) {
            if (retired.get_id() == std::this_thread::get_id()) {
                retired.detach();
            } else if (retired.joinable()) {
                retired.join();
            }
        }
        retired_drivers_.clear();
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (active_task_) {
            static_cast<void>(active_task_->kill());
            active_task_.reset();
        }
        const auto removed = engine_->purge(artifacts_);
        if (removed > 0) {
            LOG_WARN("Session: " + id_ + " purged " + std::to_string(removed) +
                     " artifacts at teardown");
        }
        state_ = SessionState::Idle;
        run_active_ = false;
    }
    idle_cv_.notify_all();
    LOG_INFO("Session: " + id_ + " closed");
}

bool ExecutionSession::wait_for_idle(const std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    return idle_cv_.wait_for(lock, timeout,
                             [this] { return state_ == SessionState::Idle && !run_active_; });
}

SessionState ExecutionSession::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

}  // namespace coderunner::session
