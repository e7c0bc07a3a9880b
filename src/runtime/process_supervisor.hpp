#pragma once

#include <sys/types.h>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include "pipeline/language_registry.hpp"
#include "protocol/event_contract.hpp"

namespace coderunner::runtime {

enum class ProcessStatus {
    Exited,
    TimedOut,
    Killed,
    SpawnFailed
};

struct ProcessOutcome {
    ProcessStatus status = ProcessStatus::SpawnFailed;
    // Real exit code for Exited; 128 + signal if the child died from a signal
    // it was not sent by us. -1 otherwise.
    int exit_code = -1;
    std::string stdout_text;
    std::string stderr_text;
    std::string error_message;
    double duration_ms = 0.0;
};

struct ProcessOptions {
    // Written to stdin right after spawn.
    std::optional<std::string> stdin_text;
    // Keep stdin open after `stdin_text` so write_input can feed more.
    bool interactive = false;
    std::uint32_t timeout_ms = 8000;
    // Accumulate output into the outcome in addition to streaming it.
    bool capture_output = true;
};

// Input queued by write_input and not yet taken by the child.
constexpr std::size_t kMaxPendingInputBytes = 1024 * 1024;

using OutputSink = std::function<void(protocol::OutputStream, const std::string&)>;

// One supervised child process. Created idle; start() spawns it on a
// monitor thread that streams output to the sink and produces exactly one
// outcome. All public methods are safe to call from any thread.
class ProcessTask {
public:
    ProcessTask(pipeline::CommandSpec command, ProcessOptions options,
                OutputSink sink);
    ~ProcessTask();

    ProcessTask(const ProcessTask&) = delete;
    ProcessTask& operator=(const ProcessTask&) = delete;

    void start();

    // Queues `text` for the child's stdin. Never blocks on the child.
    // Returns false once stdin is closed, the task has finished, or the
    // queue would exceed kMaxPendingInputBytes.
    bool write_input(const std::string& text);

    // Closes stdin after everything queued so far has been written.
    void close_input();

    // SIGKILLs the child's process group. Returns true only for the call
    // that initiated termination; later calls, or calls after exit, are
    // no-ops. A task killed before it spawned never spawns.
    bool kill();

    // Blocks until the outcome is known. Must follow start().
    const ProcessOutcome& wait();

    bool finished() const;
    std::optional<pid_t> pid() const;

private:
    enum class Termination {
        None,
        Timeout,
        Kill
    };

    void monitor();
    void spawn_and_supervise(ProcessOutcome& outcome);
    bool terminate(Termination reason);
    // Writes queued input without blocking; true while data is still queued.
    bool flush_input(int& stdin_fd);
    void emit(protocol::OutputStream stream, const std::string& chunk,
              ProcessOutcome& outcome) const;
    void finish(ProcessOutcome outcome);

    const pipeline::CommandSpec command_;
    const ProcessOptions options_;
    const OutputSink sink_;

    mutable std::mutex mutex_;
    std::condition_variable finished_cv_;
    std::thread monitor_;
    pid_t pid_ = -1;
    bool started_ = false;
    bool reaped_ = false;
    bool finished_ = false;
    Termination termination_ = Termination::None;
    std::string pending_input_;
    bool input_closed_ = false;
    ProcessOutcome outcome_;
};

class ProcessSupervisor {
public:
    // Creates an idle task; the caller decides when to start() it.
    std::shared_ptr<ProcessTask> spawn(pipeline::CommandSpec command,
                                       ProcessOptions options,
                                       OutputSink sink = nullptr) const;

    // Spawns, waits and returns the accumulated outcome.
    ProcessOutcome run_to_completion(pipeline::CommandSpec command,
                                     ProcessOptions options) const;
};

std::string to_string(ProcessStatus status);

}  // namespace coderunner::runtime
