#include "runtime/process_supervisor.hpp"

#include <chrono>
#include <cerrno>
#include <csignal>
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <system_error>
#include <unistd.h>
#include <utility>
#include <vector>
#include "core/logging/logger.hpp"
#include "pipeline/which.hpp"

namespace coderunner::runtime {

using protocol::OutputStream;

namespace {

constexpr int kPollIntervalMs = 50;
// How long output pipes may stay open after the child exited (held by
// descendants) before the process group is killed.
constexpr std::int64_t kDrainGraceMs = 250;
// Reads (and so sink calls) per drain_pipe call, at most 64 KiB. A child
// that writes faster than the sink consumes cannot keep the loop from its
// deadline check.
constexpr int kMaxDrainReads = 16;

// Stages reported back through the exec error pipe.
constexpr int kStageChdir = 1;
constexpr int kStageExec = 2;

std::once_flag sigpipe_once;

void ignore_sigpipe() {
    std::call_once(sigpipe_once, [] { static_cast<void>(std::signal(SIGPIPE, SIG_IGN)); });
}

std::string errno_message(const int err) {
    return std::error_code(err, std::generic_category()).message();
}

void close_fd(int& fd) {
    if (fd >= 0) {
        static_cast<void>(close(fd));
        fd = -1;
    }
}

void set_nonblocking(const int fd) {
    const int flags = fcntl(fd, F_GETFL, 0);
    if (flags == -1) {
        return;
    }
    static_cast<void>(fcntl(fd, F_SETFL, flags | O_NONBLOCK));
}

// Reads what is available, up to kMaxDrainReads chunks; closes `fd` on EOF or
// error. Each read becomes one chunk so per-stream order is kept.
template <typename Emit>
void drain_pipe(int& fd, Emit&& emit) {
    if (fd < 0) {
        return;
    }

    char buffer[4096];
    int reads = 0;
    while (reads < kMaxDrainReads) {
        const ssize_t n = read(fd, buffer, sizeof(buffer));
        if (n > 0) {
            ++reads;
            emit(std::string(buffer, static_cast<std::size_t>(n)));
            continue;
        }
        if (n == 0) {
            close_fd(fd);
            return;
        }
        if (errno == EINTR) {
            continue;
        }
        if (errno == EAGAIN || errno == EWOULDBLOCK) {
            return;
        }
        close_fd(fd);
        return;
    }
}

int decode_exit_status(const int status) {
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
        return 128 + WTERMSIG(status);
    }
    return -1;
}

std::string describe_command(const pipeline::CommandSpec& command) {
    std::string text = command.program;
    for (const auto& arg : command.args) {
        text += " " + arg;
    }
    return text;
}

}  // namespace

std::string to_string(const ProcessStatus status) {
    switch (status) {
        case ProcessStatus::Exited:
            return "exited";
        case ProcessStatus::TimedOut:
            return "timed_out";
        case ProcessStatus::Killed:
            return "killed";
        case ProcessStatus::SpawnFailed:
            return "spawn_failed";
        default:
            return "unknown";
    }
}

ProcessTask::ProcessTask(pipeline::CommandSpec command, ProcessOptions options,
                         OutputSink sink)
    : command_(std::move(command)),
      options_(std::move(options)),
      sink_(std::move(sink)),
      pending_input_(options_.stdin_text.value_or("")),
      input_closed_(!options_.interactive) {}

ProcessTask::~ProcessTask() {
    static_cast<void>(terminate(Termination::Kill));
    if (monitor_.joinable()) {
        monitor_.join();
    }
}

void ProcessTask::start() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (started_) {
        return;
    }
    started_ = true;
    monitor_ = std::thread([this] { monitor(); });
}

bool ProcessTask::write_input(const std::string& text) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (input_closed_ || finished_ || reaped_) {
        return false;
    }
    if (pending_input_.size() + text.size() > kMaxPendingInputBytes) {
        LOG_WARN("ProcessSupervisor: input queue full, dropping " +
                 std::to_string(text.size()) + " bytes");
        return false;
    }
    pending_input_ += text;
    return true;
}

void ProcessTask::close_input() {
    std::lock_guard<std::mutex> lock(mutex_);
    input_closed_ = true;
}

bool ProcessTask::kill() {
    return terminate(Termination::Kill);
}

bool ProcessTask::terminate(const Termination reason) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (termination_ != Termination::None || finished_ || reaped_) {
        return false;
    }
    termination_ = reason;
    if (pid_ > 0) {
        if (::kill(-pid_, SIGKILL) != 0) {
            static_cast<void>(::kill(pid_, SIGKILL));
        }
    }
    return true;
}

const ProcessOutcome& ProcessTask::wait() {
    start();
    std::unique_lock<std::mutex> lock(mutex_);
    finished_cv_.wait(lock, [this] { return finished_; });
    return outcome_;
}

bool ProcessTask::finished() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return finished_;
}

std::optional<pid_t> ProcessTask::pid() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (pid_ <= 0) {
        return std::nullopt;
    }
    return pid_;
}

void ProcessTask::emit(const OutputStream stream, const std::string& chunk,
                       ProcessOutcome& outcome) const {
    if (options_.capture_output) {
        (stream == OutputStream::Stdout ? outcome.stdout_text : outcome.stderr_text) +=
            chunk;
    }
    if (sink_) {
        sink_(stream, chunk);
    }
}

bool ProcessTask::flush_input(int& stdin_fd) {
    if (stdin_fd < 0) {
        return false;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    while (!pending_input_.empty()) {
        const ssize_t n = write(stdin_fd, pending_input_.data(), pending_input_.size());
        if (n > 0) {
            pending_input_.erase(0, static_cast<std::size_t>(n));
            continue;
        }
        if (n < 0 && errno == EINTR) {
            continue;
        }
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
            return true;
        }
        // EPIPE: the child closed its end; further input goes nowhere.
        pending_input_.clear();
        input_closed_ = true;
        close_fd(stdin_fd);
        return false;
    }
    if (input_closed_) {
        close_fd(stdin_fd);
    }
    return false;
}

void ProcessTask::finish(ProcessOutcome outcome) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        outcome_ = std::move(outcome);
        finished_ = true;
    }
    finished_cv_.notify_all();
}

void ProcessTask::monitor() {
    const auto started = std::chrono::steady_clock::now();
    ProcessOutcome outcome;
    spawn_and_supervise(outcome);
    const auto ended = std::chrono::steady_clock::now();
    outcome.duration_ms =
        std::chrono::duration<double, std::milli>(ended - started).count();

    LOG_DEBUG("ProcessSupervisor: " + command_.program + " finished: " +
              to_string(outcome.status) + " code=" + std::to_string(outcome.exit_code));
    finish(std::move(outcome));
}

void ProcessTask::spawn_and_supervise(ProcessOutcome& outcome) {
    ignore_sigpipe();

    const auto resolved = pipeline::which(command_.program);
    if (!resolved.has_value()) {
        outcome.status = ProcessStatus::SpawnFailed;
        outcome.error_message = "Failed to start '" + command_.program +
                                "': " + errno_message(ENOENT);
        return;
    }

    // Everything the child touches is prepared before fork.
    const std::string executable = resolved->string();
    const std::string cwd = command_.working_directory.string();
    std::vector<std::string> argv_storage;
    argv_storage.reserve(command_.args.size() + 1);
    argv_storage.push_back(command_.program);
    argv_storage.insert(argv_storage.end(), command_.args.begin(), command_.args.end());
    std::vector<char*> argv;
    argv.reserve(argv_storage.size() + 1);
    for (auto& arg : argv_storage) {
        argv.push_back(arg.data());
    }
    argv.push_back(nullptr);

    int stdin_pipe[2] = {-1, -1};
    int stdout_pipe[2] = {-1, -1};
    int stderr_pipe[2] = {-1, -1};
    int error_pipe[2] = {-1, -1};
    auto close_all = [&] {
        for (int* fds : {stdin_pipe, stdout_pipe, stderr_pipe, error_pipe}) {
            close_fd(fds[0]);
            close_fd(fds[1]);
        }
    };

    if (pipe2(stdin_pipe, O_CLOEXEC) != 0 || pipe2(stdout_pipe, O_CLOEXEC) != 0 ||
        pipe2(stderr_pipe, O_CLOEXEC) != 0 || pipe2(error_pipe, O_CLOEXEC) != 0) {
        const int err = errno;
        close_all();
        outcome.status = ProcessStatus::SpawnFailed;
        outcome.error_message = "Failed to create process pipes: " + errno_message(err);
        return;
    }

    std::unique_lock<std::mutex> lock(mutex_);
    if (termination_ == Termination::Kill) {
        lock.unlock();
        close_all();
        outcome.status = ProcessStatus::Killed;
        return;
    }

    const pid_t pid = fork();
    if (pid < 0) {
        const int err = errno;
        lock.unlock();
        close_all();
        outcome.status = ProcessStatus::SpawnFailed;
        outcome.error_message = "Failed to fork process: " + errno_message(err);
        return;
    }

    if (pid == 0) {
        // Child: async-signal-safe calls only.
        static_cast<void>(setpgid(0, 0));
        struct sigaction default_action {};
        default_action.sa_handler = SIG_DFL;
        static_cast<void>(sigaction(SIGPIPE, &default_action, nullptr));

        int report[2] = {kStageChdir, 0};
        if (!cwd.empty() && chdir(cwd.c_str()) != 0) {
            report[1] = errno;
            static_cast<void>(write(error_pipe[1], report, sizeof(report)));
            _exit(127);
        }
        static_cast<void>(dup2(stdin_pipe[0], STDIN_FILENO));
        static_cast<void>(dup2(stdout_pipe[1], STDOUT_FILENO));
        static_cast<void>(dup2(stderr_pipe[1], STDERR_FILENO));
        execv(executable.c_str(), argv.data());
        report[0] = kStageExec;
        report[1] = errno;
        static_cast<void>(write(error_pipe[1], report, sizeof(report)));
        _exit(127);
    }

    // The group exists before anyone can see the pid, so kill(-pid) is valid.
    static_cast<void>(setpgid(pid, pid));
    pid_ = pid;
    lock.unlock();
    LOG_DEBUG("ProcessSupervisor: spawned pid " + std::to_string(pid) + ": " +
              describe_command(command_));

    close_fd(stdin_pipe[0]);
    close_fd(stdout_pipe[1]);
    close_fd(stderr_pipe[1]);
    close_fd(error_pipe[1]);

    // EOF means execv succeeded (CLOEXEC) or the child was killed first.
    int report[2] = {0, 0};
    ssize_t report_bytes = 0;
    do {
        report_bytes = read(error_pipe[0], report, sizeof(report));
    } while (report_bytes < 0 && errno == EINTR);
    close_fd(error_pipe[0]);

    int stdin_fd = stdin_pipe[1];
    int stdout_fd = stdout_pipe[0];
    int stderr_fd = stderr_pipe[0];
    int status = 0;

    if (report_bytes == static_cast<ssize_t>(sizeof(report))) {
        {
            std::lock_guard<std::mutex> reap_lock(mutex_);
            static_cast<void>(waitpid(pid, &status, 0));
            reaped_ = true;
        }
        close_fd(stdin_fd);
        close_fd(stdout_fd);
        close_fd(stderr_fd);
        outcome.status = ProcessStatus::SpawnFailed;
        outcome.error_message =
            "Failed to start '" + command_.program + "': " +
            (report[0] == kStageChdir ? "cannot enter " + cwd + ": " : std::string()) +
            errno_message(report[1]);
        return;
    }

    set_nonblocking(stdin_fd);
    set_nonblocking(stdout_fd);
    set_nonblocking(stderr_fd);

    const auto started = std::chrono::steady_clock::now();
    bool child_exited = false;
    std::chrono::steady_clock::time_point exited_at;
    auto emit_stdout = [&](const std::string& chunk) {
        emit(OutputStream::Stdout, chunk, outcome);
    };
    auto emit_stderr = [&](const std::string& chunk) {
        emit(OutputStream::Stderr, chunk, outcome);
    };

    auto enforce_deadline = [&] {
        if (child_exited || options_.timeout_ms == 0) {
            return;
        }
        const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
                                 std::chrono::steady_clock::now() - started)
                                 .count();
        if (elapsed >= static_cast<std::int64_t>(options_.timeout_ms) &&
            terminate(Termination::Timeout)) {
            LOG_WARN("ProcessSupervisor: pid " + std::to_string(pid) + " exceeded " +
                     std::to_string(options_.timeout_ms) + " ms");
        }
    };

    while (true) {
        enforce_deadline();

        const bool wants_write = flush_input(stdin_fd);

        pollfd fds[3];
        nfds_t nfds = 0;
        if (stdout_fd >= 0) {
            fds[nfds].fd = stdout_fd;
            fds[nfds].events = POLLIN;
            ++nfds;
        }
        if (stderr_fd >= 0) {
            fds[nfds].fd = stderr_fd;
            fds[nfds].events = POLLIN;
            ++nfds;
        }
        if (wants_write && stdin_fd >= 0) {
            fds[nfds].fd = stdin_fd;
            fds[nfds].events = POLLOUT;
            ++nfds;
        }
        static_cast<void>(poll(fds, nfds, kPollIntervalMs));

        enforce_deadline();
        drain_pipe(stdout_fd, emit_stdout);
        enforce_deadline();
        drain_pipe(stderr_fd, emit_stderr);

        if (!child_exited) {
            std::lock_guard<std::mutex> reap_lock(mutex_);
            if (waitpid(pid, &status, WNOHANG) == pid) {
                child_exited = true;
                reaped_ = true;
                exited_at = std::chrono::steady_clock::now();
            }
        }

        if (child_exited) {
            if (stdout_fd < 0 && stderr_fd < 0) {
                break;
            }
            const auto since_exit = std::chrono::duration_cast<std::chrono::milliseconds>(
                                        std::chrono::steady_clock::now() - exited_at)
                                        .count();
            if (since_exit > kDrainGraceMs) {
                // Descendants still hold the pipes open.
                static_cast<void>(::kill(-pid, SIGKILL));
                drain_pipe(stdout_fd, emit_stdout);
                drain_pipe(stderr_fd, emit_stderr);
                close_fd(stdout_fd);
                close_fd(stderr_fd);
                break;
            }
        }
    }
    close_fd(stdin_fd);

    std::lock_guard<std::mutex> result_lock(mutex_);
    switch (termination_) {
        case Termination::Kill:
            outcome.status = ProcessStatus::Killed;
            break;
        case Termination::Timeout:
            outcome.status = ProcessStatus::TimedOut;
            break;
        case Termination::None:
            outcome.status = ProcessStatus::Exited;
            outcome.exit_code = decode_exit_status(status);
            break;
    }
}

std::shared_ptr<ProcessTask> ProcessSupervisor::spawn(pipeline::CommandSpec command,
                                                      ProcessOptions options,
                                                      OutputSink sink) const {
    return std::make_shared<ProcessTask>(std::move(command), std::move(options),
                                         std::move(sink));
}

ProcessOutcome ProcessSupervisor::run_to_completion(pipeline::CommandSpec command,
                                                    ProcessOptions options) const {
    options.capture_output = true;
    auto task = spawn(std::move(command), std::move(options));
    return task->wait();
}

}  // namespace coderunner::runtime
