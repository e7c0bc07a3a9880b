#include <chrono>
#include <mutex>
#include <string>
#include <thread>
#include <gtest/gtest.h>
#include "pipeline/language_registry.hpp"
#include "runtime/process_supervisor.hpp"

namespace {

using coderunner::pipeline::CommandSpec;
using coderunner::protocol::OutputStream;
using coderunner::runtime::ProcessOptions;
using coderunner::runtime::ProcessStatus;
using coderunner::runtime::ProcessSupervisor;

CommandSpec shell(const std::string& script) {
    CommandSpec command;
    command.program = "sh";
    command.args = {"-c", script};
    return command;
}

ProcessOptions with_timeout(std::uint32_t timeout_ms) {
    ProcessOptions options;
    options.timeout_ms = timeout_ms;
    return options;
}

// Thread-safe sink that records what the child printed.
class OutputCollector {
public:
    coderunner::runtime::OutputSink sink() {
        return [this](OutputStream stream, const std::string& chunk) {
            std::lock_guard<std::mutex> lock(mutex_);
            (stream == OutputStream::Stdout ? stdout_ : stderr_) += chunk;
        };
    }

    std::string stdout_text() {
        std::lock_guard<std::mutex> lock(mutex_);
        return stdout_;
    }

    // Polls until stdout contains `needle` or the deadline passes.
    bool wait_for_stdout(const std::string& needle, std::chrono::milliseconds deadline) {
        const auto until = std::chrono::steady_clock::now() + deadline;
        while (std::chrono::steady_clock::now() < until) {
            if (stdout_text().find(needle) != std::string::npos) {
                return true;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
        return false;
    }

private:
    std::mutex mutex_;
    std::string stdout_;
    std::string stderr_;
};

TEST(ProcessSupervisorTest, CapturesOutputAndExitCode) {
    ProcessSupervisor supervisor;
    const auto outcome = supervisor.run_to_completion(
        shell("echo hello; echo oops >&2; exit 3"), with_timeout(5000));

    EXPECT_EQ(outcome.status, ProcessStatus::Exited);
    EXPECT_EQ(outcome.exit_code, 3);
    EXPECT_EQ(outcome.stdout_text, "hello\n");
    EXPECT_EQ(outcome.stderr_text, "oops\n");
    EXPECT_TRUE(outcome.error_message.empty());
}

TEST(ProcessSupervisorTest, FeedsStdinTextThenCloses) {
    ProcessSupervisor supervisor;
    auto options = with_timeout(5000);
    options.stdin_text = "line one\nline two\n";
    const auto outcome = supervisor.run_to_completion(shell("cat"), options);

    EXPECT_EQ(outcome.status, ProcessStatus::Exited);
    EXPECT_EQ(outcome.exit_code, 0);
    EXPECT_EQ(outcome.stdout_text, "line one\nline two\n");
}

TEST(ProcessSupervisorTest, WithoutStdinTextReadersSeeEof) {
    ProcessSupervisor supervisor;
    const auto outcome = supervisor.run_to_completion(
        shell("if read line; then echo got; else echo eof; fi"), with_timeout(5000));
    EXPECT_EQ(outcome.stdout_text, "eof\n");
}

TEST(ProcessSupervisorTest, LargeOutputIsNotTruncated) {
    ProcessSupervisor supervisor;
    const auto outcome = supervisor.run_to_completion(
        shell("i=0; while [ $i -lt 20000 ]; do echo 0123456789; i=$((i+1)); done"),
        with_timeout(20000));
    EXPECT_EQ(outcome.status, ProcessStatus::Exited);
    EXPECT_EQ(outcome.stdout_text.size(), 20000u * 11u);
}

TEST(ProcessSupervisorTest, InteractiveInputIsForwarded) {
    ProcessSupervisor supervisor;
    OutputCollector collector;
    auto options = with_timeout(5000);
    options.interactive = true;
    options.capture_output = false;
    auto task = supervisor.spawn(
        shell("echo ready; read name; echo hello $name; read more; echo bye $more"),
        options, collector.sink());
    task->start();

    ASSERT_TRUE(collector.wait_for_stdout("ready", std::chrono::milliseconds(3000)));
    EXPECT_TRUE(task->write_input("world\n"));
    ASSERT_TRUE(collector.wait_for_stdout("hello world", std::chrono::milliseconds(3000)));
    EXPECT_TRUE(task->write_input("now\n"));

    const auto& outcome = task->wait();
    EXPECT_EQ(outcome.status, ProcessStatus::Exited);
    EXPECT_EQ(outcome.exit_code, 0);
    EXPECT_TRUE(outcome.stdout_text.empty());
    EXPECT_EQ(collector.stdout_text(), "ready\nhello world\nbye now\n");
    EXPECT_FALSE(task->write_input("late\n"));
}

TEST(ProcessSupervisorTest, CloseInputDeliversEof) {
    ProcessSupervisor supervisor;
    auto options = with_timeout(5000);
    options.interactive = true;
    auto task = supervisor.spawn(shell("cat; echo done"), options);
    task->start();
    EXPECT_TRUE(task->write_input("abc\n"));
    task->close_input();
    EXPECT_FALSE(task->write_input("ignored\n"));

    const auto& outcome = task->wait();
    EXPECT_EQ(outcome.status, ProcessStatus::Exited);
    EXPECT_EQ(outcome.stdout_text, "abc\ndone\n");
}

TEST(ProcessSupervisorTest, TimesOutAndKillsTheGroup) {
    ProcessSupervisor supervisor;
    const auto started = std::chrono::steady_clock::now();
    // The background sleep keeps the pipes open; only a group kill ends it.
    const auto outcome = supervisor.run_to_completion(
        shell("sleep 30 & sleep 30"), with_timeout(300));
    const auto elapsed = std::chrono::steady_clock::now() - started;

    EXPECT_EQ(outcome.status, ProcessStatus::TimedOut);
    EXPECT_EQ(outcome.exit_code, -1);
    EXPECT_LT(elapsed, std::chrono::seconds(5));
}

TEST(ProcessSupervisorTest, TimeoutHoldsAgainstOutputFloodAndSlowSink) {
    ProcessSupervisor supervisor;
    auto options = with_timeout(300);
    options.capture_output = false;
    auto task = supervisor.spawn(
        shell("yes"), options, [](OutputStream, const std::string&) {
            std::this_thread::sleep_for(std::chrono::microseconds(200));
        });
    task->start();

    const auto& outcome = task->wait();
    EXPECT_EQ(outcome.status, ProcessStatus::TimedOut);
    EXPECT_LT(outcome.duration_ms, 5000.0);
}

TEST(ProcessSupervisorTest, InputQueueIsBounded) {
    ProcessSupervisor supervisor;
    auto options = with_timeout(30000);
    options.interactive = true;
    auto task = supervisor.spawn(shell("sleep 30"), options);
    task->start();

    const std::string chunk(64 * 1024, 'x');
    std::size_t accepted = 0;
    bool rejected = false;
    for (int i = 0; i < 200 && !rejected; ++i) {
        if (task->write_input(chunk)) {
            accepted += chunk.size();
        } else {
            rejected = true;
        }
    }
    EXPECT_TRUE(rejected);
    // The queue plus what the pipe itself absorbed.
    EXPECT_LE(accepted, coderunner::runtime::kMaxPendingInputBytes + 4u * 1024u * 1024u);

    EXPECT_TRUE(task->kill());
    EXPECT_EQ(task->wait().status, ProcessStatus::Killed);
}

TEST(ProcessSupervisorTest, KillEndsRunningProcessOnce) {
    ProcessSupervisor supervisor;
    OutputCollector collector;
    auto options = with_timeout(30000);
    options.interactive = true;
    auto task = supervisor.spawn(shell("echo ready; sleep 30"), options, collector.sink());
    task->start();
    ASSERT_TRUE(collector.wait_for_stdout("ready", std::chrono::milliseconds(3000)));
    ASSERT_TRUE(task->pid().has_value());

    EXPECT_TRUE(task->kill());
    EXPECT_FALSE(task->kill());
    const auto& outcome = task->wait();
    EXPECT_EQ(outcome.status, ProcessStatus::Killed);
    EXPECT_LT(outcome.duration_ms, 5000.0);
    EXPECT_TRUE(task->finished());
    EXPECT_FALSE(task->kill());
}

TEST(ProcessSupervisorTest, KillBeforeStartNeverSpawns) {
    ProcessSupervisor supervisor;
    auto task = supervisor.spawn(shell("echo should-not-run"), with_timeout(5000));
    EXPECT_TRUE(task->kill());

    const auto& outcome = task->wait();
    EXPECT_EQ(outcome.status, ProcessStatus::Killed);
    EXPECT_TRUE(outcome.stdout_text.empty());
    EXPECT_FALSE(task->pid().has_value());
}

TEST(ProcessSupervisorTest, MissingProgramIsSpawnFailure) {
    ProcessSupervisor supervisor;
    CommandSpec command;
    command.program = "coderunner-no-such-interpreter";
    command.args = {"main.py"};
    const auto outcome = supervisor.run_to_completion(command, with_timeout(5000));

    EXPECT_EQ(outcome.status, ProcessStatus::SpawnFailed);
    EXPECT_NE(outcome.error_message.find("Failed to start 'coderunner-no-such-interpreter'"),
              std::string::npos);
}

TEST(ProcessSupervisorTest, MissingWorkingDirectoryIsSpawnFailure) {
    ProcessSupervisor supervisor;
    auto command = shell("echo hi");
    command.working_directory = "/nonexistent/coderunner/dir";
    const auto outcome = supervisor.run_to_completion(command, with_timeout(5000));

    EXPECT_EQ(outcome.status, ProcessStatus::SpawnFailed);
    EXPECT_NE(outcome.error_message.find("cannot enter"), std::string::npos);
}

TEST(ProcessSupervisorTest, ExitsWhileDescendantHoldsPipes) {
    ProcessSupervisor supervisor;
    const auto outcome = supervisor.run_to_completion(
        shell("sleep 30 & echo done"), with_timeout(10000));

    EXPECT_EQ(outcome.status, ProcessStatus::Exited);
    EXPECT_EQ(outcome.exit_code, 0);
    EXPECT_EQ(outcome.stdout_text, "done\n");
    EXPECT_LT(outcome.duration_ms, 5000.0);
}

TEST(ProcessSupervisorTest, SignalDeathMapsTo128PlusSignal) {
    ProcessSupervisor supervisor;
    const auto outcome = supervisor.run_to_completion(shell("kill -TERM $$"),
                                                      with_timeout(5000));
    EXPECT_EQ(outcome.status, ProcessStatus::Exited);
    EXPECT_EQ(outcome.exit_code, 128 + 15);
}

TEST(ProcessSupervisorTest, ChildThatIgnoresStdinDoesNotBreakWriter) {
    ProcessSupervisor supervisor;
    auto options = with_timeout(5000);
    options.stdin_text = std::string(1 << 20, 'x');
    const auto outcome = supervisor.run_to_completion(shell("exit 0"), options);
    EXPECT_EQ(outcome.status, ProcessStatus::Exited);
    EXPECT_EQ(outcome.exit_code, 0);
}

}  // namespace
