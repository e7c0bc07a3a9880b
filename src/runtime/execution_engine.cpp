#include "runtime/execution_engine.hpp"

#include <utility>
#include "core/logging/logger.hpp"

namespace coderunner::runtime {

using core::errors::ErrorCategory;
using core::errors::RunError;
using pipeline::CommandSpec;
using pipeline::LanguagePipeline;
using pipeline::PathBindings;
using pipeline::SourceLayout;
using protocol::ExecutionRequest;
using protocol::RunMode;

namespace {

RunOutcome make_outcome(const RunOutcomeKind kind, const RunPhase phase,
                        std::string message = "", const int exit_code = -1) {
    RunOutcome outcome;
    outcome.kind = kind;
    outcome.phase = phase;
    outcome.message = std::move(message);
    outcome.exit_code = exit_code;
    return outcome;
}

std::string build_failure_detail(const ProcessOutcome& outcome) {
    if (!outcome.stderr_text.empty()) {
        return outcome.stderr_text;
    }
    if (!outcome.stdout_text.empty()) {
        return outcome.stdout_text;
    }
    return "Build failed with exit code " + std::to_string(outcome.exit_code);
}

}  // namespace

std::string describe_budget(const std::uint32_t timeout_ms) {
    if (timeout_ms % 1000 == 0) {
        const auto seconds = timeout_ms / 1000;
        return std::to_string(seconds) + (seconds == 1 ? " second" : " seconds");
    }
    return std::to_string(timeout_ms) + " milliseconds";
}

std::string to_string(const RunOutcomeKind kind) {
    switch (kind) {
        case RunOutcomeKind::Completed:
            return "completed";
        case RunOutcomeKind::BuildFailed:
            return "build_failed";
        case RunOutcomeKind::TimedOut:
            return "timed_out";
        case RunOutcomeKind::Killed:
            return "killed";
        case RunOutcomeKind::SpawnFailed:
            return "spawn_failed";
        case RunOutcomeKind::Errored:
            return "errored";
        default:
            return "unknown";
    }
}

ExecutionEngine::ExecutionEngine(pipeline::LanguageRegistry registry,
                                 workspace::Workspace workspace,
                                 const EngineLimits limits)
    : registry_(std::move(registry)),
      workspace_(std::move(workspace)),
      limits_(limits) {}

std::shared_ptr<ExecutionEngine> ExecutionEngine::from_config(
    const core::config::EngineConfig& config) {
    return std::make_shared<ExecutionEngine>(
        pipeline::LanguageRegistry::with_defaults(config.toolchain),
        workspace::Workspace(config.scratch_dir),
        EngineLimits{config.build_timeout_ms, config.run_timeout_ms});
}

core::errors::Result<const LanguagePipeline*> ExecutionEngine::resolve(
    const ExecutionRequest& request) const {
    return registry_.resolve(request.language);
}

core::errors::Result<PreparedRun> ExecutionEngine::materialize(
    const LanguagePipeline& pipeline, const ExecutionRequest& request,
    workspace::ArtifactSet& artifacts) const {
    auto root_result = workspace_.ensure_root();
    if (core::errors::is_error(root_result)) {
        return core::errors::get_error(root_result);
    }

    const std::string source_text = pipeline.rewrite_source
                                        ? pipeline.rewrite_source(request.source_text)
                                        : request.source_text;

    PathBindings bindings;
    bindings.scratch = core::errors::get_value(root_result);
    bindings.entry = pipeline.entry_point;

    if (pipeline.layout == SourceLayout::PrivateDirectory) {
        auto dir_result = workspace_.allocate_directory();
        if (core::errors::is_error(dir_result)) {
            return core::errors::get_error(dir_result);
        }
        bindings.dir = core::errors::get_value(dir_result);
        artifacts.add(bindings.dir);

        auto source_result = workspace_.allocate_in(
            bindings.dir, pipeline.entry_point + "." + pipeline.source_extension,
            source_text);
        if (core::errors::is_error(source_result)) {
            return core::errors::get_error(source_result);
        }
        bindings.source = core::errors::get_value(source_result);
    } else {
        auto source_result = workspace_.allocate(pipeline.source_extension, source_text);
        if (core::errors::is_error(source_result)) {
            return core::errors::get_error(source_result);
        }
        bindings.source = core::errors::get_value(source_result);
        bindings.dir = bindings.source.parent_path();
    }
    artifacts.add(bindings.source);

    if (!pipeline.output_extension.empty()) {
        bindings.output = workspace::Workspace::derived_path(bindings.source,
                                                             pipeline.output_extension);
        artifacts.add(bindings.output);
    }

    PreparedRun prepared;
    prepared.source = bindings.source;
    if (pipeline.build.has_value()) {
        prepared.build = pipeline::bind(pipeline.build.value(), bindings);
    }
    prepared.run = pipeline::bind(pipeline.run, bindings);
    return prepared;
}

RunOutcome ExecutionEngine::execute(const ExecutionRequest& request, const RunMode mode,
                                    workspace::ArtifactSet& artifacts,
                                    RunObserver& observer) const {
    auto resolved = resolve(request);
    if (core::errors::is_error(resolved)) {
        return make_outcome(RunOutcomeKind::Errored, RunPhase::Build,
                            core::errors::get_error(resolved).message);
    }
    const LanguagePipeline& pipeline = *core::errors::get_value(resolved);

    auto prepared_result = materialize(pipeline, request, artifacts);
    if (core::errors::is_error(prepared_result)) {
        const auto& err = core::errors::get_error(prepared_result);
        LOG_ERROR("ExecutionEngine: materialize failed [" + err.code + "]: " +
                  err.message);
        return make_outcome(RunOutcomeKind::Errored, RunPhase::Build, err.message);
    }
    const auto& prepared = core::errors::get_value(prepared_result);

    if (prepared.build.has_value()) {
        auto build_outcome = run_build(prepared.build.value(), observer);
        if (build_outcome.kind != RunOutcomeKind::Completed) {
            return build_outcome;
        }
    }
    return run_program(prepared.run, request, mode, observer);
}

RunOutcome ExecutionEngine::run_build(const CommandSpec& command,
                                      RunObserver& observer) const {
    ProcessOptions options;
    options.interactive = false;
    options.timeout_ms = limits_.build_timeout_ms;
    options.capture_output = true;

    auto task = supervisor_.spawn(command, options);
    if (!observer.on_phase_started(RunPhase::Build, task)) {
        return make_outcome(RunOutcomeKind::Killed, RunPhase::Build);
    }
    task->start();
    const ProcessOutcome& outcome = task->wait();

    switch (outcome.status) {
        case ProcessStatus::Killed:
            return make_outcome(RunOutcomeKind::Killed, RunPhase::Build);
        case ProcessStatus::TimedOut:
            return make_outcome(RunOutcomeKind::TimedOut, RunPhase::Build,
                                "Build timed out after " +
                                    describe_budget(limits_.build_timeout_ms));
        case ProcessStatus::SpawnFailed:
            return make_outcome(RunOutcomeKind::SpawnFailed, RunPhase::Build,
                                outcome.error_message);
        case ProcessStatus::Exited:
            break;
    }

    if (outcome.exit_code != 0) {
        LOG_INFO("ExecutionEngine: build failed with exit code " +
                 std::to_string(outcome.exit_code));
        return make_outcome(RunOutcomeKind::BuildFailed, RunPhase::Build,
                            build_failure_detail(outcome), outcome.exit_code);
    }
    return make_outcome(RunOutcomeKind::Completed, RunPhase::Build, "", 0);
}

RunOutcome ExecutionEngine::run_program(const CommandSpec& command,
                                        const ExecutionRequest& request,
                                        const RunMode mode,
                                        RunObserver& observer) const {
    ProcessOptions options;
    options.stdin_text = request.stdin_text;
    options.interactive = mode == RunMode::Interactive;
    options.timeout_ms = limits_.run_timeout_ms;
    options.capture_output = false;

    auto task = supervisor_.spawn(
        command, options,
        [&observer](const protocol::OutputStream stream, const std::string& chunk) {
            observer.on_output(stream, chunk);
        });
    if (!observer.on_phase_started(RunPhase::Run, task)) {
        return make_outcome(RunOutcomeKind::Killed, RunPhase::Run);
    }
    task->start();
    const ProcessOutcome& outcome = task->wait();

    switch (outcome.status) {
        case ProcessStatus::Killed:
            return make_outcome(RunOutcomeKind::Killed, RunPhase::Run);
        case ProcessStatus::TimedOut:
            return make_outcome(RunOutcomeKind::TimedOut, RunPhase::Run,
                                "Program timed out after " +
                                    describe_budget(limits_.run_timeout_ms));
        case ProcessStatus::SpawnFailed:
            return make_outcome(RunOutcomeKind::SpawnFailed, RunPhase::Run,
                                outcome.error_message);
        case ProcessStatus::Exited:
            break;
    }
    return make_outcome(RunOutcomeKind::Completed, RunPhase::Run, "", outcome.exit_code);
}

std::size_t ExecutionEngine::purge(workspace::ArtifactSet& artifacts) const {
    if (artifacts.empty()) {
        return 0;
    }
    return workspace_.release(artifacts.take());
}

}  // namespace coderunner::runtime
