#pragma once

#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include "core/config/engine_config.hpp"
#include "core/errors/run_errors.hpp"
#include "pipeline/language_registry.hpp"
#include "protocol/event_contract.hpp"
#include "protocol/run_request.hpp"
#include "runtime/process_supervisor.hpp"
#include "workspace/workspace.hpp"

namespace coderunner::runtime {

enum class RunPhase {
    Build,
    Run
};

enum class RunOutcomeKind {
    Completed,
    BuildFailed,
    TimedOut,
    Killed,
    SpawnFailed,
    Errored
};

struct RunOutcome {
    RunOutcomeKind kind = RunOutcomeKind::Errored;
    RunPhase phase = RunPhase::Build;
    // Program exit code for Completed, compiler exit code for BuildFailed.
    int exit_code = -1;
    // Human-readable detail for every kind but Completed and Killed. For
    // BuildFailed this is the compiler's diagnostics verbatim.
    std::string message;
};

// Everything needed to run one request after its source is on disk.
struct PreparedRun {
    std::filesystem::path source;
    std::optional<pipeline::CommandSpec> build;
    pipeline::CommandSpec run;
};

// Receives the engine's progress for one run. Implemented by the session.
class RunObserver {
public:
    virtual ~RunObserver() = default;

    // Called with each task before it starts. Returning false cancels the
    // run: the task is never started and the outcome is Killed.
    virtual bool on_phase_started(RunPhase phase,
                                  const std::shared_ptr<ProcessTask>& task) = 0;

    // Run-phase output only; build output is captured, not streamed.
    virtual void on_output(protocol::OutputStream stream, const std::string& chunk) = 0;
};

struct EngineLimits {
    std::uint32_t build_timeout_ms = core::config::kDefaultTimeoutMs;
    std::uint32_t run_timeout_ms = core::config::kDefaultTimeoutMs;
};

// Drives Workspace and ProcessSupervisor through build-then-run. Stateless
// between runs and shared by every session.
class ExecutionEngine {
public:
    ExecutionEngine(pipeline::LanguageRegistry registry, workspace::Workspace workspace,
                    EngineLimits limits);

    static std::shared_ptr<ExecutionEngine> from_config(
        const core::config::EngineConfig& config);

    core::errors::Result<const pipeline::LanguagePipeline*> resolve(
        const protocol::ExecutionRequest& request) const;

    // Writes the (rewritten) source and records every path the run may
    // create in `artifacts` before anything is spawned.
    core::errors::Result<PreparedRun> materialize(
        const pipeline::LanguagePipeline& pipeline,
        const protocol::ExecutionRequest& request,
        workspace::ArtifactSet& artifacts) const;

    // Straight-line build-then-run on the calling thread. Does not purge;
    // the owner of `artifacts` does.
    RunOutcome execute(const protocol::ExecutionRequest& request,
                       protocol::RunMode mode, workspace::ArtifactSet& artifacts,
                       RunObserver& observer) const;

    std::size_t purge(workspace::ArtifactSet& artifacts) const;

    const workspace::Workspace& workspace() const { return workspace_; }
    const pipeline::LanguageRegistry& registry() const { return registry_; }

private:
    RunOutcome run_build(const pipeline::CommandSpec& command,
                         RunObserver& observer) const;
    RunOutcome run_program(const pipeline::CommandSpec& command,
                           const protocol::ExecutionRequest& request,
                           protocol::RunMode mode, RunObserver& observer) const;

    pipeline::LanguageRegistry registry_;
    workspace::Workspace workspace_;
    EngineLimits limits_;
    ProcessSupervisor supervisor_;
};

// "8 seconds", "1 second", "250 milliseconds"
std::string describe_budget(std::uint32_t timeout_ms);

std::string to_string(RunOutcomeKind kind);

}  // namespace coderunner::runtime
