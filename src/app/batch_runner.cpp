#include "app/batch_runner.hpp"

#include <mutex>
#include "core/logging/logger.hpp"
#include "workspace/workspace.hpp"

namespace coderunner::app {

using runtime::RunOutcomeKind;

namespace {

class CollectingObserver : public runtime::RunObserver {
public:
    bool on_phase_started(runtime::RunPhase,
                          const std::shared_ptr<runtime::ProcessTask>&) override {
        return true;
    }

    void on_output(const protocol::OutputStream stream, const std::string& chunk) override {
        std::lock_guard<std::mutex> lock(mutex_);
        (stream == protocol::OutputStream::Stdout ? stdout_text_ : stderr_text_) += chunk;
    }

    std::string stdout_text() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return stdout_text_;
    }

    std::string stderr_text() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return stderr_text_;
    }

private:
    mutable std::mutex mutex_;
    std::string stdout_text_;
    std::string stderr_text_;
};

}  // namespace

BatchResult run_batch(const runtime::ExecutionEngine& engine,
                      const protocol::ExecutionRequest& request) {
    CollectingObserver observer;
    workspace::ArtifactSet artifacts;
    const auto outcome =
        engine.execute(request, protocol::RunMode::Batch, artifacts, observer);
    const auto removed = engine.purge(artifacts);
    LOG_DEBUG("BatchRunner: " + runtime::to_string(outcome.kind) + ", removed " +
              std::to_string(removed) + " artifacts");

    BatchResult result;
    switch (outcome.kind) {
        case RunOutcomeKind::Completed:
            result.stdout_text = observer.stdout_text();
            result.stderr_text = observer.stderr_text();
            result.code = outcome.exit_code;
            break;
        case RunOutcomeKind::BuildFailed:
            result.stderr_text = outcome.message;
            result.code = outcome.exit_code;
            break;
        case RunOutcomeKind::Killed:
            result.stderr_text = "Execution was cancelled.";
            result.engine_error = true;
            break;
        default:
            result.stderr_text = outcome.message;
            result.engine_error = true;
            break;
    }
    return result;
}

nlohmann::json to_json(const BatchResult& result) {
    nlohmann::json payload;
    payload["stdout"] = result.stdout_text;
    payload["stderr"] = result.stderr_text;
    payload["code"] = result.code;
    return payload;
}

}  // namespace coderunner::app
