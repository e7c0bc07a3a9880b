#pragma once

#include <string>
#include <nlohmann/json.hpp>
#include "protocol/run_request.hpp"
#include "runtime/execution_engine.hpp"

namespace coderunner::app {

// Accumulated result of a batch run: {"stdout", "stderr", "code"}.
struct BatchResult {
    std::string stdout_text;
    std::string stderr_text;
    int code = -1;
    // True when the run never reached a program or compiler exit
    // (unsupported language, timeout, spawn failure).
    bool engine_error = false;
};

BatchResult run_batch(const runtime::ExecutionEngine& engine,
                      const protocol::ExecutionRequest& request);

nlohmann::json to_json(const BatchResult& result);

}  // namespace coderunner::app
