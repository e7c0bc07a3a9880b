#pragma once

#include <chrono>
#include <iosfwd>
#include <memory>
#include "runtime/execution_engine.hpp"

namespace coderunner::app {

// Binds one ExecutionSession to a line stream: every input line is a client
// message, every event is written as one JSON line. At end of input the
// active run (if any) gets up to `drain_timeout` to finish, then the session
// is torn down.
int run_serve_loop(std::istream& in, std::ostream& out,
                   std::shared_ptr<const runtime::ExecutionEngine> engine,
                   std::chrono::milliseconds drain_timeout);

}  // namespace coderunner::app
