#include "app/serve_loop.hpp"

#include <istream>
#include <mutex>
#include <ostream>
#include <string>
#include <utility>
#include "core/logging/logger.hpp"
#include "protocol/event_contract.hpp"
#include "protocol/message_contract.hpp"
#include "session/execution_session.hpp"

namespace coderunner::app {

namespace {

bool is_blank(const std::string& line) {
    return line.find_first_not_of(" \t\r\n") == std::string::npos;
}

}  // namespace

int run_serve_loop(std::istream& in, std::ostream& out,
                   std::shared_ptr<const runtime::ExecutionEngine> engine,
                   const std::chrono::milliseconds drain_timeout) {
    std::mutex out_mutex;
    auto write_event = [&out, &out_mutex](const protocol::ExecutionEvent& event) {
        std::lock_guard<std::mutex> lock(out_mutex);
        out << protocol::serialize(event) << '\n';
        out.flush();
    };

    session::ExecutionSession session(std::move(engine), write_event);
    core::logging::Logger::get().set_tag(session.id());

    std::string line;
    while (std::getline(in, line)) {
        if (is_blank(line)) {
            continue;
        }
        auto parsed = protocol::parse_client_message(line);
        if (core::errors::is_error(parsed)) {
            const auto& err = core::errors::get_error(parsed);
            LOG_DEBUG("ServeLoop: rejected message [" + err.code + "]: " + err.message);
            write_event(protocol::ErrorEvent{err.category, err.message});
            continue;
        }
        session.handle(core::errors::get_value(parsed));
    }

    LOG_INFO("ServeLoop: input closed");
    if (!session.wait_for_idle(drain_timeout)) {
        LOG_WARN("ServeLoop: run still active after input closed, tearing down");
    }
    session.close();
    return 0;
}

}  // namespace coderunner::app
