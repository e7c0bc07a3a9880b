#pragma once
#include <string>
#include <variant>
#include "core/errors/run_errors.hpp"
#include "protocol/run_request.hpp"

namespace coderunner::protocol {

    // The three requests a client may send to its session.
    struct RunMessage { ExecutionRequest request; };
    struct InputMessage { std::string data; };
    struct KillMessage {};

    using ClientMessage = std::variant<RunMessage, InputMessage, KillMessage>;

    // Unparseable text fails with message "Invalid JSON" (code "invalid_json");
    // well-formed JSON of the wrong shape fails with code "invalid_message".
    core::errors::Result<ClientMessage> parse_client_message(const std::string& raw);

} // namespace coderunner::protocol
