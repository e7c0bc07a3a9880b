#include "protocol/message_contract.hpp"

#include <utility>
#include <nlohmann/json.hpp>

namespace coderunner::protocol {

using core::errors::ErrorCategory;
using core::errors::RunError;
using nlohmann::json;

namespace {

RunError invalid_message(const std::string& detail) {
    return RunError{ErrorCategory::Input, "Invalid request: " + detail,
                    "invalid_message"};
}

core::errors::Result<ClientMessage> parse_run(const json& message) {
    if (!message.contains("language") || !message["language"].is_string()) {
        return invalid_message("'language' must be a string");
    }
    if (!message.contains("code") || !message["code"].is_string()) {
        return invalid_message("'code' must be a string");
    }

    RunMessage run;
    run.request.language = message["language"].get<std::string>();
    run.request.source_text = message["code"].get<std::string>();
    if (message.contains("input") && !message["input"].is_null()) {
        if (!message["input"].is_string()) {
            return invalid_message("'input' must be a string");
        }
        run.request.stdin_text = message["input"].get<std::string>();
    }
    return ClientMessage{std::move(run)};
}

}  // namespace

core::errors::Result<ClientMessage> parse_client_message(const std::string& raw) {
    const json message = json::parse(raw, nullptr, false);
    if (message.is_discarded()) {
        return RunError{ErrorCategory::Input, "Invalid JSON", "invalid_json"};
    }
    if (!message.is_object()) {
        return invalid_message("message must be a JSON object");
    }
    if (!message.contains("type") || !message["type"].is_string()) {
        return invalid_message("'type' must be a string");
    }

    const std::string type = message["type"].get<std::string>();
    if (type == "run") {
        return parse_run(message);
    }
    if (type == "input") {
        if (!message.contains("data") || !message["data"].is_string()) {
            return invalid_message("'data' must be a string");
        }
        return ClientMessage{InputMessage{message["data"].get<std::string>()}};
    }
    if (type == "kill") {
        return ClientMessage{KillMessage{}};
    }
    return invalid_message("unknown type '" + type + "'");
}

}  // namespace coderunner::protocol
