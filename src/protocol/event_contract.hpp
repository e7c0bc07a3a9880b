#pragma once
#include <string>
#include <variant>
#include <nlohmann/json.hpp>
#include "core/errors/run_errors.hpp"

namespace coderunner::protocol {

    enum class OutputStream {
        Stdout,
        Stderr
    };

    // Non-terminal: one chunk of program output, in production order per stream
    struct OutputEvent {
        OutputStream stream;
        std::string data;
    };

    // Terminal events. Exactly one ends every accepted run.
    struct ExitEvent { int code; };
    struct ManualKillEvent {};
    struct ErrorEvent {
        core::errors::ErrorCategory category;
        std::string message;
    };

    using ExecutionEvent = std::variant<
        OutputEvent,
        ExitEvent,
        ManualKillEvent,
        ErrorEvent
    >;

    inline std::string to_string(const OutputStream stream) {
        return stream == OutputStream::Stdout ? "stdout" : "stderr";
    }

    inline bool is_terminal(const ExecutionEvent& event) {
        return !std::holds_alternative<OutputEvent>(event);
    }

    inline nlohmann::json to_json(const ExecutionEvent& event) {
        nlohmann::json payload;
        if (const auto* output = std::get_if<OutputEvent>(&event)) {
            payload["type"] = to_string(output->stream);
            payload["data"] = output->data;
        } else if (const auto* exit = std::get_if<ExitEvent>(&event)) {
            payload["type"] = "exit";
            payload["code"] = exit->code;
        } else if (std::holds_alternative<ManualKillEvent>(event)) {
            payload["type"] = "exit";
            payload["code"] = "manual_kill";
        } else {
            payload["type"] = "error";
            payload["error"] = std::get<ErrorEvent>(event).message;
        }
        return payload;
    }

    // Program output is arbitrary bytes; invalid UTF-8 is replaced, never thrown on.
    inline std::string serialize(const ExecutionEvent& event) {
        return to_json(event).dump(-1, ' ', false,
                                   nlohmann::json::error_handler_t::replace);
    }

} // namespace coderunner::protocol
