#pragma once
#include <optional>
#include <string>

namespace coderunner::protocol {

    // A validated (language, source, stdin) triple. Immutable once submitted.
    struct ExecutionRequest {
        std::string language;
        std::string source_text;
        std::optional<std::string> stdin_text;
    };

    // Batch runs close stdin after writing `stdin_text`; interactive runs
    // keep it open for `input` messages.
    enum class RunMode {
        Batch,
        Interactive
    };

} // namespace coderunner::protocol
