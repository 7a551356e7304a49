#pragma once

#include <string>
#include <nlohmann/json.hpp>
#include "cli/response_envelope.hpp"

namespace docanalyst::service {

enum class FailureKind {
    None,
    ProcessTimeout,
    TransientToolError,
    TerminalToolError,
    MalformedResponse,
    EmptyPayload,
    UnclassifiedError
};

// Result of a single external-tool invocation, before any retry decision.
struct CallOutcome {
    FailureKind failure = FailureKind::None;
    nlohmann::json structured_output = nlohmann::json::object();
    cli::TokenUsage usage;
    std::string message;

    bool succeeded() const { return failure == FailureKind::None; }
};

inline bool is_retryable(const FailureKind kind) {
    return kind == FailureKind::ProcessTimeout ||
           kind == FailureKind::TransientToolError ||
           kind == FailureKind::EmptyPayload;
}

inline std::string to_string(const FailureKind kind) {
    switch (kind) {
        case FailureKind::None:
            return "none";
        case FailureKind::ProcessTimeout:
            return "process_timeout";
        case FailureKind::TransientToolError:
            return "transient_tool_error";
        case FailureKind::TerminalToolError:
            return "terminal_tool_error";
        case FailureKind::MalformedResponse:
            return "malformed_response";
        case FailureKind::EmptyPayload:
            return "empty_payload";
        case FailureKind::UnclassifiedError:
            return "unclassified_error";
        default:
            return "unknown";
    }
}

}  // namespace docanalyst::service
