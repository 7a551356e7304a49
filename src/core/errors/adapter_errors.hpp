#pragma once
#include <string>
#include <variant>

namespace docanalyst::core::errors {

    // 1. Typed error categories
    enum class ErrorCategory {
        Input,      // E.g., empty prompt or a bad CLI flag
        Config,     // E.g., adapter.json has a negative retry count
        Process,    // E.g., fork/pipe failed while launching the tool
        Parse,      // E.g., tool stdout is not the expected JSON envelope
        Io          // E.g., temp image could not be written
    };

    struct AdapterError {
        ErrorCategory category;
        std::string message;
        std::string code = "unknown_error";
        std::string hint = "";
    };

    // 2. Result object: either a value of type T or an AdapterError.
    template <typename T>
    using Result = std::variant<T, AdapterError>;

    template <typename T>
    bool is_error(const Result<T>& result) {
        return std::holds_alternative<AdapterError>(result);
    }

    template <typename T>
    const AdapterError& get_error(const Result<T>& result) {
        return std::get<AdapterError>(result);
    }

    template <typename T>
    const T& get_value(const Result<T>& result) {
        return std::get<T>(result);
    }

    inline std::string to_string(const ErrorCategory category) {
        switch (category) {
            case ErrorCategory::Input:    return "input";
            case ErrorCategory::Config:   return "config";
            case ErrorCategory::Process:  return "process";
            case ErrorCategory::Parse:    return "parse";
            case ErrorCategory::Io:       return "io";
            default: return "unknown";
        }
    }

} // namespace docanalyst::core::errors
