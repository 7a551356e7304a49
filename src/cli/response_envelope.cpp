#include "cli/response_envelope.hpp"

#include <limits>

namespace docanalyst::cli {

using core::errors::AdapterError;
using core::errors::ErrorCategory;
using nlohmann::json;

namespace {

AdapterError malformed(const std::string& detail) {
    return AdapterError{ErrorCategory::Parse,
                        "Failed to parse CLI response: " + detail,
                        "malformed_response"};
}

bool read_counter(const json& usage, const char* key, std::int64_t& out) {
    const auto it = usage.find(key);
    if (it == usage.end() || it->is_null()) {
        return true;
    }
    if (it->is_number_unsigned()) {
        const auto value = it->get<std::uint64_t>();
        if (value > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
            return false;
        }
        out = static_cast<std::int64_t>(value);
        return true;
    }
    if (!it->is_number_integer()) {
        return false;
    }
    const auto value = it->get<std::int64_t>();
    if (value < 0) {
        return false;
    }
    out = value;
    return true;
}

}  // namespace

core::errors::Result<CliEnvelope> parse_envelope(const std::string& stdout_text) {
    json doc;
    try {
        doc = json::parse(stdout_text);
    } catch (const json::parse_error& e) {
        return malformed(e.what());
    }

    if (!doc.is_object()) {
        return malformed("top-level value is not an object");
    }

    CliEnvelope envelope;

    const auto is_error = doc.find("is_error");
    if (is_error != doc.end() && !is_error->is_null()) {
        if (!is_error->is_boolean()) {
            return malformed("'is_error' is not a boolean");
        }
        envelope.is_error = is_error->get<bool>();
    }

    const auto result = doc.find("result");
    if (result != doc.end() && result->is_string()) {
        envelope.result = result->get<std::string>();
    }

    const auto output = doc.find("structured_output");
    if (output != doc.end() && !output->is_null()) {
        if (!output->is_object()) {
            return malformed("'structured_output' is not an object");
        }
        envelope.structured_output = *output;
    }

    const auto usage = doc.find("usage");
    if (usage != doc.end() && !usage->is_null()) {
        if (!usage->is_object()) {
            return malformed("'usage' is not an object");
        }
        if (!read_counter(*usage, "input_tokens", envelope.usage.input_tokens) ||
            !read_counter(*usage, "cache_creation_input_tokens",
                          envelope.usage.cache_creation_input_tokens) ||
            !read_counter(*usage, "cache_read_input_tokens",
                          envelope.usage.cache_read_input_tokens) ||
            !read_counter(*usage, "output_tokens", envelope.usage.output_tokens)) {
            return malformed("usage counters must be non-negative 64-bit integers");
        }
    }

    return envelope;
}

}  // namespace docanalyst::cli
