#pragma once

#include <cstdint>
#include <initializer_list>
#include <limits>
#include <string>
#include <nlohmann/json.hpp>
#include "core/errors/adapter_errors.hpp"

namespace docanalyst::cli {

struct TokenUsage {
    std::int64_t input_tokens = 0;
    std::int64_t cache_creation_input_tokens = 0;
    std::int64_t cache_read_input_tokens = 0;
    std::int64_t output_tokens = 0;

    // Saturates at INT64_MAX; negative counters count as zero.
    std::int64_t total() const {
        constexpr std::int64_t kMax = std::numeric_limits<std::int64_t>::max();
        std::int64_t sum = 0;
        for (const std::int64_t value : {input_tokens, cache_creation_input_tokens,
                                         cache_read_input_tokens, output_tokens}) {
            if (value <= 0) {
                continue;
            }
            if (value > kMax - sum) {
                return kMax;
            }
            sum += value;
        }
        return sum;
    }
};

// The JSON object the external tool prints on stdout.
struct CliEnvelope {
    bool is_error = false;
    nlohmann::json structured_output = nlohmann::json::object();
    std::string result;
    TokenUsage usage;
};

// Fails with code "malformed_response" when `stdout_text` is not a JSON object
// of the expected shape. Missing fields take their defaults.
core::errors::Result<CliEnvelope> parse_envelope(const std::string& stdout_text);

}  // namespace docanalyst::cli
