#pragma once
#include <cstddef>
#include <string>
#include <random>
#include <sstream>

namespace docanalyst::core::config {

    // Random lowercase hex string, 32 characters by default (128 bits).
    inline std::string generate_unique_hex(std::size_t length = 32) {
        std::random_device rd;
        std::seed_seq seed{rd(), rd(), rd(), rd()};
        std::mt19937 gen(seed);
        std::uniform_int_distribution<> dis(0, 15);

        std::stringstream ss;
        for (std::size_t i = 0; i < length; ++i) {
            ss << std::hex << dis(gen);
        }
        return ss.str();
    }

    // Short tag used to correlate log lines of one request, e.g. "req-3fa09c1e".
    inline std::string generate_request_tag() {
        return "req-" + generate_unique_hex(8);
    }

} // namespace docanalyst::core::config
