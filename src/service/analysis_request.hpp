#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "imaging/bitmap.hpp"

namespace docanalyst::service {

    // One structured-analysis request from the document pipeline.
    struct AnalysisRequest {
        std::string prompt;
        std::vector<imaging::Bitmap> images;

        // JSON schema the tool must conform its structured output to.
        nlohmann::json schema = nlohmann::json::object();

        // Unset fields fall back to the adapter configuration.
        std::optional<std::uint32_t> max_retries;
        std::optional<std::uint32_t> timeout_seconds;
    };

} // namespace docanalyst::service
