#pragma once
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include "core/errors/adapter_errors.hpp"

namespace docanalyst::app::cli {

    // Validated `docanalyst run` arguments.
    struct CliOptions {
        std::optional<std::string> prompt;
        std::optional<std::filesystem::path> prompt_file;
        std::filesystem::path schema_file;
        std::vector<std::filesystem::path> image_files;
        std::optional<std::filesystem::path> config_file;
        std::optional<std::uint32_t> max_retries;
        std::optional<std::uint32_t> timeout_seconds;
        std::optional<std::string> model;
        bool verbose = false;
    };

    docanalyst::core::errors::Result<CliOptions> parse_and_validate(int argc, char* argv[]);
}
