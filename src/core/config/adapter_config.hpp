#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>
#include "core/errors/adapter_errors.hpp"

namespace docanalyst::core::config {

// Adapter-wide defaults. Passed to the service at construction and never
// mutated afterwards.
struct AdapterConfig {
    std::string executable = "claude";
    std::string model = "sonnet";
    std::uint32_t max_retries = 2;
    std::uint32_t retry_wait_seconds = 3;
    std::uint32_t timeout_seconds = 120;
    std::filesystem::path temp_directory = "/tmp";
    std::string temp_file_prefix = "claude_img_";
    std::vector<std::string> allowed_tools = {"Read"};
    std::string permission_mode = "bypassPermissions";
    int image_quality = 85;
};

core::errors::Result<AdapterConfig> validate_adapter_config(AdapterConfig config);

// Reads a JSON object holding any subset of the AdapterConfig keys; missing
// keys keep their defaults.
core::errors::Result<AdapterConfig> load_adapter_config(
    const std::filesystem::path& path);

core::errors::Result<AdapterConfig> parse_adapter_config(const std::string& text);

}  // namespace docanalyst::core::config
