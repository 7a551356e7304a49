#pragma once

#include <filesystem>
#include <string>
#include <vector>
#include "core/config/adapter_config.hpp"

namespace docanalyst::cli {

// Prepends a numbered list of image file references to `prompt`. Returns
// `prompt` unchanged when there are no images.
std::string compose_prompt(const std::string& prompt,
                           const std::vector<std::filesystem::path>& image_paths);

// argv for one non-interactive, JSON-output invocation of the external tool.
std::vector<std::string> build_command(const core::config::AdapterConfig& config,
                                       const std::string& prompt,
                                       const std::string& schema_json);

}  // namespace docanalyst::cli
