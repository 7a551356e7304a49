#include "cli/command_builder.hpp"

#include <sstream>

namespace docanalyst::cli {

std::string compose_prompt(const std::string& prompt,
                           const std::vector<std::filesystem::path>& image_paths) {
    if (image_paths.empty()) {
        return prompt;
    }

    std::ostringstream out;
    out << "The following images are provided for analysis. "
           "Use the Read tool to view them:\n";
    for (std::size_t i = 0; i < image_paths.size(); ++i) {
        if (i > 0) {
            out << "\n";
        }
        out << "- Image " << (i + 1) << ": " << image_paths[i].string();
    }
    out << "\n\n" << prompt;
    return out.str();
}

std::vector<std::string> build_command(const core::config::AdapterConfig& config,
                                       const std::string& prompt,
                                       const std::string& schema_json) {
    std::string tools;
    for (const auto& tool : config.allowed_tools) {
        if (!tools.empty()) {
            tools += ",";
        }
        tools += tool;
    }

    return {config.executable,
            "-p",
            prompt,
            "--output-format",
            "json",
            "--json-schema",
            schema_json,
            "--tools",
            tools,
            "--permission-mode",
            config.permission_mode,
            "--model",
            config.model};
}

}  // namespace docanalyst::cli
