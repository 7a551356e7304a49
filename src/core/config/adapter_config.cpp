#include "core/config/adapter_config.hpp"

#include <fstream>
#include <sstream>
#include <unordered_set>
#include <utility>
#include <nlohmann/json.hpp>

namespace docanalyst::core::config {

using core::errors::AdapterError;
using core::errors::ErrorCategory;
using nlohmann::json;

namespace {

AdapterError type_error(const std::string& key, const std::string& expected) {
    return AdapterError{ErrorCategory::Config,
                        "Config key '" + key + "' must be " + expected + ".",
                        "invalid_config_type"};
}

bool read_string(const json& doc, const std::string& key, std::string& out,
                 AdapterError& error) {
    if (!doc.contains(key)) {
        return true;
    }
    const auto& value = doc.at(key);
    if (!value.is_string()) {
        error = type_error(key, "a string");
        return false;
    }
    out = value.get<std::string>();
    return true;
}

bool read_unsigned(const json& doc, const std::string& key, std::uint32_t& out,
                   AdapterError& error) {
    if (!doc.contains(key)) {
        return true;
    }
    const auto& value = doc.at(key);
    if (!value.is_number_integer()) {
        error = type_error(key, "an integer");
        return false;
    }
    const auto raw = value.get<std::int64_t>();
    if (raw < 0 || raw > 86400) {
        error = AdapterError{ErrorCategory::Config,
                             "Config key '" + key + "' is out of range.",
                             "config_out_of_range",
                             "Use a value between 0 and 86400."};
        return false;
    }
    out = static_cast<std::uint32_t>(raw);
    return true;
}

}  // namespace

core::errors::Result<AdapterConfig> validate_adapter_config(AdapterConfig config) {
    if (config.executable.empty()) {
        return AdapterError{ErrorCategory::Config, "executable cannot be empty.",
                            "invalid_config_value"};
    }
    if (config.model.empty()) {
        return AdapterError{ErrorCategory::Config, "model cannot be empty.",
                            "invalid_config_value"};
    }
    if (config.timeout_seconds == 0) {
        return AdapterError{ErrorCategory::Config,
                            "timeout_seconds must be greater than zero.",
                            "invalid_config_value"};
    }
    if (config.allowed_tools.empty()) {
        return AdapterError{ErrorCategory::Config,
                            "allowed_tools must list at least one tool.",
                            "invalid_config_value",
                            "The external tool needs \"Read\" to open image files."};
    }
    if (config.image_quality < 1 || config.image_quality > 100) {
        return AdapterError{ErrorCategory::Config,
                            "image_quality must be between 1 and 100.",
                            "invalid_config_value"};
    }
    if (config.temp_directory.empty()) {
        return AdapterError{ErrorCategory::Config,
                            "temp_directory cannot be empty.",
                            "invalid_config_value"};
    }
    return config;
}

core::errors::Result<AdapterConfig> parse_adapter_config(const std::string& text) {
    const json doc = json::parse(text, nullptr, false);
    if (doc.is_discarded()) {
        return AdapterError{ErrorCategory::Config, "Config is not valid JSON.",
                            "config_parse_failed"};
    }
    if (!doc.is_object()) {
        return AdapterError{ErrorCategory::Config,
                            "Config must be a JSON object.", "config_parse_failed"};
    }

    static const std::unordered_set<std::string> kKnownKeys = {
        "executable",       "model",          "max_retries",
        "retry_wait_seconds", "timeout_seconds", "temp_directory",
        "temp_file_prefix", "allowed_tools",  "permission_mode",
        "image_quality"};
    for (const auto& item : doc.items()) {
        if (kKnownKeys.count(item.key()) == 0) {
            return AdapterError{ErrorCategory::Config,
                                "Unknown config key: " + item.key(),
                                "unknown_config_key"};
        }
    }

    AdapterConfig config;
    AdapterError error{ErrorCategory::Config, ""};
    std::string temp_directory = config.temp_directory.string();
    if (!read_string(doc, "executable", config.executable, error) ||
        !read_string(doc, "model", config.model, error) ||
        !read_string(doc, "temp_file_prefix", config.temp_file_prefix, error) ||
        !read_string(doc, "permission_mode", config.permission_mode, error) ||
        !read_string(doc, "temp_directory", temp_directory, error) ||
        !read_unsigned(doc, "max_retries", config.max_retries, error) ||
        !read_unsigned(doc, "retry_wait_seconds", config.retry_wait_seconds, error) ||
        !read_unsigned(doc, "timeout_seconds", config.timeout_seconds, error)) {
        return error;
    }
    config.temp_directory = temp_directory;

    if (doc.contains("allowed_tools")) {
        const auto& tools = doc.at("allowed_tools");
        if (!tools.is_array()) {
            return type_error("allowed_tools", "an array of strings");
        }
        config.allowed_tools.clear();
        for (const auto& tool : tools) {
            if (!tool.is_string()) {
                return type_error("allowed_tools", "an array of strings");
            }
            config.allowed_tools.push_back(tool.get<std::string>());
        }
    }

    if (doc.contains("image_quality")) {
        const auto& quality = doc.at("image_quality");
        if (!quality.is_number_integer()) {
            return type_error("image_quality", "an integer");
        }
        const auto raw = quality.get<std::int64_t>();
        if (raw < 1 || raw > 100) {
            return AdapterError{ErrorCategory::Config,
                                "image_quality must be between 1 and 100.",
                                "invalid_config_value"};
        }
        config.image_quality = static_cast<int>(raw);
    }

    return validate_adapter_config(std::move(config));
}

core::errors::Result<AdapterConfig> load_adapter_config(
    const std::filesystem::path& path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        return AdapterError{ErrorCategory::Config,
                            "Unable to open config file: " + path.string(),
                            "config_open_failed"};
    }

    std::ostringstream buffer;
    buffer << in.rdbuf();
    if (!in.good() && !in.eof()) {
        return AdapterError{ErrorCategory::Config,
                            "I/O error while reading config file: " + path.string(),
                            "config_read_failed"};
    }
    return parse_adapter_config(buffer.str());
}

}  // namespace docanalyst::core::config
