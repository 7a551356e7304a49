#include "app/request_loader.hpp"

#include <fstream>
#include <sstream>
#include <utility>
#include <nlohmann/json.hpp>
#include "imaging/jpeg_image_codec.hpp"

namespace docanalyst::app {

using core::errors::AdapterError;
using core::errors::ErrorCategory;
using nlohmann::json;

namespace {

core::errors::Result<std::string> read_text_file(const std::filesystem::path& path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        return AdapterError{ErrorCategory::Input,
                            "Failed to open file: " + path.string(),
                            "file_open_failed"};
    }

    std::ostringstream buffer;
    buffer << in.rdbuf();
    if (!in.good() && !in.eof()) {
        return AdapterError{ErrorCategory::Input,
                            "I/O error while reading file: " + path.string(),
                            "file_read_failed"};
    }
    return buffer.str();
}

}  // namespace

core::errors::Result<service::AnalysisRequest> load_analysis_request(
    const cli::CliOptions& options) {
    service::AnalysisRequest request;
    request.max_retries = options.max_retries;
    request.timeout_seconds = options.timeout_seconds;

    if (options.prompt.has_value()) {
        request.prompt = options.prompt.value();
    } else if (options.prompt_file.has_value()) {
        auto text = read_text_file(options.prompt_file.value());
        if (core::errors::is_error(text)) {
            return core::errors::get_error(text);
        }
        request.prompt = core::errors::get_value(text);
    }
    if (request.prompt.empty()) {
        return AdapterError{ErrorCategory::Input, "Prompt cannot be empty.",
                            "empty_prompt"};
    }

    auto schema_text = read_text_file(options.schema_file);
    if (core::errors::is_error(schema_text)) {
        return core::errors::get_error(schema_text);
    }
    json schema = json::parse(core::errors::get_value(schema_text), nullptr, false);
    if (schema.is_discarded() || !schema.is_object()) {
        return AdapterError{ErrorCategory::Input,
                            "Schema file is not a JSON object: " +
                                options.schema_file.string(),
                            "invalid_schema",
                            "Provide a JSON schema such as {\"type\": \"object\", ...}."};
    }
    request.schema = std::move(schema);

    for (const auto& image_file : options.image_files) {
        auto bitmap = imaging::JpegImageCodec::read(image_file);
        if (core::errors::is_error(bitmap)) {
            return core::errors::get_error(bitmap);
        }
        request.images.push_back(core::errors::get_value(bitmap));
    }

    return request;
}

}  // namespace docanalyst::app
