#include <iostream>
#include <string>
#include "app/cli_parser.hpp"
#include "app/request_loader.hpp"
#include "core/config/adapter_config.hpp"
#include "core/config/unique_id.hpp"
#include "core/errors/adapter_errors.hpp"
#include "core/logging/logger.hpp"
#include "service/cli_analysis_service.hpp"
#include "service/metadata_sink.hpp"

int main(int argc, char* argv[]) {
    namespace errors = docanalyst::core::errors;
    namespace logging = docanalyst::core::logging;

    // 1. Tag every log line of this invocation
    logging::Logger::get().set_request_tag(docanalyst::core::config::generate_request_tag());

    // 2. Parse CLI input and return normalized input errors
    auto parsed = docanalyst::app::cli::parse_and_validate(argc, argv);
    if (errors::is_error(parsed)) {
        const auto& err = errors::get_error(parsed);
        DOCANALYST_LOG_ERROR("Input error [" + err.code + "]: " + err.message);
        if (!err.hint.empty()) {
            DOCANALYST_LOG_INFO("Hint: " + err.hint);
        }
        return 2;
    }
    const auto& options = errors::get_value(parsed);
    if (options.verbose) {
        logging::Logger::get().set_min_level(logging::LogLevel::DEBUG);
    }

    // 3. Adapter configuration
    docanalyst::core::config::AdapterConfig config;
    if (options.config_file.has_value()) {
        auto loaded = docanalyst::core::config::load_adapter_config(options.config_file.value());
        if (errors::is_error(loaded)) {
            const auto& err = errors::get_error(loaded);
            DOCANALYST_LOG_ERROR("Config error [" + err.code + "]: " + err.message);
            if (!err.hint.empty()) {
                DOCANALYST_LOG_INFO("Hint: " + err.hint);
            }
            return 3;
        }
        config = errors::get_value(loaded);
    }
    if (options.model.has_value()) {
        config.model = options.model.value();
    }

    // 4. Prompt, schema and images
    auto loaded_request = docanalyst::app::load_analysis_request(options);
    if (errors::is_error(loaded_request)) {
        const auto& err = errors::get_error(loaded_request);
        DOCANALYST_LOG_ERROR("Request error [" + err.code + "]: " + err.message);
        if (!err.hint.empty()) {
            DOCANALYST_LOG_INFO("Hint: " + err.hint);
        }
        return err.category == errors::ErrorCategory::Io ? 4 : 2;
    }
    const auto& request = errors::get_value(loaded_request);

    // 5. Run the analysis
    DOCANALYST_LOG_INFO("Running analysis with model " + config.model + " (" +
                        std::to_string(request.images.size()) + " image(s))");
    docanalyst::service::CliAnalysisService service(config);
    docanalyst::service::UsageAccumulator usage;
    const auto result = service.invoke(request, &usage);

    if (result.empty()) {
        DOCANALYST_LOG_ERROR("Analysis unavailable: no structured output produced.");
        return 1;
    }

    std::cout << result.dump(2) << std::endl;
    DOCANALYST_LOG_INFO("Tokens used: " + std::to_string(usage.tokens_used()) +
                        " across " + std::to_string(usage.request_count()) + " request(s)");
    return 0;
}
