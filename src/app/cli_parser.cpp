#include "cli_parser.hpp"
#include <charconv>
#include <system_error>

namespace docanalyst::app::cli {

    using namespace docanalyst::core::errors;

    namespace {

        constexpr const char* kUsage =
            "Usage: docanalyst run --prompt \"...\" --schema schema.json [--image page.jpg]";

        // Exception-free integer parsing with inclusive bounds.
        Result<std::uint32_t> parse_bounded(const std::string& flag, const std::string& text,
                                            std::uint32_t min_value, std::uint32_t max_value) {
            std::uint32_t value = 0;
            const char* begin = text.data();
            const char* end = text.data() + text.size();
            auto [ptr, ec] = std::from_chars(begin, end, value);
            if (ec != std::errc() || ptr != end) {
                return AdapterError{ErrorCategory::Input, "Invalid number for " + flag, "invalid_integer", "Provide a non-negative integer."};
            }
            if (value < min_value || value > max_value) {
                return AdapterError{ErrorCategory::Input, flag + " out of bounds", "bounds_error",
                                    "Must be between " + std::to_string(min_value) + " and " + std::to_string(max_value) + "."};
            }
            return value;
        }

        bool is_existing_file(const std::filesystem::path& p) {
            std::error_code ec;
            const bool exists = std::filesystem::exists(p, ec);
            if (ec || !exists) {
                return false;
            }
            const bool is_file = std::filesystem::is_regular_file(p, ec);
            return !ec && is_file;
        }

    } // namespace

    // 1. Raw Options Struct (Internal only)
    struct RawCliOptions {
        std::optional<std::string> prompt;
        std::optional<std::string> prompt_file;
        std::optional<std::string> schema;
        std::vector<std::string> images;
        std::optional<std::string> config;
        std::optional<std::string> max_retries;
        std::optional<std::string> timeout;
        std::optional<std::string> model;
        bool verbose = false;
    };

    Result<CliOptions> parse_and_validate(int argc, char* argv[]) {
        if (argc < 2) {
            return AdapterError{ErrorCategory::Input, "No command provided.", "missing_command", kUsage};
        }

        std::string command = argv[1];
        if (command != "run") {
            return AdapterError{ErrorCategory::Input, "Unknown command: " + command, "unknown_command", "Currently only the 'run' command is supported."};
        }

        RawCliOptions raw;
        std::vector<std::string> args;
        for (int i = 2; i < argc; ++i) {
            args.push_back(argv[i]);
        }

        // 2. Parser Phase: Just read the raw strings
        for (size_t i = 0; i < args.size(); ++i) {
            const std::string& flag = args[i];
            if (flag == "--verbose") {
                raw.verbose = true;
                continue;
            }

            std::optional<std::string>* slot = nullptr;
            bool repeatable = false;
            if (flag == "--prompt") slot = &raw.prompt;
            else if (flag == "--prompt-file") slot = &raw.prompt_file;
            else if (flag == "--schema") slot = &raw.schema;
            else if (flag == "--config") slot = &raw.config;
            else if (flag == "--max-retries") slot = &raw.max_retries;
            else if (flag == "--timeout") slot = &raw.timeout;
            else if (flag == "--model") slot = &raw.model;
            else if (flag == "--image") repeatable = true;
            else {
                return AdapterError{ErrorCategory::Input, "Unknown argument: " + flag, "unknown_argument"};
            }

            if (i + 1 >= args.size()) {
                return AdapterError{ErrorCategory::Input, "Missing value for " + flag, "missing_value"};
            }
            if (repeatable) {
                raw.images.push_back(args[++i]);
            } else {
                *slot = args[++i];
            }
        }

        // 3. Validator Phase: Enforce logic and bounds
        CliOptions options;
        options.verbose = raw.verbose;

        if (!raw.prompt.has_value() && !raw.prompt_file.has_value()) {
            return AdapterError{ErrorCategory::Input, "Must provide either --prompt or --prompt-file", "missing_required_flag"};
        }
        if (raw.prompt.has_value() && raw.prompt_file.has_value()) {
            return AdapterError{ErrorCategory::Input, "Cannot provide both --prompt and --prompt-file", "conflicting_flags"};
        }
        if (raw.prompt && raw.prompt->empty()) {
            return AdapterError{ErrorCategory::Input, "Prompt cannot be empty", "empty_prompt"};
        }
        if (!raw.schema.has_value()) {
            return AdapterError{ErrorCategory::Input, "Must provide --schema", "missing_required_flag", kUsage};
        }

        if (raw.prompt) options.prompt = raw.prompt.value();
        if (raw.prompt_file) {
            options.prompt_file = std::filesystem::path(raw.prompt_file.value());
            if (!is_existing_file(*options.prompt_file)) {
                return AdapterError{ErrorCategory::Input, "Prompt file does not exist: " + raw.prompt_file.value(), "invalid_path"};
            }
        }

        options.schema_file = raw.schema.value();
        if (!is_existing_file(options.schema_file)) {
            return AdapterError{ErrorCategory::Input, "Schema file does not exist: " + raw.schema.value(), "invalid_path"};
        }

        for (const auto& image : raw.images) {
            if (!is_existing_file(image)) {
                return AdapterError{ErrorCategory::Input, "Image file does not exist: " + image, "invalid_path"};
            }
            options.image_files.emplace_back(image);
        }

        // Existence is checked by load_adapter_config so it reports as a config error.
        if (raw.config) {
            options.config_file = std::filesystem::path(raw.config.value());
        }

        if (raw.max_retries) {
            auto parsed = parse_bounded("--max-retries", raw.max_retries.value(), 0, 100);
            if (is_error(parsed)) {
                return get_error(parsed);
            }
            options.max_retries = get_value(parsed);
        }

        if (raw.timeout) {
            auto parsed = parse_bounded("--timeout", raw.timeout.value(), 1, 86400);
            if (is_error(parsed)) {
                return get_error(parsed);
            }
            options.timeout_seconds = get_value(parsed);
        }

        if (raw.model) {
            if (raw.model->empty()) {
                return AdapterError{ErrorCategory::Input, "Model cannot be empty", "missing_value"};
            }
            options.model = raw.model.value();
        }

        return options;
    }

} // namespace docanalyst::app::cli
