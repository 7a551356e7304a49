#include "service/cli_analysis_service.hpp"

#include <algorithm>
#include <exception>
#include <limits>
#include <thread>
#include <utility>
#include "cli/command_builder.hpp"
#include "core/logging/logger.hpp"
#include "imaging/jpeg_image_codec.hpp"
#include "imaging/temp_image_set.hpp"

namespace docanalyst::service {

using nlohmann::json;

namespace {

constexpr const char* kUnknownCliError = "Unknown CLI error";

std::string attempt_label(const std::uint64_t attempt, const std::uint64_t total) {
    return "(Attempt " + std::to_string(attempt) + "/" + std::to_string(total) + ")";
}

std::string trim_trailing_whitespace(std::string text) {
    while (!text.empty() &&
           (text.back() == '\n' || text.back() == '\r' || text.back() == ' ' ||
            text.back() == '\t')) {
        text.pop_back();
    }
    return text;
}

}  // namespace

CliAnalysisService::CliAnalysisService(
    core::config::AdapterConfig config,
    std::shared_ptr<const process::ProcessRunner> runner,
    std::shared_ptr<const imaging::ImageWriter> image_writer,
    cli::ErrorClassifier classifier, SleepFn sleep)
    : config_(std::move(config)),
      runner_(std::move(runner)),
      image_writer_(std::move(image_writer)),
      classifier_(std::move(classifier)),
      sleep_(std::move(sleep)) {
    if (!runner_) {
        runner_ = std::make_shared<process::SubprocessRunner>();
    }
    if (!image_writer_) {
        image_writer_ = std::make_shared<imaging::JpegImageCodec>(config_.image_quality);
    }
    if (!classifier_) {
        classifier_ = cli::default_error_classifier();
    }
    if (!sleep_) {
        sleep_ = [](const std::chrono::seconds duration) {
            std::this_thread::sleep_for(duration);
        };
    }
}

FailureKind CliAnalysisService::classify_tool_error(const std::string& message) const {
    return classifier_(message) ? FailureKind::TransientToolError
                                : FailureKind::TerminalToolError;
}

CallOutcome CliAnalysisService::call_once(const std::string& prompt,
                                          const std::string& schema_json,
                                          const std::uint32_t timeout_seconds) const {
    CallOutcome outcome;

    process::ProcessRequest process_request;
    process_request.argv = cli::build_command(config_, prompt, schema_json);
    const std::uint64_t timeout_ms = static_cast<std::uint64_t>(timeout_seconds) * 1000u;
    process_request.timeout_ms = static_cast<std::uint32_t>(
        std::min<std::uint64_t>(timeout_ms, std::numeric_limits<std::uint32_t>::max()));

    DOCANALYST_LOG_DEBUG("Calling CLI with model: " + config_.model);
    auto capture_result = runner_->run(process_request);
    if (core::errors::is_error(capture_result)) {
        const auto& err = core::errors::get_error(capture_result);
        outcome.failure = FailureKind::UnclassifiedError;
        outcome.message = "Failed to launch CLI [" + err.code + "]: " + err.message;
        return outcome;
    }
    const auto& capture = core::errors::get_value(capture_result);

    if (capture.timed_out) {
        outcome.failure = FailureKind::ProcessTimeout;
        outcome.message =
            "CLI call timed out after " + std::to_string(timeout_seconds) + "s";
        return outcome;
    }

    if (capture.exit_code != 0) {
        const std::string stderr_text = trim_trailing_whitespace(capture.stderr_text);
        outcome.message =
            "CLI error: " + (stderr_text.empty() ? std::string(kUnknownCliError)
                                                 : stderr_text);
        outcome.failure = classify_tool_error(outcome.message);
        return outcome;
    }

    auto parsed = cli::parse_envelope(capture.stdout_text);
    if (core::errors::is_error(parsed)) {
        outcome.failure = FailureKind::MalformedResponse;
        outcome.message = core::errors::get_error(parsed).message;
        return outcome;
    }
    const auto& envelope = core::errors::get_value(parsed);
    outcome.usage = envelope.usage;

    DOCANALYST_LOG_DEBUG("CLI response: is_error=" +
                         std::string(envelope.is_error ? "true" : "false") +
                         ", tokens=" + std::to_string(envelope.usage.total()));

    if (envelope.is_error) {
        outcome.message =
            "CLI error: " + (envelope.result.empty() ? std::string(kUnknownCliError)
                                                     : envelope.result);
        outcome.failure = classify_tool_error(outcome.message);
        return outcome;
    }

    if (envelope.structured_output.empty()) {
        outcome.failure = FailureKind::EmptyPayload;
        outcome.message = "Empty response from CLI";
        return outcome;
    }

    outcome.structured_output = envelope.structured_output;
    return outcome;
}

json CliAnalysisService::run_attempts(const std::string& prompt,
                                      const std::string& schema_json,
                                      const std::uint32_t max_retries,
                                      const std::uint32_t timeout_seconds,
                                      MetadataSink* metadata_sink) const {
    const std::uint64_t total_attempts = static_cast<std::uint64_t>(max_retries) + 1;

    for (std::uint64_t attempt = 1; attempt <= total_attempts; ++attempt) {
        const std::string label = attempt_label(attempt, total_attempts);
        const bool last_attempt = attempt == total_attempts;

        CallOutcome outcome;
        try {
            outcome = call_once(prompt, schema_json, timeout_seconds);
        } catch (const std::exception& e) {
            DOCANALYST_LOG_ERROR(std::string("Unexpected error during CLI call: ") +
                                 e.what());
            break;
        }

        if (outcome.succeeded()) {
            const std::int64_t total_tokens = outcome.usage.total();
            if (metadata_sink != nullptr && total_tokens > 0) {
                metadata_sink->update_metadata(total_tokens, 1);
            }
            return outcome.structured_output;
        }

        if (!is_retryable(outcome.failure)) {
            if (outcome.failure == FailureKind::MalformedResponse) {
                DOCANALYST_LOG_ERROR(outcome.message);
            } else {
                DOCANALYST_LOG_ERROR("Error during CLI call (" + to_string(outcome.failure) +
                                     "): " + outcome.message);
            }
            break;
        }

        if (outcome.failure == FailureKind::EmptyPayload) {
            if (last_attempt) {
                DOCANALYST_LOG_ERROR("Empty response from CLI. Max retries reached. " + label);
                break;
            }
            DOCANALYST_LOG_WARN("Empty response from CLI. Retrying... " + label);
            continue;
        }

        const std::string kind = outcome.failure == FailureKind::ProcessTimeout
                                     ? "Timeout error"
                                     : "Rate limit error";
        if (last_attempt) {
            DOCANALYST_LOG_ERROR(kind + ": " + outcome.message +
                                 ". Max retries reached. Giving up. " + label);
            break;
        }
        const std::chrono::seconds wait_time(
            static_cast<std::int64_t>(attempt) * config_.retry_wait_seconds);
        DOCANALYST_LOG_WARN(kind + ": " + outcome.message + ". Retrying in " +
                            std::to_string(wait_time.count()) + " seconds... " + label);
        sleep_(wait_time);
    }

    return json::object();
}

json CliAnalysisService::invoke(const AnalysisRequest& request,
                                MetadataSink* metadata_sink) const {
    if (request.prompt.empty()) {
        DOCANALYST_LOG_ERROR("Analysis prompt cannot be empty.");
        return json::object();
    }

    const std::uint32_t max_retries = request.max_retries.value_or(config_.max_retries);
    const std::uint32_t timeout_seconds =
        request.timeout_seconds.value_or(config_.timeout_seconds);
    if (timeout_seconds == 0) {
        DOCANALYST_LOG_ERROR("Analysis timeout must be greater than zero.");
        return json::object();
    }

    std::string schema_json;
    try {
        schema_json = request.schema.dump();
    } catch (const json::type_error& e) {
        DOCANALYST_LOG_ERROR(std::string("Response schema cannot be serialized: ") +
                             e.what());
        return json::object();
    }

    // Files are removed when temp_images leaves scope, on every path.
    imaging::TempImageSet temp_images(config_.temp_directory, config_.temp_file_prefix);
    for (const auto& image : request.images) {
        auto saved = temp_images.add(*image_writer_, image);
        if (core::errors::is_error(saved)) {
            const auto& err = core::errors::get_error(saved);
            DOCANALYST_LOG_ERROR("Failed to save temp image [" + err.code + "]: " +
                                 err.message);
            return json::object();
        }
    }

    const std::string full_prompt = cli::compose_prompt(request.prompt, temp_images.paths());
    return run_attempts(full_prompt, schema_json, max_retries, timeout_seconds,
                        metadata_sink);
}

}  // namespace docanalyst::service
