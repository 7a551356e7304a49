#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <nlohmann/json.hpp>
#include "cli/error_classifier.hpp"
#include "core/config/adapter_config.hpp"
#include "imaging/image_writer.hpp"
#include "process/process_runner.hpp"
#include "service/analysis_request.hpp"
#include "service/call_outcome.hpp"
#include "service/metadata_sink.hpp"

namespace docanalyst::service {

using SleepFn = std::function<void(std::chrono::seconds)>;

// Runs structured-analysis requests through the external CLI tool with
// bounded, linear-backoff retries.
class CliAnalysisService {
public:
    // Null collaborators are replaced with the production ones:
    // SubprocessRunner, JpegImageCodec(config.image_quality),
    // cli::default_error_classifier() and std::this_thread::sleep_for.
    explicit CliAnalysisService(
        core::config::AdapterConfig config,
        std::shared_ptr<const process::ProcessRunner> runner = nullptr,
        std::shared_ptr<const imaging::ImageWriter> image_writer = nullptr,
        cli::ErrorClassifier classifier = nullptr, SleepFn sleep = nullptr);

    // Returns the tool's structured output, or an empty object when the
    // request could not be completed. Never throws for tool, process or
    // parse failures; those are logged.
    nlohmann::json invoke(const AnalysisRequest& request,
                          MetadataSink* metadata_sink = nullptr) const;

    // One invocation of the tool, classified but not retried.
    CallOutcome call_once(const std::string& prompt, const std::string& schema_json,
                          std::uint32_t timeout_seconds) const;

    const core::config::AdapterConfig& config() const { return config_; }

private:
    nlohmann::json run_attempts(const std::string& prompt,
                                const std::string& schema_json,
                                std::uint32_t max_retries,
                                std::uint32_t timeout_seconds,
                                MetadataSink* metadata_sink) const;

    FailureKind classify_tool_error(const std::string& message) const;

    core::config::AdapterConfig config_;
    std::shared_ptr<const process::ProcessRunner> runner_;
    std::shared_ptr<const imaging::ImageWriter> image_writer_;
    cli::ErrorClassifier classifier_;
    SleepFn sleep_;
};

}  // namespace docanalyst::service
