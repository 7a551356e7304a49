#include <chrono>
#include <deque>
#include <filesystem>
#include <fstream>
#include <functional>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include "core/config/adapter_config.hpp"
#include "core/config/unique_id.hpp"
#include "core/errors/adapter_errors.hpp"
#include "imaging/image_writer.hpp"
#include "process/process_runner.hpp"
#include "service/cli_analysis_service.hpp"
#include "service/metadata_sink.hpp"

namespace {

using docanalyst::core::config::AdapterConfig;
using docanalyst::core::errors::AdapterError;
using docanalyst::core::errors::ErrorCategory;
using docanalyst::core::errors::Result;
using docanalyst::imaging::Bitmap;
using docanalyst::imaging::ImageWriter;
using docanalyst::process::ProcessCapture;
using docanalyst::process::ProcessRequest;
using docanalyst::process::ProcessRunner;
using docanalyst::process::SubprocessRunner;
using docanalyst::service::AnalysisRequest;
using docanalyst::service::CliAnalysisService;
using docanalyst::service::FailureKind;
using docanalyst::service::UsageAccumulator;
using nlohmann::json;

class TempDirectory {
public:
    TempDirectory() {
        root_ = std::filesystem::temp_directory_path() /
                (".tmp_service_" + docanalyst::core::config::generate_unique_hex(8));
        std::filesystem::create_directories(root_);
    }

    ~TempDirectory() {
        std::error_code ec;
        std::filesystem::remove_all(root_, ec);
    }

    const std::filesystem::path& root() const { return root_; }

    bool is_empty() const { return std::filesystem::is_empty(root_); }

private:
    std::filesystem::path root_;
};

class ScriptedRunner : public ProcessRunner {
public:
    void push(Result<ProcessCapture> response) { responses_.push_back(std::move(response)); }

    Result<ProcessCapture> run(const ProcessRequest& request) const override {
        requests_.push_back(request);
        if (on_run) {
            on_run(request);
        }
        if (responses_.empty()) {
            return AdapterError{ErrorCategory::Process, "No scripted response left.",
                                "script_exhausted"};
        }
        auto next = responses_.front();
        responses_.pop_front();
        return next;
    }

    std::size_t call_count() const { return requests_.size(); }
    const std::vector<ProcessRequest>& requests() const { return requests_; }

    std::function<void(const ProcessRequest&)> on_run;

private:
    mutable std::deque<Result<ProcessCapture>> responses_;
    mutable std::vector<ProcessRequest> requests_;
};

class TextImageWriter : public ImageWriter {
public:
    Result<std::filesystem::path> write(const Bitmap&,
                                        const std::filesystem::path& path) const override {
        std::ofstream out(path);
        out << "image";
        return path;
    }

    std::string file_extension() const override { return ".jpg"; }
};

class FailingImageWriter : public ImageWriter {
public:
    Result<std::filesystem::path> write(const Bitmap&,
                                        const std::filesystem::path&) const override {
        return AdapterError{ErrorCategory::Io, "encoder exploded", "image_encode_failed"};
    }

    std::string file_extension() const override { return ".jpg"; }
};

ProcessCapture envelope_capture(const json& envelope) {
    ProcessCapture capture;
    capture.exit_code = 0;
    capture.stdout_text = envelope.dump();
    return capture;
}

ProcessCapture success_capture(const json& payload, int input_tokens = 10,
                               int output_tokens = 5) {
    return envelope_capture({{"is_error", false},
                             {"structured_output", payload},
                             {"usage",
                              {{"input_tokens", input_tokens},
                               {"cache_creation_input_tokens", 0},
                               {"cache_read_input_tokens", 0},
                               {"output_tokens", output_tokens}}}});
}

ProcessCapture failure_capture(const std::string& stderr_text, int exit_code = 1) {
    ProcessCapture capture;
    capture.exit_code = exit_code;
    capture.stderr_text = stderr_text;
    return capture;
}

ProcessCapture timeout_capture() {
    ProcessCapture capture;
    capture.exit_code = 137;
    capture.timed_out = true;
    return capture;
}

class CliAnalysisServiceTest : public ::testing::Test {
protected:
    CliAnalysisServiceTest() {
        config_.temp_directory = temp_dir_.root();
        config_.retry_wait_seconds = 3;
        config_.max_retries = 2;
        config_.timeout_seconds = 120;
    }

    CliAnalysisService make_service(
        docanalyst::cli::ErrorClassifier classifier = nullptr,
        std::shared_ptr<const ImageWriter> writer = nullptr) {
        if (!writer) {
            writer = std::make_shared<TextImageWriter>();
        }
        return CliAnalysisService(
            config_, runner_, writer, std::move(classifier),
            [this](std::chrono::seconds duration) { sleeps_.push_back(duration); });
    }

    AnalysisRequest make_request(std::uint32_t max_retries) {
        AnalysisRequest request;
        request.prompt = "Extract the invoice fields.";
        request.schema = {{"type", "object"},
                          {"properties", {{"total", {{"type", "number"}}}}},
                          {"required", {"total"}}};
        request.max_retries = max_retries;
        return request;
    }

    TempDirectory temp_dir_;
    AdapterConfig config_;
    std::shared_ptr<ScriptedRunner> runner_ = std::make_shared<ScriptedRunner>();
    std::vector<std::chrono::seconds> sleeps_;
};

TEST_F(CliAnalysisServiceTest, ReturnsPayloadAndReportsUsageOnce) {
    const json payload = {{"total", 42.5}, {"currency", "EUR"}};
    runner_->push(success_capture(payload, 10, 5));

    UsageAccumulator usage;
    const auto result = make_service().invoke(make_request(2), &usage);

    EXPECT_EQ(result, payload);
    EXPECT_EQ(runner_->call_count(), 1u);
    EXPECT_TRUE(sleeps_.empty());
    EXPECT_EQ(usage.report_count(), 1);
    EXPECT_EQ(usage.tokens_used(), 15);
    EXPECT_EQ(usage.request_count(), 1);
}

TEST_F(CliAnalysisServiceTest, TimeoutOnEveryAttemptExhaustsRetries) {
    for (int i = 0; i < 3; ++i) {
        runner_->push(timeout_capture());
    }

    const auto result = make_service().invoke(make_request(2));

    EXPECT_TRUE(result.empty());
    EXPECT_EQ(runner_->call_count(), 3u);
    ASSERT_EQ(sleeps_.size(), 2u);
    EXPECT_EQ(sleeps_[0], std::chrono::seconds(3));
    EXPECT_EQ(sleeps_[1], std::chrono::seconds(6));
}

TEST_F(CliAnalysisServiceTest, RateLimitRetriesOnceAfterBackoff) {
    runner_->push(failure_capture("Rate limit exceeded\n"));
    runner_->push(success_capture({{"total", 1}}));

    const auto result = make_service().invoke(make_request(1));

    EXPECT_EQ(result, json({{"total", 1}}));
    EXPECT_EQ(runner_->call_count(), 2u);
    ASSERT_EQ(sleeps_.size(), 1u);
    EXPECT_EQ(sleeps_[0], std::chrono::seconds(3));
}

TEST_F(CliAnalysisServiceTest, RateLimitOnLastAttemptGivesUp) {
    runner_->push(failure_capture("Rate limit exceeded"));
    runner_->push(failure_capture("Rate limit exceeded"));

    const auto result = make_service().invoke(make_request(1));

    EXPECT_TRUE(result.empty());
    EXPECT_EQ(runner_->call_count(), 2u);
    ASSERT_EQ(sleeps_.size(), 1u);
    EXPECT_EQ(sleeps_[0], std::chrono::seconds(3));
}

TEST_F(CliAnalysisServiceTest, NonTransientToolErrorIsTerminal) {
    runner_->push(failure_capture("invalid schema"));
    runner_->push(success_capture({{"total", 1}}));

    UsageAccumulator usage;
    const auto result = make_service().invoke(make_request(3), &usage);

    EXPECT_TRUE(result.empty());
    EXPECT_EQ(runner_->call_count(), 1u);
    EXPECT_TRUE(sleeps_.empty());
    EXPECT_EQ(usage.report_count(), 0);
}

TEST_F(CliAnalysisServiceTest, EmptyStderrIsTerminalUnknownError) {
    runner_->push(failure_capture(""));

    const auto result = make_service().invoke(make_request(2));

    EXPECT_TRUE(result.empty());
    EXPECT_EQ(runner_->call_count(), 1u);
}

TEST_F(CliAnalysisServiceTest, EmptyPayloadRetriesImmediately) {
    runner_->push(success_capture(json::object(), 40, 10));
    runner_->push(success_capture({{"total", 7}}, 10, 5));

    UsageAccumulator usage;
    const auto result = make_service().invoke(make_request(2), &usage);

    EXPECT_EQ(result, json({{"total", 7}}));
    EXPECT_EQ(runner_->call_count(), 2u);
    EXPECT_TRUE(sleeps_.empty());
    EXPECT_EQ(usage.report_count(), 1);
    EXPECT_EQ(usage.tokens_used(), 15);
}

TEST_F(CliAnalysisServiceTest, EmptyPayloadOnEveryAttemptReturnsEmpty) {
    runner_->push(success_capture(json::object()));
    runner_->push(success_capture(json::object()));

    UsageAccumulator usage;
    const auto result = make_service().invoke(make_request(1), &usage);

    EXPECT_TRUE(result.empty());
    EXPECT_EQ(runner_->call_count(), 2u);
    EXPECT_TRUE(sleeps_.empty());
    EXPECT_EQ(usage.report_count(), 0);
}

TEST_F(CliAnalysisServiceTest, MalformedResponseIsTerminal) {
    ProcessCapture capture;
    capture.exit_code = 0;
    capture.stdout_text = "Welcome! Please log in.";
    runner_->push(capture);
    runner_->push(success_capture({{"total", 1}}));

    const auto result = make_service().invoke(make_request(2));

    EXPECT_TRUE(result.empty());
    EXPECT_EQ(runner_->call_count(), 1u);
}

TEST_F(CliAnalysisServiceTest, ToolReportedErrorIsClassifiedLikeExitFailure) {
    runner_->push(envelope_capture({{"is_error", true}, {"result", "API rate limit hit"}}));
    runner_->push(envelope_capture({{"is_error", true}, {"result", "prompt too long"}}));

    const auto result = make_service().invoke(make_request(3));

    EXPECT_TRUE(result.empty());
    EXPECT_EQ(runner_->call_count(), 2u);
    ASSERT_EQ(sleeps_.size(), 1u);
    EXPECT_EQ(sleeps_[0], std::chrono::seconds(3));
}

TEST_F(CliAnalysisServiceTest, LaunchFailureIsTerminal) {
    runner_->push(AdapterError{ErrorCategory::Process, "Failed to fork process.", "fork_failed"});

    const auto result = make_service().invoke(make_request(2));

    EXPECT_TRUE(result.empty());
    EXPECT_EQ(runner_->call_count(), 1u);
    EXPECT_TRUE(sleeps_.empty());
}

TEST_F(CliAnalysisServiceTest, ZeroUsageIsNotReported) {
    runner_->push(success_capture({{"total", 3}}, 0, 0));

    UsageAccumulator usage;
    const auto result = make_service().invoke(make_request(0), &usage);

    EXPECT_FALSE(result.empty());
    EXPECT_EQ(usage.report_count(), 0);
}

TEST_F(CliAnalysisServiceTest, WorksWithoutMetadataSink) {
    runner_->push(success_capture({{"total", 3}}));
    EXPECT_EQ(make_service().invoke(make_request(0)), json({{"total", 3}}));
}

TEST_F(CliAnalysisServiceTest, FallsBackToConfiguredDefaults) {
    config_.max_retries = 1;
    config_.timeout_seconds = 45;
    runner_->push(timeout_capture());
    runner_->push(timeout_capture());

    AnalysisRequest request = make_request(0);
    request.max_retries.reset();
    const auto result = make_service().invoke(request);

    EXPECT_TRUE(result.empty());
    ASSERT_EQ(runner_->call_count(), 2u);
    EXPECT_EQ(runner_->requests()[0].timeout_ms, 45000u);
}

TEST_F(CliAnalysisServiceTest, RequestTimeoutOverridesConfig) {
    runner_->push(success_capture({{"total", 3}}));

    AnalysisRequest request = make_request(0);
    request.timeout_seconds = 7;
    make_service().invoke(request);

    ASSERT_EQ(runner_->call_count(), 1u);
    EXPECT_EQ(runner_->requests()[0].timeout_ms, 7000u);
}

TEST_F(CliAnalysisServiceTest, PassesPromptSchemaAndModelToTool) {
    config_.model = "haiku";
    runner_->push(success_capture({{"total", 3}}));

    const AnalysisRequest request = make_request(0);
    make_service().invoke(request);

    ASSERT_EQ(runner_->call_count(), 1u);
    const auto& argv = runner_->requests()[0].argv;
    ASSERT_EQ(argv.size(), 13u);
    EXPECT_EQ(argv[0], "claude");
    EXPECT_EQ(argv[2], request.prompt);
    EXPECT_EQ(json::parse(argv[6]), request.schema);
    EXPECT_EQ(argv[12], "haiku");
}

TEST_F(CliAnalysisServiceTest, PersistsImagesForTheCallAndRemovesThemAfter) {
    std::vector<std::filesystem::path> seen;
    std::string seen_prompt;
    runner_->on_run = [&](const ProcessRequest& request) {
        seen_prompt = request.argv[2];
        for (const auto& entry : std::filesystem::directory_iterator(temp_dir_.root())) {
            seen.push_back(entry.path());
        }
    };
    runner_->push(success_capture({{"total", 9}}));

    AnalysisRequest request = make_request(0);
    request.images.resize(2);
    const auto result = make_service().invoke(request);

    EXPECT_FALSE(result.empty());
    ASSERT_EQ(seen.size(), 2u);
    for (const auto& path : seen) {
        EXPECT_EQ(path.filename().string().rfind("claude_img_", 0), 0u);
        EXPECT_NE(seen_prompt.find(path.string()), std::string::npos);
    }
    EXPECT_EQ(seen_prompt.rfind("The following images are provided for analysis.", 0), 0u);
    EXPECT_NE(seen_prompt.find("- Image 2: "), std::string::npos);
    EXPECT_NE(seen_prompt.find("\n\nExtract the invoice fields."), std::string::npos);
    EXPECT_TRUE(temp_dir_.is_empty());
}

TEST_F(CliAnalysisServiceTest, RemovesImagesAfterTerminalFailure) {
    runner_->push(failure_capture("invalid schema"));

    AnalysisRequest request = make_request(2);
    request.images.resize(3);
    const auto result = make_service().invoke(request);

    EXPECT_TRUE(result.empty());
    EXPECT_TRUE(temp_dir_.is_empty());
}

TEST_F(CliAnalysisServiceTest, RemovesImagesWhenRunnerThrows) {
    runner_->on_run = [](const ProcessRequest&) {
        throw std::runtime_error("runner blew up");
    };

    AnalysisRequest request = make_request(2);
    request.images.resize(1);
    const auto result = make_service().invoke(request);

    EXPECT_TRUE(result.empty());
    EXPECT_EQ(runner_->call_count(), 1u);
    EXPECT_TRUE(temp_dir_.is_empty());
}

TEST_F(CliAnalysisServiceTest, ImageWriteFailureSkipsInvocation) {
    AnalysisRequest request = make_request(2);
    request.images.resize(1);
    const auto result =
        make_service(nullptr, std::make_shared<FailingImageWriter>()).invoke(request);

    EXPECT_TRUE(result.empty());
    EXPECT_EQ(runner_->call_count(), 0u);
    EXPECT_TRUE(temp_dir_.is_empty());
}

TEST_F(CliAnalysisServiceTest, EmptyPromptIsRejectedWithoutInvocation) {
    AnalysisRequest request = make_request(2);
    request.prompt.clear();

    EXPECT_TRUE(make_service().invoke(request).empty());
    EXPECT_EQ(runner_->call_count(), 0u);
}

TEST_F(CliAnalysisServiceTest, CustomClassifierControlsRetries) {
    runner_->push(failure_capture("E_OVERLOADED"));
    runner_->push(success_capture({{"total", 2}}));

    const auto retry_everything = [](const std::string&) { return true; };
    const auto result = make_service(retry_everything).invoke(make_request(1));

    EXPECT_EQ(result, json({{"total", 2}}));
    EXPECT_EQ(runner_->call_count(), 2u);
    ASSERT_EQ(sleeps_.size(), 1u);
}

TEST_F(CliAnalysisServiceTest, CallOnceClassifiesEachFailure) {
    runner_->push(timeout_capture());
    runner_->push(failure_capture("Rate limit exceeded"));
    runner_->push(failure_capture("invalid schema"));
    runner_->push(failure_capture("", 0));
    runner_->push(success_capture(json::object()));

    const auto service = make_service();
    EXPECT_EQ(service.call_once("p", "{}", 10).failure, FailureKind::ProcessTimeout);
    EXPECT_EQ(service.call_once("p", "{}", 10).failure, FailureKind::TransientToolError);

    const auto terminal = service.call_once("p", "{}", 10);
    EXPECT_EQ(terminal.failure, FailureKind::TerminalToolError);
    EXPECT_EQ(terminal.message, "CLI error: invalid schema");

    EXPECT_EQ(service.call_once("p", "{}", 10).failure, FailureKind::MalformedResponse);
    EXPECT_EQ(service.call_once("p", "{}", 10).failure, FailureKind::EmptyPayload);
    EXPECT_TRUE(docanalyst::service::is_retryable(FailureKind::EmptyPayload));
    EXPECT_FALSE(docanalyst::service::is_retryable(FailureKind::MalformedResponse));
}

// End to end through a real child process standing in for the external tool.
class FakeToolScript {
public:
    FakeToolScript(const std::filesystem::path& dir, const std::string& body)
        : path_(dir / "fake_tool.sh") {
        {
            std::ofstream out(path_);
            out << "#!/bin/sh\n" << body << "\n";
        }
        std::filesystem::permissions(path_, std::filesystem::perms::owner_all);
    }

    const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
};

TEST(CliAnalysisServiceSubprocessTest, ParsesOutputOfRealProcess) {
    TempDirectory tool_dir;
    FakeToolScript tool(
        tool_dir.root(),
        "printf '%s' '{\"is_error\":false,\"structured_output\":{\"heading\":\"Summary\"},"
        "\"usage\":{\"input_tokens\":4,\"output_tokens\":2}}'");

    AdapterConfig config;
    config.executable = tool.path().string();
    config.temp_directory = tool_dir.root();
    CliAnalysisService service(config, std::make_shared<SubprocessRunner>());

    AnalysisRequest request;
    request.prompt = "Find the heading.";
    request.max_retries = 0;
    UsageAccumulator usage;
    const auto result = service.invoke(request, &usage);

    EXPECT_EQ(result, json({{"heading", "Summary"}}));
    EXPECT_EQ(usage.tokens_used(), 6);
}

TEST(CliAnalysisServiceSubprocessTest, HardTimeoutYieldsEmptyResult) {
    TempDirectory tool_dir;
    FakeToolScript tool(tool_dir.root(), "exec sleep 10");

    AdapterConfig config;
    config.executable = tool.path().string();
    config.temp_directory = tool_dir.root();
    std::vector<std::chrono::seconds> sleeps;
    CliAnalysisService service(config, std::make_shared<SubprocessRunner>(), nullptr,
                               nullptr, [&sleeps](std::chrono::seconds s) {
                                   sleeps.push_back(s);
                               });

    AnalysisRequest request;
    request.prompt = "Find the heading.";
    request.max_retries = 0;
    request.timeout_seconds = 1;

    const auto started = std::chrono::steady_clock::now();
    const auto result = service.invoke(request);
    const auto elapsed = std::chrono::steady_clock::now() - started;

    EXPECT_TRUE(result.empty());
    EXPECT_TRUE(sleeps.empty());
    EXPECT_LT(elapsed, std::chrono::seconds(5));
}

}  // namespace
