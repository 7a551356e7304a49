#pragma once

#include "app/cli_parser.hpp"
#include "core/errors/adapter_errors.hpp"
#include "service/analysis_request.hpp"

namespace docanalyst::app {

// Reads the prompt, schema and images named by `options`. Image failures use
// ErrorCategory::Io; everything else ErrorCategory::Input.
core::errors::Result<service::AnalysisRequest> load_analysis_request(
    const cli::CliOptions& options);

}  // namespace docanalyst::app
