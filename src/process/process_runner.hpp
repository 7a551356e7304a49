#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include "core/errors/adapter_errors.hpp"

namespace docanalyst::process {

struct ProcessRequest {
    std::vector<std::string> argv;  // argv[0] is resolved through PATH
    std::uint32_t timeout_ms = 120000;
};

struct ProcessCapture {
    int exit_code = -1;
    bool timed_out = false;
    std::string stdout_text;
    std::string stderr_text;
    double duration_ms = 0.0;
};

// Blocking process invocation. An error result means the process could not be
// started or supervised; a process that ran and failed is reported through
// ProcessCapture.
class ProcessRunner {
public:
    virtual ~ProcessRunner() = default;

    virtual core::errors::Result<ProcessCapture> run(
        const ProcessRequest& request) const = 0;
};

// fork/exec with captured pipes. The child leads its own process group; on
// timeout the whole group is killed with SIGKILL.
class SubprocessRunner final : public ProcessRunner {
public:
    core::errors::Result<ProcessCapture> run(
        const ProcessRequest& request) const override;
};

}  // namespace docanalyst::process
