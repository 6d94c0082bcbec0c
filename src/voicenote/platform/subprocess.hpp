#pragma once

#include <chrono>
#include <expected>
#include <string>
#include <vector>

namespace platform {

struct ProcessResult {
    int exit_code = -1;      // 128 + signal number if the child was killed
    std::string out;
    std::string err;
};

// Exit code reported when the executable could not be started.
inline constexpr int kExecFailedCode = 127;

// Runs argv[0] (looked up on PATH) with stdin closed, capturing stdout and
// stderr. The child is killed if it outlives `timeout`; that case and
// pipe/fork failures are reported as errors. A non-zero exit is not an error.
std::expected<ProcessResult, std::string>
    run_process(const std::vector<std::string>& argv, std::chrono::milliseconds timeout);

} // namespace platform
