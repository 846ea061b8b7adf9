#pragma once

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

#include "delguard/core/error.hpp"

namespace delguard::infra {

/// Upper bound on captured stdout before the child is killed.
static constexpr std::size_t kMaxCapturedOutput = 4 * 1024 * 1024;

struct ProcessOutput {
    int exit_code = 0;
    std::string stdout_text;
};

/// Executes `argv` directly (PATH lookup, no shell) in `cwd` and captures
/// its stdout.
///
/// stdin and stderr are bound to /dev/null. The child runs in its own
/// process group so that the whole group can be killed when `timeout`
/// elapses or the output exceeds `max_output` bytes. A program that cannot
/// be executed exits 127; a `cwd` that cannot be entered exits 126.
///
/// Errors: ErrorCode::InvalidArgument for an empty argv,
/// ErrorCode::ProcessError if the child cannot be spawned or its output
/// overflows, ErrorCode::Timeout when the deadline fires.
[[nodiscard]] auto run_command(const std::vector<std::string>& argv,
                               const std::filesystem::path& cwd,
                               std::chrono::milliseconds timeout,
                               std::size_t max_output = kMaxCapturedOutput)
    -> Result<ProcessOutput>;

} // namespace delguard::infra
