#pragma once

#include <chrono>
#include <optional>
#include <string>

namespace hdlgrader {

/// Everything observed about a single compile or run invocation
struct ExecutionResult
{
    /// Set if the process exited normally
    std::optional<int> exit_code;

    /// Set if the process was terminated by a signal (including our own SIGKILL on timeout)
    std::optional<int> term_signal;

    std::string stdout_text;
    std::string stderr_text;

    std::chrono::milliseconds elapsed{};

    bool timed_out = false;

    /// Output beyond the capture limit was discarded
    bool stdout_truncated = false;
    bool stderr_truncated = false;

    bool succeeded() const noexcept { return !timed_out && exit_code == 0; }
};

} // namespace hdlgrader
