#pragma once

#include <hdlgrader/common/error_types.hpp>
#include <hdlgrader/grading_session.hpp>
#include <hdlgrader/sandbox_manager.hpp>
#include <hdlgrader/subprocess/execution_result.hpp>
#include <hdlgrader/subprocess/subprocess.hpp>
#include <hdlgrader/toolchain/toolchain.hpp>

#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace hdlgrader {

struct ExecutorConfig
{
    std::chrono::milliseconds compile_timeout{std::chrono::seconds{30}};
    std::chrono::milliseconds run_timeout{std::chrono::seconds{10}};

    /// Treat any non-whitespace compiler stderr as a failure, even on exit status 0
    bool strict_compile_diagnostics = true;

    /// Compiler diagnostics beyond this are cut, with a marker saying how much was dropped
    std::size_t max_diagnostic_bytes = 16 * 1024;

    /// Per-stream capture limit for both steps
    std::size_t max_output_bytes = Subprocess::DEFAULT_OUTPUT_LIMIT;

    ResourceLimits limits;

    /// Name of the compiled artifact, relative to the sandbox
    std::string artifact_name = "sim.out";
};

/// The compile step did not produce a usable artifact. The run step was never invoked.
struct CompileFailed
{
    ExecutionResult compile;

    /// Compiler output for the report, already truncated
    std::string diagnostic;
};

/// The simulation was killed after ``limit``; ``run`` holds the partial output
struct RunTimedOut
{
    ExecutionResult run;
    std::chrono::milliseconds limit;
};

/// The simulation exited on its own, with any status
struct RunCompleted
{
    ExecutionResult run;
};

using BuildOutcome = std::variant<CompileFailed, RunTimedOut, RunCompleted>;

/// Called as the executor moves from one step to the next
using StageObserver = std::function<void(PipelineStage)>;

/// Compiles a sandbox, then (only if that succeeded) runs the simulation, both inside the sandbox.
///
/// Holds no per-submission state; a single instance is shared by every worker.
class BuildRunExecutor
{
public:
    BuildRunExecutor(std::shared_ptr<const Compiler> compiler, std::shared_ptr<const Simulator> simulator,
                     ExecutorConfig config);

    /// Errors: SpawnFailed if a tool could not be started; SyscallFailure for pipe/poll/wait failures.
    /// ``on_stage`` is told about `Compiling` and `Running` before each step starts, so the
    /// caller knows which step an error belongs to.
    Result<BuildOutcome> execute(const Sandbox& sandbox, const StageObserver& on_stage = {}) const;

    const ExecutorConfig& get_config() const noexcept { return config_; }

private:
    Result<ExecutionResult> invoke(const CommandLine& cmd, const Sandbox& sandbox,
                                   std::chrono::milliseconds timeout) const;

    /// Whether a finished compile counts as failed, and why
    std::optional<std::string> compile_failure_reason(const ExecutionResult& compile) const;

    std::string make_diagnostic(const ExecutionResult& compile, const std::string& reason) const;

    std::shared_ptr<const Compiler> compiler_;
    std::shared_ptr<const Simulator> simulator_;
    ExecutorConfig config_;
};

/// Cut ``text`` to at most ``max_bytes`` bytes of content, appending a marker when anything was dropped
std::string truncate_with_marker(std::string_view text, std::size_t max_bytes);

} // namespace hdlgrader
