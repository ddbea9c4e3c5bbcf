#include <hdlgrader/build_run_executor.hpp>

#include <hdlgrader/common/error_types.hpp>
#include <hdlgrader/grading_session.hpp>
#include <hdlgrader/logging.hpp>
#include <hdlgrader/sandbox_manager.hpp>
#include <hdlgrader/subprocess/execution_result.hpp>
#include <hdlgrader/subprocess/subprocess.hpp>
#include <hdlgrader/toolchain/toolchain.hpp>

#include <fmt/format.h>
#include <libassert/assert.hpp>
#include <range/v3/algorithm/all_of.hpp>

#include <cctype>
#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace hdlgrader {

namespace {

bool is_blank(std::string_view text) {
    return ranges::all_of(text, [](unsigned char chr) { return std::isspace(chr) != 0; });
}

} // namespace

BuildRunExecutor::BuildRunExecutor(std::shared_ptr<const Compiler> compiler,
                                   std::shared_ptr<const Simulator> simulator, ExecutorConfig config)
    : compiler_{std::move(compiler)}
    , simulator_{std::move(simulator)}
    , config_{std::move(config)} {
    ASSERT(compiler_ != nullptr);
    ASSERT(simulator_ != nullptr);
}

Result<BuildOutcome> BuildRunExecutor::execute(const Sandbox& sandbox, const StageObserver& on_stage) const {
    auto notify = [&on_stage](PipelineStage stage) {
        if (on_stage) {
            on_stage(stage);
        }
    };

    std::vector<std::string> sources = sandbox.sources;
    sources.push_back(sandbox.testbench);

    notify(PipelineStage::Compiling);

    const CommandLine compile_cmd = compiler_->compile_command(sources, config_.artifact_name);
    ExecutionResult compile = TRY(invoke(compile_cmd, sandbox, config_.compile_timeout));

    if (auto reason = compile_failure_reason(compile)) {
        LOG_INFO("{}: compilation failed ({})", sandbox.key, *reason);

        std::string diagnostic = make_diagnostic(compile, *reason);
        return CompileFailed{.compile = std::move(compile), .diagnostic = std::move(diagnostic)};
    }

    notify(PipelineStage::Running);

    const CommandLine run_cmd = simulator_->run_command(config_.artifact_name);
    ExecutionResult run = TRY(invoke(run_cmd, sandbox, config_.run_timeout));

    if (run.timed_out) {
        LOG_INFO("{}: simulation timed out after {}", sandbox.key, config_.run_timeout);
        return RunTimedOut{.run = std::move(run), .limit = config_.run_timeout};
    }

    return RunCompleted{.run = std::move(run)};
}

Result<ExecutionResult> BuildRunExecutor::invoke(const CommandLine& cmd, const Sandbox& sandbox,
                                                 std::chrono::milliseconds timeout) const {
    Subprocess proc{cmd.executable, cmd.args};
    proc.set_working_directory(sandbox.root);
    proc.set_resource_limits(config_.limits);
    proc.set_output_limit(config_.max_output_bytes);

    TRY(proc.start());

    return DEBUG_TIME(proc.communicate(timeout));
}

std::optional<std::string> BuildRunExecutor::compile_failure_reason(const ExecutionResult& compile) const {
    if (compile.timed_out) {
        return fmt::format("timed out after {}", config_.compile_timeout);
    }

    if (compile.term_signal) {
        return fmt::format("killed by signal {}", *compile.term_signal);
    }

    if (compile.exit_code != 0) {
        return fmt::format("exit status {}", compile.exit_code.value_or(-1));
    }

    if (config_.strict_compile_diagnostics && !is_blank(compile.stderr_text)) {
        return std::string{"diagnostics on stderr"};
    }

    return std::nullopt;
}

std::string BuildRunExecutor::make_diagnostic(const ExecutionResult& compile, const std::string& reason) const {
    // iverilog reports errors on stderr, but some tools only use stdout
    std::string_view text = is_blank(compile.stderr_text) ? compile.stdout_text : compile.stderr_text;

    std::string result = fmt::format("{} {}.\n", compiler_->name(), reason);

    if (is_blank(text)) {
        return result;
    }

    result += truncate_with_marker(text, config_.max_diagnostic_bytes);

    return result;
}

std::string truncate_with_marker(std::string_view text, std::size_t max_bytes) {
    if (text.size() <= max_bytes) {
        return std::string{text};
    }

    std::string result{text.substr(0, max_bytes)};

    if (!result.ends_with('\n')) {
        result += '\n';
    }

    result += fmt::format("[... {} more bytes truncated]\n", text.size() - max_bytes);

    return result;
}

} // namespace hdlgrader
