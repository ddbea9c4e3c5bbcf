#pragma once

#include <hdlgrader/common/error_types.hpp>
#include <hdlgrader/common/expected.hpp>
#include <hdlgrader/common/formatters/debug.hpp>
#include <hdlgrader/grading_config.hpp>
#include <hdlgrader/result_parser.hpp>
#include <hdlgrader/sandbox_manager.hpp>
#include <hdlgrader/testbench_resolver.hpp>

#include "output/verbosity.hpp"

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

#include <sys/resource.h>

namespace hdlgrader {

/// Every user-facing setting, after the config file and the command line have been merged
struct ProgramOptions
{

    // ###### Output

    /// Level of verbosity for stdout output. See \ref VerbosityLevel
    VerbosityLevel verbosity = DEFAULT_VERBOSITY_LEVEL;

    enum class ColorizeOpt { Auto, Always, Never } colorize_option = ColorizeOpt::Auto;

    // ###### Inputs and outputs

    std::filesystem::path config_path = DEFAULT_CONFIG_PATH;

    std::vector<std::string> assignment_ids;

    std::filesystem::path testbench_dir = TestbenchResolver::DEFAULT_ROOT;
    std::filesystem::path build_root = SandboxManager::DEFAULT_ROOT;
    std::filesystem::path submissions_dir = DEFAULT_SUBMISSIONS_DIR;
    std::filesystem::path grades_dir = DEFAULT_GRADES_DIR;

    // ###### Toolchain

    std::string compiler = "iverilog";
    std::string simulator = "vvp";
    std::optional<std::string> top_module;
    std::string source_extension = std::string{TestbenchResolver::DEFAULT_EXTENSION};

    int compile_timeout_s = DEFAULT_COMPILE_TIMEOUT_S;
    int run_timeout_s = DEFAULT_RUN_TIMEOUT_S;
    bool strict_compile_diagnostics = true;

    /// rlimits for the compiler and simulator; unset means inherited
    std::optional<int> cpu_limit_s;
    std::optional<int> memory_limit_mb;
    std::optional<int> file_size_limit_mb;

    // ###### Grading

    std::string result_marker = std::string{ParserConfig::DEFAULT_MARKER};
    MalformedLinePolicy malformed = MalformedLinePolicy::RecordAsFail;
    double points_possible = DEFAULT_POINTS_POSSIBLE;
    RetentionPolicy retention = RetentionPolicy::Keep;

    // ###### Runner

    /// 0 = one worker per hardware thread
    int jobs = 0;
    int post_retries = DEFAULT_POST_RETRIES;

    /// Seconds after startup after which no further submission is started
    std::optional<int> deadline_s;

    /// Grade submissions again even if they carry the `.graded` marker
    bool regrade = false;

    // ###### Defaults

    static constexpr std::string_view DEFAULT_CONFIG_PATH = "config.txt";
    static constexpr std::string_view DEFAULT_SUBMISSIONS_DIR = "submissions";
    static constexpr std::string_view DEFAULT_GRADES_DIR = "grades";
    static constexpr int DEFAULT_COMPILE_TIMEOUT_S = 30;
    static constexpr int DEFAULT_RUN_TIMEOUT_S = 10;
    static constexpr double DEFAULT_POINTS_POSSIBLE = 100.0;
    static constexpr int DEFAULT_POST_RETRIES = 3;
    static constexpr auto DEFAULT_VERBOSITY_LEVEL = VerbosityLevel::Summary;

    static Expected<void, std::string> ensure_is_directory(const std::filesystem::path& path, std::string_view what) {
        std::error_code err;

        if (!std::filesystem::exists(path, err)) {
            return fmt::format("{} {:?} does not exist", what, path.string());
        }

        if (!std::filesystem::is_directory(path, err)) {
            return fmt::format("{} {:?} is not a directory", what, path.string());
        }

        return {};
    }

    /// Verify that all fields are valid
    Expected<void, std::string> validate() {
        constexpr auto MAX_VERBOSITY = VerbosityLevel::All;
        constexpr auto MIN_VERBOSITY = VerbosityLevel{};

        verbosity = std::clamp(verbosity, MIN_VERBOSITY, MAX_VERBOSITY);

        if (assignment_ids.empty()) {
            return std::string{"No assignment ids given. Set HDL_ASSIGNMENT_IDS in the config file or use --assignments"};
        }

        for (const std::string& id : assignment_ids) {
            if (!is_safe_path_component(id)) {
                return fmt::format("Assignment id {:?} cannot be used as a directory name", id);
            }
        }

        if (compile_timeout_s <= 0 || run_timeout_s <= 0) {
            return fmt::format("Timeouts must be positive (compile: {}s, run: {}s)", compile_timeout_s, run_timeout_s);
        }

        for (auto [limit, key] : {std::pair{cpu_limit_s, "CPU_LIMIT_S"}, std::pair{memory_limit_mb, "MEMORY_LIMIT_MB"},
                                  std::pair{file_size_limit_mb, "FILE_SIZE_LIMIT_MB"}}) {
            if (limit && *limit <= 0) {
                return fmt::format("{} must be positive (got {})", key, *limit);
            }
        }

        if (jobs < 0) {
            return fmt::format("The number of jobs must not be negative (got {})", jobs);
        }

        if (post_retries < 0) {
            return fmt::format("POST_RETRIES must not be negative (got {})", post_retries);
        }

        if (deadline_s && *deadline_s <= 0) {
            return fmt::format("DEADLINE_S must be positive (got {})", *deadline_s);
        }

        if (!(points_possible >= 0.0)) {
            return fmt::format("POINTS_POSSIBLE must not be negative (got {})", points_possible);
        }

        if (result_marker.empty()) {
            return std::string{"RESULT_MARKER must not be empty"};
        }

        if (source_extension.empty() || source_extension.front() != '.') {
            return fmt::format("SOURCE_EXTENSION {:?} must start with a '.'", source_extension);
        }

        if (compiler.empty() || simulator.empty()) {
            return std::string{"COMPILER and SIMULATOR must not be empty"};
        }

        // The testbench and build directories are created on demand, but submissions must exist
        TRY(ensure_is_directory(submissions_dir, "Submissions directory"));

        return {};
    }

    /// The configuration handed to the grading core
    GradingConfig to_grading_config() const {
        using std::chrono::seconds;

        GradingConfig config;

        config.assignment_ids = assignment_ids;
        config.testbench_root = testbench_dir;
        config.build_root = build_root;
        config.source_extension = source_extension;
        config.retention = retention;

        config.compiler = compiler;
        config.simulator = simulator;
        config.top_module = top_module;

        config.executor.compile_timeout = seconds{compile_timeout_s};
        config.executor.run_timeout = seconds{run_timeout_s};
        config.executor.strict_compile_diagnostics = strict_compile_diagnostics;

        constexpr rlim_t BYTES_PER_MB = 1024 * 1024;

        if (cpu_limit_s) {
            config.executor.limits.cpu_seconds = static_cast<rlim_t>(*cpu_limit_s);
        }
        if (memory_limit_mb) {
            config.executor.limits.address_space_bytes = static_cast<rlim_t>(*memory_limit_mb) * BYTES_PER_MB;
        }
        if (file_size_limit_mb) {
            config.executor.limits.file_size_bytes = static_cast<rlim_t>(*file_size_limit_mb) * BYTES_PER_MB;
        }

        config.parser.marker = result_marker;
        config.parser.malformed = malformed;

        config.scoring.points_possible = points_possible;

        if (jobs > 0) {
            config.runner.max_concurrency = static_cast<std::size_t>(jobs);
        }
        config.runner.post_retries = post_retries;

        if (deadline_s) {
            config.runner.deadline = std::chrono::steady_clock::now() + seconds{*deadline_s};
        }

        return config;
    }
};

constexpr std::string_view format_as(ProgramOptions::ColorizeOpt opt) {
    switch (opt) {
    case ProgramOptions::ColorizeOpt::Auto:
        return "auto";
    case ProgramOptions::ColorizeOpt::Always:
        return "always";
    case ProgramOptions::ColorizeOpt::Never:
        return "never";
    }
    return "<unknown>";
}

} // namespace hdlgrader

template <>
struct fmt::formatter<::hdlgrader::ProgramOptions> : ::hdlgrader::DebugFormatter
{
    auto format(const ::hdlgrader::ProgramOptions& from, fmt::format_context& ctx) const {
        ctx.advance_to(fmt::format_to(ctx.out(), "{{verbosity={}, color={}, config={}, assignments={}, ",
                                      fmt::underlying(from.verbosity), from.colorize_option,
                                      from.config_path.string(), from.assignment_ids));

        ctx.advance_to(fmt::format_to(ctx.out(), "testbenches={}, build_root={}, submissions={}, grades={}, ",
                                      from.testbench_dir.string(), from.build_root.string(),
                                      from.submissions_dir.string(), from.grades_dir.string()));

        ctx.advance_to(fmt::format_to(ctx.out(), "compiler={}, simulator={}, top={}, ext={}, timeouts={}s/{}s, ",
                                      from.compiler, from.simulator, from.top_module.value_or("<auto>"),
                                      from.source_extension, from.compile_timeout_s, from.run_timeout_s));

        return fmt::format_to(ctx.out(),
                              "strict={}, limits={}s/{}MB/{}MB, marker={:?}, malformed={}, points={}, retention={}, "
                              "jobs={}, retries={}, deadline={}, regrade={}}}",
                              from.strict_compile_diagnostics, from.cpu_limit_s.value_or(0),
                              from.memory_limit_mb.value_or(0), from.file_size_limit_mb.value_or(0),
                              from.result_marker, from.malformed,
                              from.points_possible, from.retention, from.jobs, from.post_retries,
                              from.deadline_s.value_or(0), from.regrade);
    }
};
