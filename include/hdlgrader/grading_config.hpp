#pragma once

#include <hdlgrader/build_run_executor.hpp>
#include <hdlgrader/result_parser.hpp>
#include <hdlgrader/sandbox_manager.hpp>
#include <hdlgrader/scorer.hpp>
#include <hdlgrader/testbench_resolver.hpp>

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace hdlgrader {

/// Parameters of the multi-submission runner
struct RunnerConfig
{
    std::size_t max_concurrency = default_concurrency();

    /// Additional attempts after a failed `post_grade`
    int post_retries = 3;

    /// Retry ``n`` (1-based) is preceded by a sleep of ``n * post_backoff``
    std::chrono::milliseconds post_backoff{500};

    /// Submissions not yet started when this passes are skipped
    std::optional<std::chrono::steady_clock::time_point> deadline;

    static std::size_t default_concurrency() {
        unsigned hw = std::thread::hardware_concurrency();
        return hw == 0 ? 1 : hw;
    }
};

/// Everything the grading core needs, fully resolved. Built once at startup from config file
/// and command line; never read from globals.
struct GradingConfig
{
    std::vector<std::string> assignment_ids;

    std::filesystem::path testbench_root{TestbenchResolver::DEFAULT_ROOT};
    std::filesystem::path build_root{SandboxManager::DEFAULT_ROOT};
    std::string source_extension{TestbenchResolver::DEFAULT_EXTENSION};
    RetentionPolicy retention = RetentionPolicy::Keep;

    std::string compiler{"iverilog"};
    std::string simulator{"vvp"};
    std::optional<std::string> top_module;

    ExecutorConfig executor;
    ParserConfig parser;
    ScoringConfig scoring;
    RunnerConfig runner;
};

} // namespace hdlgrader
