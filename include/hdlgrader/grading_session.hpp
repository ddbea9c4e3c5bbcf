/// \file
/// Defines data classes to store result data for the current grading run
#pragma once

#include <hdlgrader/common/error_types.hpp>

#include <fmt/format.h>
#include <gsl/util>
#include <range/v3/algorithm/count_if.hpp>

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace hdlgrader {

/// Identifies one unit of grading work. Unique per submission.
struct SubmissionKey
{
    std::string assignment_id;
    std::string student_id;

    bool operator==(const SubmissionKey& rhs) const = default;
};

inline std::string format_as(const SubmissionKey& key) {
    return fmt::format("assignment {} / student {}", key.assignment_id, key.student_id);
}

/// One submitted file, as handed over by the roster collaborator.
/// ``contents`` holds raw bytes; it is never re-encoded.
struct SubmissionFile
{
    std::string name;
    std::string contents;
};

struct Testbench
{
    std::string assignment_id;

    /// Absolute path of the selected testbench source
    std::filesystem::path path;
};

enum class TestStatus { Pass, Fail };

constexpr std::string_view format_as(TestStatus status) {
    return status == TestStatus::Pass ? "PASS" : "FAIL";
}

/// One parsed structured output line
struct TestOutcome
{
    std::string name;
    TestStatus status = TestStatus::Fail;

    std::optional<std::string> expected;
    std::optional<std::string> actual;

    /// Every key=value pair on the line, in order of appearance (includes expected/got)
    std::vector<std::pair<std::string, std::string>> details;

    /// Trailing tokens that were not key=value pairs
    std::string note;

    /// The line carried the marker, but could not be parsed; recorded as a failure
    bool unparseable = false;

    bool passed() const noexcept { return status == TestStatus::Pass; }
};

/// A structured line that did not follow the convention
struct ParseNote
{
    std::size_t line_number;
    std::string line;
    std::string reason;
};

struct ParseResult
{
    std::vector<TestOutcome> outcomes;
    std::vector<ParseNote> notes;

    /// Number of lines that carried the marker, well-formed or not
    std::size_t structured_lines{};

    bool no_structured_output() const noexcept { return structured_lines == 0; }

    int num_passed() const noexcept {
        return gsl::narrow_cast<int>(ranges::count_if(outcomes, &TestOutcome::passed));
    }

    int num_total() const noexcept { return gsl::narrow_cast<int>(outcomes.size()); }

    int num_failed() const noexcept { return num_total() - num_passed(); }
};

/// States of a single submission's pipeline
enum class PipelineStage { Pending, ResolvingTestbench, Sandboxing, Compiling, Running, Parsing, Scored, Failed };

constexpr std::string_view format_as(PipelineStage stage) {
    switch (stage) {
    case PipelineStage::Pending:
        return "Pending";
    case PipelineStage::ResolvingTestbench:
        return "ResolvingTestbench";
    case PipelineStage::Sandboxing:
        return "Sandboxing";
    case PipelineStage::Compiling:
        return "Compiling";
    case PipelineStage::Running:
        return "Running";
    case PipelineStage::Parsing:
        return "Parsing";
    case PipelineStage::Scored:
        return "Scored";
    case PipelineStage::Failed:
        return "Failed";
    }
    return "<unknown>";
}

/// How the grade came to be. Every value is visually distinct in a rendered report.
enum class GradeStatus {
    Graded,        ///< At least one structured line was observed
    NoOutput,      ///< The simulation ran, but emitted no structured lines at all
    TimedOut,      ///< The simulation was killed; score reflects partial output
    CompileFailed, ///< The submission did not compile
    RunFailed,     ///< The simulator exited non-zero with no structured output
    Failed         ///< An infrastructure stage failed (sandbox, spawn, missing testbench, ...)
};

constexpr std::string_view format_as(GradeStatus status) {
    switch (status) {
    case GradeStatus::Graded:
        return "graded";
    case GradeStatus::NoOutput:
        return "no-output";
    case GradeStatus::TimedOut:
        return "timeout";
    case GradeStatus::CompileFailed:
        return "compile-failed";
    case GradeStatus::RunFailed:
        return "run-failed";
    case GradeStatus::Failed:
        return "failed";
    }
    return "<unknown>";
}

/// Terminal artifact of the pipeline; exactly one per submission
struct GradeReport
{
    SubmissionKey key;
    GradeStatus status = GradeStatus::Failed;

    double score{};
    double points_possible{};

    int num_passed{};
    int num_total{};

    std::vector<TestOutcome> outcomes;

    bool timed_out = false;

    /// Only set when the pipeline ended in `Failed`
    std::optional<PipelineStage> failed_stage;
    std::optional<ErrorKind> error;

    /// Human-readable comment; deterministic for identical inputs
    std::string text;

    PipelineStage final_stage() const noexcept { return failed_stage ? PipelineStage::Failed : PipelineStage::Scored; }

    double percentage() const noexcept { return num_total == 0 ? 0.0 : 100.0 * num_passed / num_total; }
};

/// A graded submission, plus what happened when handing it upstream
struct SubmissionResult
{
    GradeReport report;
    bool posted = false;
    int post_attempts{};
};

/// A submission that was never graded (roster failure, global deadline)
struct SubmissionSkip
{
    SubmissionKey key;
    std::string reason;
};

/// An assignment that was skipped as a whole (NotReady, NoTestbench, roster failure)
struct AssignmentSkip
{
    std::string assignment_id;
    ErrorKind reason;
    std::string message;
};

struct RunSummary
{
    std::vector<SubmissionResult> results;
    std::vector<SubmissionSkip> skipped_submissions;
    std::vector<AssignmentSkip> skipped_assignments;

    int num_posted() const noexcept {
        return gsl::narrow_cast<int>(ranges::count_if(results, &SubmissionResult::posted));
    }

    int num_post_failures() const noexcept { return gsl::narrow_cast<int>(results.size()) - num_posted(); }

    int num_failed() const noexcept {
        return gsl::narrow_cast<int>(
            ranges::count_if(results, [](const SubmissionResult& res) { return res.report.failed_stage.has_value(); }));
    }
};

} // namespace hdlgrader
