#include <hdlgrader/scorer.hpp>

#include <hdlgrader/build_run_executor.hpp>
#include <hdlgrader/common/error_types.hpp>
#include <hdlgrader/grading_session.hpp>
#include <hdlgrader/logging.hpp>
#include <hdlgrader/subprocess/execution_result.hpp>

#include <fmt/format.h>
#include <libassert/assert.hpp>

#include <iterator>
#include <string>
#include <string_view>
#include <utility>

namespace hdlgrader {

namespace {

constexpr std::string_view REPORT_TITLE = "Autograded Verilog assignment.";

std::string describe_exit(const ExecutionResult& run) {
    if (run.term_signal) {
        return fmt::format("was killed by signal {}", *run.term_signal);
    }
    return fmt::format("exited with status {}", run.exit_code.value_or(-1));
}

bool exited_abnormally(const ExecutionResult& run) {
    return run.term_signal.has_value() || run.exit_code.value_or(0) != 0;
}

void append_outcome(std::string& out, const TestOutcome& outcome) {
    auto out_it = std::back_inserter(out);

    fmt::format_to(out_it, "  {}  {}", outcome.status, outcome.name);

    if (outcome.unparseable) {
        fmt::format_to(out_it, "  [unparseable]");
    }

    for (const auto& [key, value] : outcome.details) {
        fmt::format_to(out_it, "  {}={}", key, value);
    }

    if (!outcome.note.empty()) {
        fmt::format_to(out_it, "  ({})", outcome.note);
    }

    out += '\n';
}

void append_block(std::string& out, std::string_view heading, std::string_view body) {
    out += '\n';
    out += heading;
    out += '\n';

    if (body.empty()) {
        out += "(empty)\n";
        return;
    }

    out += body;

    if (!body.ends_with('\n')) {
        out += '\n';
    }
}

} // namespace

Scorer::Scorer(ScoringConfig config)
    : config_{config} {
    ASSERT(config_.points_possible >= 0.0, "points_possible must not be negative");
}

GradeReport Scorer::make_report(const SubmissionKey& key, GradeStatus status) const {
    GradeReport report;
    report.key = key;
    report.status = status;
    report.points_possible = config_.points_possible;
    return report;
}

std::string Scorer::render_header(const GradeReport& report, std::string_view summary) const {
    return fmt::format("{} {} Score: {:.2f}/{:.2f}\n", REPORT_TITLE, summary, report.score, report.points_possible);
}

GradeReport Scorer::score_run(const SubmissionKey& key, const ParseResult& parsed, const ExecutionResult& run) const {
    GradeReport report = make_report(key, GradeStatus::Graded);

    report.outcomes = parsed.outcomes;
    report.num_passed = parsed.num_passed();
    report.num_total = parsed.num_total();
    report.timed_out = run.timed_out;

    if (report.num_total > 0) {
        report.score = config_.points_possible * report.num_passed / report.num_total;
    }

    std::string summary;

    if (run.timed_out) {
        report.status = GradeStatus::TimedOut;
        summary = report.num_total == 0
                      ? std::string{"Simulation timed out before producing any grading output."}
                      : fmt::format("Simulation timed out. Tests passed before the timeout: {}/{} ({:.2f}%).",
                                    report.num_passed, report.num_total, report.percentage());
    } else if (report.num_total == 0 && exited_abnormally(run)) {
        report.status = GradeStatus::RunFailed;
        summary = fmt::format("Simulation {} without producing grading output.", describe_exit(run));
    } else if (report.num_total == 0) {
        report.status = GradeStatus::NoOutput;
        summary = "No grading output detected.";
    } else {
        summary = fmt::format("Tests passed: {}/{} ({:.2f}%).", report.num_passed, report.num_total,
                              report.percentage());
    }

    std::string text = render_header(report, summary);

    if (!report.outcomes.empty()) {
        text += '\n';
        for (const TestOutcome& outcome : report.outcomes) {
            append_outcome(text, outcome);
        }
    }

    if (!parsed.notes.empty()) {
        text += "\nMalformed result lines:\n";
        for (const ParseNote& note : parsed.notes) {
            fmt::format_to(std::back_inserter(text), "  line {}: {}: {}\n", note.line_number, note.reason, note.line);
        }
    }

    switch (report.status) {
    case GradeStatus::RunFailed: {
        const std::string& errors = run.stderr_text.empty() ? run.stdout_text : run.stderr_text;
        append_block(text, "Simulator errors:", truncate_with_marker(errors, config_.max_excerpt_bytes));
        break;
    }
    case GradeStatus::NoOutput:
    case GradeStatus::TimedOut:
        if (report.num_total == 0) {
            append_block(text, "Simulator output (excerpt):",
                         truncate_with_marker(run.stdout_text, config_.max_excerpt_bytes));
        }
        break;
    case GradeStatus::Graded:
        if (exited_abnormally(run)) {
            fmt::format_to(std::back_inserter(text), "\nNote: the simulation {}.\n", describe_exit(run));
        }
        break;
    case GradeStatus::CompileFailed:
    case GradeStatus::Failed:
        UNREACHABLE(report.status);
    }

    if (run.stdout_truncated) {
        text += "\nNote: simulator output exceeded the capture limit and was truncated.\n";
    }

    report.text = std::move(text);

    LOG_DEBUG("{}: {} with {:.2f}/{:.2f}", key, report.status, report.score, report.points_possible);

    return report;
}

GradeReport Scorer::score_compile_failure(const SubmissionKey& key, const CompileFailed& failure) const {
    GradeReport report = make_report(key, GradeStatus::CompileFailed);
    report.timed_out = failure.compile.timed_out;

    std::string text = render_header(report, "Compilation failed.");
    append_block(text, "Compiler output:", failure.diagnostic);

    report.text = std::move(text);

    return report;
}

GradeReport Scorer::score_failure(const SubmissionKey& key, PipelineStage stage, ErrorKind error,
                                  std::string_view detail) const {
    GradeReport report = make_report(key, GradeStatus::Failed);
    report.failed_stage = stage;
    report.error = error;

    std::string text = render_header(report, fmt::format("Grading failed at stage {} ({}).", stage, error));

    if (!detail.empty()) {
        text += '\n';
        text += detail;
        if (!detail.ends_with('\n')) {
            text += '\n';
        }
    }

    report.text = std::move(text);

    return report;
}

} // namespace hdlgrader
