#include "output/plaintext_serializer.hpp"

#include <hdlgrader/grading_session.hpp>
#include <hdlgrader/logging.hpp>

#include "common/terminal_checks.hpp"
#include "output/serializer.hpp"
#include "output/sink.hpp"
#include "output/verbosity.hpp"
#include "user/program_options.hpp"

#include <fmt/color.h>
#include <fmt/format.h>
#include <gsl/util>

#include <cstddef>
#include <cstdio>
#include <string>
#include <string_view>

#include <sys/ioctl.h>

namespace hdlgrader {

PlainTextSerializer::PlainTextSerializer(Sink& sink, ProgramOptions::ColorizeOpt colorize_option,
                                         VerbosityLevel verbosity)
    : Serializer{sink, verbosity}
    , do_colorize_{process_colorize_opt(colorize_option)}
    , terminal_width_{get_terminal_width()} {}

void PlainTextSerializer::on_assignment_begin(const Testbench& testbench, std::size_t num_submissions) {
    if (!should_output_submission(verbosity_)) {
        return;
    }

    const int count = gsl::narrow_cast<int>(num_submissions);

    std::string out = fmt::format("{}\nAssignment {} ({} {}, testbench {})\n{}\n", LINE_DIVIDER_EM(terminal_width_),
                                  style_str(testbench.assignment_id, VALUE_STYLE), count,
                                  pluralize("submission", count), testbench.path.filename().string(),
                                  LINE_DIVIDER_EM(terminal_width_));

    sink_.write(out);
}

void PlainTextSerializer::on_assignment_skipped(const AssignmentSkip& skip) {
    if (!should_output_assignment_notices(verbosity_)) {
        return;
    }

    std::string out = fmt::format("Skipping assignment {} [{}]: {}\n", style_str(skip.assignment_id, VALUE_STYLE),
                                  skip.reason, skip.message);

    sink_.write(style_str(out, WARNING_STYLE));
}

void PlainTextSerializer::on_submission_skipped(const SubmissionSkip& skip) {
    if (!should_output_submission(verbosity_)) {
        return;
    }

    sink_.write(style_str(fmt::format("  SKIPPED  {}: {}\n", skip.key, skip.reason), WARNING_STYLE));
}

void PlainTextSerializer::on_submission_result(const SubmissionResult& result) {
    if (!should_output_submission(verbosity_)) {
        return;
    }

    const GradeReport& report = result.report;

    std::string score_str = fmt::format("{:6.2f}/{:.2f}", report.score, report.points_possible);
    std::string status_str = fmt::format("{:<14}", fmt::format("{}", report.status));

    std::string out = fmt::format("  {}  {}  {}", style_str(score_str, status_style(report)),
                                  style_str(status_str, status_style(report)), report.key);

    if (report.status != GradeStatus::CompileFailed && !report.failed_stage) {
        out += fmt::format(" ({}/{} {})", report.num_passed, report.num_total, pluralize("test", report.num_total));
    }

    if (report.failed_stage) {
        out += fmt::format(" [failed at {}]", *report.failed_stage);
    }

    if (!result.posted) {
        out += " " + style_str(fmt::format("NOT POSTED after {} {}", result.post_attempts,
                                           pluralize("attempt", result.post_attempts)),
                               ERROR_STYLE);
    }

    out += '\n';

    if (should_output_report_text(verbosity_)) {
        out += fmt::format("{}\n{}{}\n", LINE_DIVIDER(terminal_width_), report.text, LINE_DIVIDER(terminal_width_));
    }

    sink_.write(out);
}

void PlainTextSerializer::on_run_summary(const RunSummary& summary) {
    if (!should_output_run_summary(verbosity_)) {
        return;
    }

    const int num_graded = gsl::narrow_cast<int>(summary.results.size());
    const int num_skipped = gsl::narrow_cast<int>(summary.skipped_submissions.size());
    const int num_skipped_assignments = gsl::narrow_cast<int>(summary.skipped_assignments.size());

    std::string out = fmt::format("{}\nRun summary\n", LINE_DIVIDER_EM(terminal_width_));

    out += fmt::format("  {} {} graded, {} failed to grade\n", num_graded, pluralize("submission", num_graded),
                       summary.num_failed());
    out += fmt::format("  {} posted, {}\n", summary.num_posted(),
                       summary.num_post_failures() == 0
                           ? style_str("0 post failures", SUCCESS_STYLE)
                           : style_str(fmt::format("{} post {}", summary.num_post_failures(),
                                                   pluralize("failure", summary.num_post_failures())),
                                       ERROR_STYLE));

    if (num_skipped > 0) {
        out += style_str(fmt::format("  {} {} skipped\n", num_skipped, pluralize("submission", num_skipped)),
                         WARNING_STYLE);
    }

    if (num_skipped_assignments > 0) {
        out += style_str(fmt::format("  {} {} skipped\n", num_skipped_assignments,
                                     pluralize("assignment", num_skipped_assignments)),
                         WARNING_STYLE);
    }

    sink_.write(out);
}

void PlainTextSerializer::on_warning(std::string_view what) {
    sink_.write(style_str(fmt::format("{}\n", what), WARNING_STYLE));
}

void PlainTextSerializer::on_error(std::string_view what) {
    sink_.write(style_str(fmt::format("{}\n", what), ERROR_STYLE));
}

void PlainTextSerializer::finalize() {
    sink_.flush();
}

fmt::text_style PlainTextSerializer::status_style(const GradeReport& report) {
    if (report.status == GradeStatus::Graded && report.num_passed == report.num_total && report.num_total > 0) {
        return SUCCESS_STYLE;
    }

    if (report.status == GradeStatus::Graded) {
        return WARNING_STYLE;
    }

    return ERROR_STYLE;
}

std::string PlainTextSerializer::style_str(std::string_view str, fmt::text_style style) const {
    if (!do_colorize_) {
        return std::string{str};
    }

    return fmt::format(style, "{}", str);
}

bool PlainTextSerializer::process_colorize_opt(ProgramOptions::ColorizeOpt colorize_option) {
    using enum ProgramOptions::ColorizeOpt;

    if (colorize_option == Never) {
        return false;
    }
    if (colorize_option == Always) {
        return true;
    }

    // Colorize if output is going to a color-supporting terminal, otherwise do not
    LOG_DEBUG("In terminal: {} & Color Supporting Terminal: {}", in_terminal(stdout), is_color_terminal());

    return in_terminal(stdout) && is_color_terminal();
}

std::size_t PlainTextSerializer::get_terminal_width() {
    auto width = terminal_size(stdout).transform([](const winsize& size) { return std::size_t{size.ws_col}; });

    if (width.has_error()) {
        LOG_DEBUG("Could not obtain terminal width because {}. Defaulting to {}", width.error().message(),
                  DEFAULT_WIDTH);
    }

    std::size_t result = width.value_or(DEFAULT_WIDTH);

    return result == 0 ? DEFAULT_WIDTH : result;
}

std::string PlainTextSerializer::pluralize(std::string_view root, int count, std::string_view suffix) {
    if (count == 1) {
        return std::string{root};
    }

    return fmt::format("{}{}", root, suffix);
}

} // namespace hdlgrader
