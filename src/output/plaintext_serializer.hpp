#pragma once

#include <hdlgrader/grading_session.hpp>

#include "output/serializer.hpp"
#include "output/sink.hpp"
#include "output/verbosity.hpp"
#include "user/program_options.hpp"

#include <fmt/color.h>
#include <fmt/format.h>

#include <cstddef>
#include <string>
#include <string_view>

namespace hdlgrader {

class PlainTextSerializer : public Serializer
{
public:
    PlainTextSerializer(Sink& sink, ProgramOptions::ColorizeOpt colorize_option, VerbosityLevel verbosity);

    void on_assignment_begin(const Testbench& testbench, std::size_t num_submissions) override;
    void on_assignment_skipped(const AssignmentSkip& skip) override;
    void on_submission_skipped(const SubmissionSkip& skip) override;
    void on_submission_result(const SubmissionResult& result) override;
    void on_run_summary(const RunSummary& summary) override;

    void on_warning(std::string_view what) override;
    void on_error(std::string_view what) override;

    void finalize() override;

private:
    static bool process_colorize_opt(ProgramOptions::ColorizeOpt colorize_option);
    static std::size_t get_terminal_width();

    /// Style for a grade status: green when everything passed, yellow for partial credit, red otherwise
    static fmt::text_style status_style(const GradeReport& report);

    std::string style_str(std::string_view str, fmt::text_style style) const;

    /// Conditionally make a word singular or plural based on `count`
    /// Singular if and only if `count == 1`
    ///
    /// Examples:
    ///  pluralize("submission", 0) => "submissions"
    ///  pluralize("submission", 1) => "submission"
    static std::string pluralize(std::string_view root, int count, std::string_view suffix = "s");

    // Basic styles for different kinds of output:
    //   error    - failed stages, post failures, fatal errors
    //   warning  - skipped work, partial credit
    //   success  - full marks
    //   value    - ids and scores
    static constexpr auto ERROR_STYLE = fmt::fg(fmt::color::red) | fmt::emphasis::bold;
    static constexpr auto WARNING_STYLE = fmt::fg(fmt::color::yellow) | fmt::emphasis::bold;
    static constexpr auto SUCCESS_STYLE = fmt::fg(fmt::color::lime_green);
    static constexpr auto VALUE_STYLE = fmt::fg(fmt::color::aqua);

    static constexpr std::size_t DEFAULT_WIDTH = 80;

    static constexpr auto MAKE_LINE_DIVIDER = [](char chr) {
        return [chr](std::size_t len) { return std::string(len, chr); };
    };

    // Line Divider Emphasized    : "======="...
    // Line Divider               : "--------...
    static const inline auto LINE_DIVIDER = MAKE_LINE_DIVIDER('-');
    static const inline auto LINE_DIVIDER_EM = MAKE_LINE_DIVIDER('=');

    bool do_colorize_;
    std::size_t terminal_width_;
};

} // namespace hdlgrader
