#pragma once

namespace hdlgrader {

/// How much the run summary prints to stdout. Logging on stderr is configured separately.
/// `Max` is just used as a sentinal
enum class VerbosityLevel {
    Silent,  ///< Nothing; only the exit code reports the outcome
    Quiet,   ///< Skipped assignments and the final totals
    Summary, ///< Additionally, one line per graded or skipped submission
    All,     ///< Additionally, the full report text of every submission
    Max
};

/// See \ref VerbosityLevel
constexpr bool should_output_assignment_notices(VerbosityLevel level) {
    using enum VerbosityLevel;

    return level >= Quiet;
}

/// See \ref VerbosityLevel
constexpr bool should_output_submission(VerbosityLevel level) {
    using enum VerbosityLevel;

    return level >= Summary;
}

/// See \ref VerbosityLevel
constexpr bool should_output_report_text(VerbosityLevel level) {
    using enum VerbosityLevel;

    return level >= All;
}

/// See \ref VerbosityLevel
constexpr bool should_output_run_summary(VerbosityLevel level) {
    using enum VerbosityLevel;

    return level > Silent;
}

} // namespace hdlgrader
