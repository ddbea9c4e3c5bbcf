#pragma once

#include <hdlgrader/build_run_executor.hpp>
#include <hdlgrader/common/error_types.hpp>
#include <hdlgrader/grading_session.hpp>
#include <hdlgrader/subprocess/execution_result.hpp>

#include <cstddef>
#include <string>
#include <string_view>

namespace hdlgrader {

struct ScoringConfig
{
    double points_possible = 100.0;

    /// Bound on raw simulator output quoted in a report
    std::size_t max_excerpt_bytes = 2048;
};

/// Turns executor outcomes and parsed results into a `GradeReport`.
///
/// Report text contains no timestamps, elapsed times or host paths, and numbers are printed
/// with fixed precision, so identical inputs always render identically.
class Scorer
{
public:
    explicit Scorer(ScoringConfig config = {});

    /// The run step completed or timed out; ``parsed`` comes from its stdout
    GradeReport score_run(const SubmissionKey& key, const ParseResult& parsed, const ExecutionResult& run) const;

    GradeReport score_compile_failure(const SubmissionKey& key, const CompileFailed& failure) const;

    /// An infrastructure failure at ``stage``; ``detail`` is shown to the student verbatim
    GradeReport score_failure(const SubmissionKey& key, PipelineStage stage, ErrorKind error,
                              std::string_view detail) const;

    double get_points_possible() const noexcept { return config_.points_possible; }

private:
    GradeReport make_report(const SubmissionKey& key, GradeStatus status) const;

    std::string render_header(const GradeReport& report, std::string_view summary) const;

    ScoringConfig config_;
};

} // namespace hdlgrader
