#pragma once

#include <hdlgrader/common/error_types.hpp>
#include <hdlgrader/grading_session.hpp>

#include <string>
#include <string_view>
#include <vector>

namespace hdlgrader {

/// Source of students and their submitted files.
///
/// Implementations must be safe to call from several worker threads at once.
/// Every failure is reported as UpstreamServiceError.
class RosterService
{
public:
    virtual ~RosterService() = default;

    /// Students with a submission for ``assignment_id`` that still needs grading
    virtual Result<std::vector<std::string>> list_students(std::string_view assignment_id) = 0;

    virtual Result<std::vector<SubmissionFile>> list_submission_files(const SubmissionKey& key) = 0;

    /// Called after the grade for ``key`` was posted, so that later runs can skip it
    virtual Result<void> mark_graded(const SubmissionKey& /*key*/) { return {}; }
};

/// Destination of finished grades.
///
/// Implementations must be safe to call from several worker threads at once.
class ReportingService
{
public:
    virtual ~ReportingService() = default;

    /// Publish ``report.score`` together with ``report.text`` for ``report.key``.
    /// Errors: UpstreamServiceError; the caller retries.
    virtual Result<void> post_grade(const GradeReport& report) = 0;
};

} // namespace hdlgrader
