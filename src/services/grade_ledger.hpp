#pragma once

#include <hdlgrader/common/error_types.hpp>
#include <hdlgrader/grading_session.hpp>
#include <hdlgrader/services/collaborators.hpp>

#include <filesystem>
#include <mutex>
#include <string>
#include <string_view>

namespace hdlgrader {

/// Reporting service that records grades on the local filesystem:
///
///   <root>/grades.csv                        one row per posted grade, appended
///   <root>/<assignment-id>/<student-id>.txt  the full report text, overwritten
class GradeLedger : public ReportingService
{
public:
    static constexpr std::string_view CSV_NAME = "grades.csv";
    static constexpr std::string_view CSV_HEADER = "assignment,student,score,points_possible,status";

    explicit GradeLedger(std::filesystem::path root);

    Result<void> post_grade(const GradeReport& report) override;

    std::filesystem::path csv_path() const { return root_ / CSV_NAME; }

    std::filesystem::path report_path(const SubmissionKey& key) const;

private:
    Result<void> append_csv_row(const GradeReport& report);

    std::filesystem::path root_;

    /// Serializes appends to grades.csv
    std::mutex csv_mutex_;
};

/// Quote ``field`` as per RFC 4180 if it contains a comma, quote or line break
std::string csv_escape(std::string_view field);

} // namespace hdlgrader
