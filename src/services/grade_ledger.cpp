#include "services/grade_ledger.hpp"

#include <hdlgrader/common/error_types.hpp>
#include <hdlgrader/grading_session.hpp>
#include <hdlgrader/logging.hpp>
#include <hdlgrader/testbench_resolver.hpp>

#include <fmt/format.h>

#include <filesystem>
#include <fstream>
#include <mutex>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

namespace hdlgrader {

GradeLedger::GradeLedger(std::filesystem::path root)
    : root_{std::move(root)} {}

std::filesystem::path GradeLedger::report_path(const SubmissionKey& key) const {
    return root_ / key.assignment_id / (key.student_id + ".txt");
}

Result<void> GradeLedger::post_grade(const GradeReport& report) {
    namespace fs = std::filesystem;

    const SubmissionKey& key = report.key;

    if (!is_safe_path_component(key.assignment_id) || !is_safe_path_component(key.student_id)) {
        LOG_ERROR("{} cannot be mapped to a report file", key);
        return ErrorKind::UpstreamServiceError;
    }

    const fs::path path = report_path(key);
    std::error_code err;

    fs::create_directories(path.parent_path(), err);
    if (err) {
        LOG_WARN("{}: could not create {}: {}", key, path.parent_path().string(), err.message());
        return ErrorKind::UpstreamServiceError;
    }

    {
        std::ofstream out_file{path, std::ios::binary | std::ios::trunc};
        out_file << report.text;
        out_file.close();

        if (out_file.fail()) {
            LOG_WARN("{}: could not write report to {}", key, path.string());
            return ErrorKind::UpstreamServiceError;
        }
    }

    TRY(append_csv_row(report));

    LOG_DEBUG("{}: recorded {:.2f}/{:.2f} in {}", key, report.score, report.points_possible, root_.string());

    return {};
}

Result<void> GradeLedger::append_csv_row(const GradeReport& report) {
    std::lock_guard lock{csv_mutex_};

    const std::filesystem::path path = csv_path();

    std::error_code err;
    const bool write_header = !std::filesystem::exists(path, err) || std::filesystem::file_size(path, err) == 0;

    std::ofstream out_file{path, std::ios::binary | std::ios::app};

    if (write_header) {
        out_file << CSV_HEADER << '\n';
    }

    out_file << fmt::format("{},{},{:.2f},{:.2f},{}\n", csv_escape(report.key.assignment_id),
                            csv_escape(report.key.student_id), report.score, report.points_possible, report.status);
    out_file.close();

    if (out_file.fail()) {
        LOG_WARN("{}: could not append to {}", report.key, path.string());
        return ErrorKind::UpstreamServiceError;
    }

    return {};
}

std::string csv_escape(std::string_view field) {
    if (field.find_first_of(",\"\r\n") == std::string_view::npos) {
        return std::string{field};
    }

    std::string result = "\"";

    for (char chr : field) {
        if (chr == '"') {
            result += '"';
        }
        result += chr;
    }

    result += '"';

    return result;
}

} // namespace hdlgrader
