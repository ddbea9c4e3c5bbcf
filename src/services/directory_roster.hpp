#pragma once

#include <hdlgrader/common/error_types.hpp>
#include <hdlgrader/grading_session.hpp>
#include <hdlgrader/services/collaborators.hpp>

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace hdlgrader {

/// Roster over a local directory tree: ``<root>/<assignment-id>/<student-id>/<files...>``
///
/// Students are the subdirectories of the assignment directory, sorted by name. A student whose
/// directory holds a `.graded` marker is left out, unless regrading was requested.
class DirectoryRoster : public RosterService
{
public:
    static constexpr std::string_view GRADED_MARKER = ".graded";

    explicit DirectoryRoster(std::filesystem::path root, bool regrade = false);

    Result<std::vector<std::string>> list_students(std::string_view assignment_id) override;

    /// Regular files directly inside the student's directory, sorted by name, read byte-exact
    Result<std::vector<SubmissionFile>> list_submission_files(const SubmissionKey& key) override;

    /// Writes the `.graded` marker
    Result<void> mark_graded(const SubmissionKey& key) override;

private:
    std::optional<std::filesystem::path> student_dir(const SubmissionKey& key) const;

    std::filesystem::path root_;
    bool regrade_;
};

} // namespace hdlgrader
