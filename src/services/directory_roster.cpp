#include "services/directory_roster.hpp"

#include <hdlgrader/common/error_types.hpp>
#include <hdlgrader/grading_session.hpp>
#include <hdlgrader/logging.hpp>
#include <hdlgrader/testbench_resolver.hpp>

#include <fmt/format.h>
#include <range/v3/algorithm/sort.hpp>

#include <filesystem>
#include <fstream>
#include <iterator>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

namespace hdlgrader {

namespace {

std::optional<std::string> read_file(const std::filesystem::path& path) {
    std::ifstream in_file{path, std::ios::binary};

    if (!in_file.is_open()) {
        return std::nullopt;
    }

    std::string contents{std::istreambuf_iterator<char>{in_file}, std::istreambuf_iterator<char>{}};

    if (in_file.bad()) {
        return std::nullopt;
    }

    return contents;
}

} // namespace

DirectoryRoster::DirectoryRoster(std::filesystem::path root, bool regrade)
    : root_{std::move(root)}
    , regrade_{regrade} {}

std::optional<std::filesystem::path> DirectoryRoster::student_dir(const SubmissionKey& key) const {
    if (!is_safe_path_component(key.assignment_id) || !is_safe_path_component(key.student_id)) {
        LOG_ERROR("{} cannot be mapped to a submissions directory", key);
        return std::nullopt;
    }

    return root_ / key.assignment_id / key.student_id;
}

Result<std::vector<std::string>> DirectoryRoster::list_students(std::string_view assignment_id) {
    namespace fs = std::filesystem;

    if (!is_safe_path_component(assignment_id)) {
        LOG_ERROR("Assignment id {:?} cannot be mapped to a submissions directory", assignment_id);
        return ErrorKind::UpstreamServiceError;
    }

    const fs::path assignment_dir = root_ / assignment_id;
    std::error_code err;

    if (!fs::is_directory(assignment_dir, err)) {
        LOG_ERROR("No submissions directory for assignment {} ({})", assignment_id, assignment_dir.string());
        return ErrorKind::UpstreamServiceError;
    }

    std::vector<std::string> students;
    int num_already_graded = 0;

    for (fs::directory_iterator iter{assignment_dir, err}; !err && iter != fs::directory_iterator{};
         iter.increment(err)) {
        std::error_code type_err;
        if (!iter->is_directory(type_err)) {
            continue;
        }

        if (!regrade_ && fs::exists(iter->path() / GRADED_MARKER, type_err)) {
            ++num_already_graded;
            continue;
        }

        students.push_back(iter->path().filename().string());
    }

    if (err) {
        LOG_ERROR("Could not list submissions for assignment {}: {}", assignment_id, err.message());
        return ErrorKind::UpstreamServiceError;
    }

    ranges::sort(students);

    if (num_already_graded > 0) {
        LOG_INFO("Assignment {}: skipping {} already graded submission(s); use --regrade to grade them again",
                 assignment_id, num_already_graded);
    }

    return students;
}

Result<std::vector<SubmissionFile>> DirectoryRoster::list_submission_files(const SubmissionKey& key) {
    namespace fs = std::filesystem;

    auto dir = student_dir(key);
    if (!dir) {
        return ErrorKind::UpstreamServiceError;
    }

    std::vector<fs::path> paths;
    std::error_code err;

    for (fs::directory_iterator iter{dir.value(), err}; !err && iter != fs::directory_iterator{};
         iter.increment(err)) {
        std::error_code type_err;
        if (!iter->is_regular_file(type_err) || iter->path().filename() == GRADED_MARKER) {
            continue;
        }

        paths.push_back(iter->path());
    }

    if (err) {
        LOG_ERROR("{}: could not list submission files: {}", key, err.message());
        return ErrorKind::UpstreamServiceError;
    }

    ranges::sort(paths);

    std::vector<SubmissionFile> files;
    files.reserve(paths.size());

    for (const fs::path& path : paths) {
        auto contents = read_file(path);

        if (!contents) {
            LOG_ERROR("{}: could not read submitted file {}", key, path.filename().string());
            return ErrorKind::UpstreamServiceError;
        }

        files.push_back({.name = path.filename().string(), .contents = std::move(contents.value())});
    }

    return files;
}

Result<void> DirectoryRoster::mark_graded(const SubmissionKey& key) {
    auto dir = student_dir(key);
    if (!dir) {
        return ErrorKind::UpstreamServiceError;
    }

    std::ofstream marker{dir.value() / GRADED_MARKER, std::ios::trunc};

    if (!marker.is_open()) {
        LOG_WARN("{}: could not write {} marker", key, GRADED_MARKER);
        return ErrorKind::UpstreamServiceError;
    }

    return {};
}

} // namespace hdlgrader
