#include <hdlgrader/testbench_resolver.hpp>

#include <hdlgrader/common/error_types.hpp>
#include <hdlgrader/grading_session.hpp>
#include <hdlgrader/logging.hpp>

#include <fmt/ranges.h>
#include <range/v3/algorithm/any_of.hpp>
#include <range/v3/algorithm/equal.hpp>
#include <range/v3/algorithm/sort.hpp>

#include <cctype>
#include <filesystem>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

namespace hdlgrader {

TestbenchResolver::TestbenchResolver(const std::filesystem::path& root, std::string extension)
    : root_{std::filesystem::absolute(root)}
    , extension_{std::move(extension)} {}

std::filesystem::path TestbenchResolver::directory_for(std::string_view assignment_id) const {
    return root_ / assignment_id;
}

Result<Testbench> TestbenchResolver::resolve(std::string_view assignment_id) const {
    namespace fs = std::filesystem;

    if (!is_safe_path_component(assignment_id)) {
        LOG_ERROR("Assignment id {:?} cannot be used as a testbench directory name", assignment_id);
        return ErrorKind::BadArgument;
    }

    const fs::path tb_dir = directory_for(assignment_id);
    std::error_code err;

    if (!fs::is_directory(tb_dir, err)) {
        // create_directories reports success (false) if a concurrent resolve created it first
        fs::create_directories(tb_dir, err);

        if (err) {
            LOG_ERROR("Could not create testbench directory {} for assignment {}: {}", tb_dir.string(), assignment_id,
                      err.message());
            return ErrorKind::SyscallFailure;
        }

        LOG_INFO("Created testbench directory for assignment {}: {}. Add a testbench (*{}) to it; skipping for now.",
                 assignment_id, tb_dir.string(), extension_);
        return ErrorKind::NotReady;
    }

    std::vector<std::string> candidates;
    bool dir_is_empty = true;

    for (fs::directory_iterator iter{tb_dir, err}; !err && iter != fs::directory_iterator{}; iter.increment(err)) {
        dir_is_empty = false;

        std::error_code type_err;
        if (!iter->is_regular_file(type_err) || !has_source_extension(iter->path(), extension_)) {
            continue;
        }

        candidates.push_back(iter->path().filename().string());
    }

    if (err) {
        LOG_ERROR("Could not list testbench directory {}: {}", tb_dir.string(), err.message());
        return ErrorKind::SyscallFailure;
    }

    // Nothing was added since the directory was created
    if (dir_is_empty) {
        LOG_INFO("Testbench directory {} for assignment {} is still empty. Add a testbench (*{}) to it; skipping "
                 "for now.",
                 tb_dir.string(), assignment_id, extension_);
        return ErrorKind::NotReady;
    }

    if (candidates.empty()) {
        LOG_WARN("No *{} testbench found in {} for assignment {}. Skipping this assignment.", extension_,
                 tb_dir.string(), assignment_id);
        return ErrorKind::NoTestbench;
    }

    // std::string ordering compares bytes, which is exactly the case-sensitive order we want
    ranges::sort(candidates);

    if (candidates.size() > 1) {
        LOG_DEBUG("Multiple testbench candidates for assignment {}: {}", assignment_id, candidates);
    }

    Testbench result{.assignment_id = std::string{assignment_id}, .path = tb_dir / candidates.front()};

    LOG_INFO("Using testbench for assignment {}: {}", assignment_id, result.path.string());

    return result;
}

bool has_source_extension(const std::filesystem::path& path, std::string_view extension) {
    const std::string filename = path.filename().string();

    if (extension.empty() || filename.size() <= extension.size()) {
        return false;
    }

    std::string_view suffix{filename};
    suffix.remove_prefix(filename.size() - extension.size());

    auto to_lower = [](unsigned char chr) { return std::tolower(chr); };

    return ranges::equal(suffix, extension, {}, to_lower, to_lower);
}

bool is_safe_path_component(std::string_view id) {
    if (id.empty() || id == "." || id == "..") {
        return false;
    }

    return !ranges::any_of(id, [](char chr) { return chr == '/' || chr == '\0'; });
}

} // namespace hdlgrader
