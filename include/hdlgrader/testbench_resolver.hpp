#pragma once

#include <hdlgrader/common/error_types.hpp>
#include <hdlgrader/grading_session.hpp>

#include <filesystem>
#include <string>
#include <string_view>

namespace hdlgrader {

/// Locates the testbench to pair with every submission of an assignment.
///
/// Layout: ``<root>/<assignment-id>/*.<ext>``. When several sources are present, the one whose
/// filename sorts first (case-sensitive, bytewise) is chosen. The directory is never modified,
/// except for being created when it does not exist yet.
class TestbenchResolver
{
public:
    static constexpr std::string_view DEFAULT_ROOT = "testbenches";
    static constexpr std::string_view DEFAULT_EXTENSION = ".v";

    explicit TestbenchResolver(const std::filesystem::path& root, std::string extension = std::string{DEFAULT_EXTENSION});

    /// Errors:
    ///   NotReady    - the directory did not exist (it has now been created) or is still empty
    ///   NoTestbench - the directory holds files, but none is a matching source
    ///   BadArgument - the assignment id cannot be used as a directory name
    ///   SyscallFailure - the directory could not be created or listed
    Result<Testbench> resolve(std::string_view assignment_id) const;

    std::filesystem::path directory_for(std::string_view assignment_id) const;

    const std::string& get_extension() const noexcept { return extension_; }

private:
    std::filesystem::path root_;
    std::string extension_;
};

/// Whether ``path`` ends in ``extension``, ignoring ASCII case (".V" matches ".v")
bool has_source_extension(const std::filesystem::path& path, std::string_view extension);

/// Whether ``id`` is safe to use as a single path component
bool is_safe_path_component(std::string_view id);

} // namespace hdlgrader
