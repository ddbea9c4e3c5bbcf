#pragma once

#include <hdlgrader/common/error_types.hpp>
#include <hdlgrader/grading_session.hpp>

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace hdlgrader {

/// What to do with a sandbox once its submission has been graded
enum class RetentionPolicy {
    Keep,     ///< Leave every sandbox on disk (for inspecting disputed grades)
    Delete,   ///< Remove every sandbox
    OnFailure ///< Keep only sandboxes of submissions that failed a stage or a test
};

constexpr std::string_view format_as(RetentionPolicy policy) {
    switch (policy) {
    case RetentionPolicy::Keep:
        return "keep";
    case RetentionPolicy::Delete:
        return "delete";
    case RetentionPolicy::OnFailure:
        return "on-failure";
    }
    return "<unknown>";
}

/// A populated per-submission working directory
struct Sandbox
{
    SubmissionKey key;

    /// Absolute path of the sandbox directory
    std::filesystem::path root;

    /// Every staged submission file, relative to ``root``, in submission order
    std::vector<std::string> staged_files;

    /// The subset of ``staged_files`` with the source extension, sorted by name
    std::vector<std::string> sources;

    /// Name of the testbench copy, relative to ``root``
    std::string testbench;
};

/// Creates isolated, deterministic working directories keyed by (assignment id, student id).
///
/// Directory names are derived only from the key, so concurrent submissions never share one.
/// A directory left behind by an earlier run is removed before staging (clear-then-populate).
class SandboxManager
{
public:
    static constexpr std::string_view DEFAULT_ROOT = "verilog_build";

    SandboxManager(const std::filesystem::path& root, std::string source_extension,
                   RetentionPolicy retention = RetentionPolicy::Keep);

    /// Stage ``files`` and a copy of ``testbench`` into a fresh sandbox for ``key``
    /// Errors: SandboxError, for any unusable file name or filesystem failure
    Result<Sandbox> create(const SubmissionKey& key, const std::vector<SubmissionFile>& files,
                           const Testbench& testbench) const;

    /// Apply the retention policy. ``clean`` = the submission was scored with every test passing.
    void release(const Sandbox& sandbox, bool clean) const;

    std::filesystem::path path_for(const SubmissionKey& key) const;

    /// "a<assignment>_u<student>", with every byte outside [A-Za-z0-9-] hex-escaped as "_XX"
    static std::string directory_name(const SubmissionKey& key);

    RetentionPolicy get_retention() const noexcept { return retention_; }

private:
    static std::string escape_component(std::string_view raw);

    std::filesystem::path root_;
    std::string source_extension_;
    RetentionPolicy retention_;
};

} // namespace hdlgrader
