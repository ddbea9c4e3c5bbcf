#include <hdlgrader/sandbox_manager.hpp>

#include <hdlgrader/common/error_types.hpp>
#include <hdlgrader/grading_session.hpp>
#include <hdlgrader/logging.hpp>
#include <hdlgrader/testbench_resolver.hpp>

#include <fmt/format.h>
#include <gsl/util>
#include <range/v3/algorithm/contains.hpp>
#include <range/v3/algorithm/sort.hpp>

#include <cctype>
#include <filesystem>
#include <fstream>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

namespace hdlgrader {

namespace {

/// The name a submitted file is staged under; empty if it cannot be staged safely
std::string staged_name(std::string_view submitted_name) {
    std::string name = std::filesystem::path{submitted_name}.filename().string();

    if (name == "." || name == ".." || name.find('\0') != std::string::npos) {
        return "";
    }

    return name;
}

Expected<void, std::string> write_file(const std::filesystem::path& path, const std::string& contents) {
    std::ofstream out_file{path, std::ios::binary | std::ios::trunc};

    if (!out_file.is_open()) {
        return fmt::format("could not open {} for writing", path.string());
    }

    out_file.write(contents.data(), static_cast<std::streamsize>(contents.size()));
    out_file.close();

    if (out_file.fail()) {
        return fmt::format("IO error writing {}", path.string());
    }

    return {};
}

} // namespace

SandboxManager::SandboxManager(const std::filesystem::path& root, std::string source_extension,
                               RetentionPolicy retention)
    : root_{std::filesystem::absolute(root)}
    , source_extension_{std::move(source_extension)}
    , retention_{retention} {}

std::filesystem::path SandboxManager::path_for(const SubmissionKey& key) const {
    return root_ / directory_name(key);
}

std::string SandboxManager::directory_name(const SubmissionKey& key) {
    return fmt::format("a{}_u{}", escape_component(key.assignment_id), escape_component(key.student_id));
}

std::string SandboxManager::escape_component(std::string_view raw) {
    std::string result;
    result.reserve(raw.size());

    for (char chr : raw) {
        auto byte = static_cast<unsigned char>(chr);

        if (std::isalnum(byte) != 0 || chr == '-') {
            result += chr;
        } else {
            // '_' is escaped too, so the "_u" separator can never appear inside a component
            result += fmt::format("_{:02x}", byte);
        }
    }

    return result;
}

Result<Sandbox> SandboxManager::create(const SubmissionKey& key, const std::vector<SubmissionFile>& files,
                                       const Testbench& testbench) const {
    namespace fs = std::filesystem;

    Sandbox sandbox{.key = key, .root = path_for(key), .staged_files = {}, .sources = {}, .testbench = {}};
    sandbox.testbench = testbench.path.filename().string();

    std::error_code err;

    // Stale files from an earlier attempt must never leak into this one
    fs::remove_all(sandbox.root, err);
    if (err) {
        LOG_ERROR("{}: could not clear stale sandbox {}: {}", key, sandbox.root.string(), err.message());
        return ErrorKind::SandboxError;
    }

    fs::create_directories(sandbox.root, err);
    if (err) {
        LOG_ERROR("{}: could not create sandbox {}: {}", key, sandbox.root.string(), err.message());
        return ErrorKind::SandboxError;
    }

    // A half-staged sandbox is never graded, so it is not kept either
    bool staged = false;
    auto discard_partial = gsl::finally([&] {
        if (staged) {
            return;
        }

        std::error_code remove_err;
        fs::remove_all(sandbox.root, remove_err);
        if (remove_err) {
            LOG_WARN("{}: could not remove partial sandbox {}: {}", key, sandbox.root.string(), remove_err.message());
        }
    });

    for (const SubmissionFile& file : files) {
        std::string name = staged_name(file.name);

        if (name.empty()) {
            LOG_WARN("{}: refusing to stage file with unusable name {:?}", key, file.name);
            return ErrorKind::SandboxError;
        }

        if (name == sandbox.testbench) {
            LOG_WARN("{}: submitted file {:?} would shadow the testbench", key, file.name);
            return ErrorKind::SandboxError;
        }

        if (ranges::contains(sandbox.staged_files, name)) {
            LOG_WARN("{}: submission contains {:?} more than once", key, name);
            return ErrorKind::SandboxError;
        }

        if (auto res = write_file(sandbox.root / name, file.contents); !res) {
            LOG_ERROR("{}: {}", key, res.error());
            return ErrorKind::SandboxError;
        }

        if (has_source_extension(name, source_extension_)) {
            sandbox.sources.push_back(name);
        }

        sandbox.staged_files.push_back(std::move(name));
    }

    fs::copy_file(testbench.path, sandbox.root / sandbox.testbench, fs::copy_options::overwrite_existing, err);
    if (err) {
        LOG_ERROR("{}: could not copy testbench {} into sandbox: {}", key, testbench.path.string(), err.message());
        return ErrorKind::SandboxError;
    }

    ranges::sort(sandbox.sources);
    staged = true;

    LOG_DEBUG("{}: staged {} file(s) ({} source) into {}", key, sandbox.staged_files.size(), sandbox.sources.size(),
              sandbox.root.string());

    return sandbox;
}

void SandboxManager::release(const Sandbox& sandbox, bool clean) const {
    const bool remove = retention_ == RetentionPolicy::Delete || (retention_ == RetentionPolicy::OnFailure && clean);

    if (!remove) {
        LOG_DEBUG("{}: keeping sandbox {}", sandbox.key, sandbox.root.string());
        return;
    }

    std::error_code err;
    std::filesystem::remove_all(sandbox.root, err);

    if (err) {
        LOG_WARN("{}: could not remove sandbox {}: {}", sandbox.key, sandbox.root.string(), err.message());
    }
}

} // namespace hdlgrader
